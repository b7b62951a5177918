#include <spdlog/spdlog.h>

#include <boost/asio/deferred.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>
#include <optional>
#include <ytproxy/tool_invoker.hpp>

#include "utils.hpp"

namespace bp = boost::process::v2;

namespace ytproxy {

namespace {

// Shared with the timeout handler, which may outlive the coroutine frame.
struct RunState {
	explicit RunState(const asio::any_io_executor &ex)
		: out_pipe(ex), err_pipe(ex), timer(ex) {}

	asio::readable_pipe out_pipe;
	asio::readable_pipe err_pipe;
	asio::steady_timer timer;
	std::optional<bp::process> proc;
	bool timed_out = false;
};

Result<ToolOutput> run_tool(const asio::any_io_executor &ex,
							const ToolCommand &command,
							asio::yield_context yield) {
	auto state = std::make_shared<RunState>(ex);

	try {
		state->proc.emplace(
			ex, command.executable, command.arguments,
			bp::process_stdio{nullptr, state->out_pipe, state->err_pipe});
	} catch (const boost::system::system_error &e) {
		spdlog::debug("Failed to start {}: {}", command.executable, e.what());
		return outcome::failure(std::error_code(e.code()));
	}

	state->timer.expires_after(command.timeout);
	state->timer.async_wait([state](const boost::system::error_code &ec) {
		if (ec) return;
		state->timed_out = true;
		boost::system::error_code term_ec;
		state->proc->terminate(term_ec);
		if (term_ec) {
			spdlog::warn("Failed to terminate timed-out process: {}",
						 term_ec.message());
		}
	});

	ToolOutput output;
	auto reads =
		asio::experimental::make_parallel_group(
			asio::async_read(
				state->out_pipe,
				asio::dynamic_buffer(
					output.out, ProcessToolInvoker::kMaxOutputBytes),
				asio::deferred),
			asio::async_read(
				state->err_pipe,
				asio::dynamic_buffer(
					output.err, ProcessToolInvoker::kMaxOutputBytes),
				asio::deferred))
			.async_wait(asio::experimental::wait_for_all(), yield);

	for (const boost::system::error_code &ec :
		 {std::get<1>(reads), std::get<3>(reads)}) {
		if (ec && ec != asio::error::eof) {
			spdlog::debug("Reading process output: {}", ec.message());
		}
	}

	state->timer.cancel();

	boost::system::error_code wait_ec;
	int exit_code = state->proc->async_wait(yield[wait_ec]);
	if (wait_ec) {
		spdlog::debug("Waiting for process exit: {}", wait_ec.message());
		exit_code = -1;
	}

	output.exit_code = exit_code;
	output.timed_out = state->timed_out;
	return output;
}

}  // namespace

ProcessToolInvoker::ProcessToolInvoker(asio::any_io_executor ex)
	: m_ex(std::move(ex)) {}

asio::any_io_executor ProcessToolInvoker::get_executor() const { return m_ex; }

std::string ProcessToolInvoker::find_executable(const std::string &name) {
	if (name.find('/') != std::string::npos ||
		name.find('\\') != std::string::npos) {
		return name;
	}
	auto found = bp::environment::find_executable(name);
	if (found.empty()) return name;
	return found.string();
}

void ProcessToolInvoker::async_run_impl(
	ToolCommand command,
	asio::any_completion_handler<void(Result<ToolOutput>)> handler,
	CompletionExecutor handler_ex) {
	asio::any_io_executor strand = asio::make_strand(m_ex);
	asio::spawn(
		strand,
		[strand, command = std::move(command), handler = std::move(handler),
		 handler_ex = std::move(handler_ex)](asio::yield_context yield) mutable {
			auto res = run_tool(strand, command, yield);
			asio::dispatch(handler_ex, [h = std::move(handler),
										res = std::move(res)]() mutable {
				h(std::move(res));
			});
		},
		utils::log_coroutine_exit);
}

}  // namespace ytproxy
