#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "result.hpp"

namespace ytproxy {

namespace asio = boost::asio;

struct YTPROXY_EXPORT ToolCommand {
	std::string executable;
	std::vector<std::string> arguments;
	std::chrono::seconds timeout{15};
};

struct YTPROXY_EXPORT ToolOutput {
	int exit_code = 0;
	bool timed_out = false;
	std::string out;
	std::string err;
};

/// Runs an external program to completion and captures its output.
/// Completes with an error only when the process could not be started; the
/// error is the spawn failure itself (e.g. ENOENT).
class YTPROXY_EXPORT ToolInvoker {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	virtual ~ToolInvoker() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ToolOutput>))
				  CompletionToken>
	auto async_run(ToolCommand command, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<ToolOutput>)>(
			[this, ex, command = std::move(command)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<ToolOutput>)>{
						std::forward<decltype(handler)>(handler)};

				async_run_impl(std::move(command), std::move(any_handler),
							   std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_run_impl(
		ToolCommand command,
		asio::any_completion_handler<void(Result<ToolOutput>)> handler,
		CompletionExecutor handler_ex) = 0;
};

/// ToolInvoker backed by Boost.Process. Output of each stream is capped at
/// kMaxOutputBytes; the process is terminated when the timeout elapses.
class YTPROXY_EXPORT ProcessToolInvoker final : public ToolInvoker {
   public:
	static constexpr std::size_t kMaxOutputBytes = 64 * 1024 * 1024;

	explicit ProcessToolInvoker(asio::any_io_executor ex);

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	/// Resolves a bare program name against PATH. Returns the name unchanged
	/// if it contains a directory separator or cannot be found.
	static std::string find_executable(const std::string &name);

   protected:
	void async_run_impl(
		ToolCommand command,
		asio::any_completion_handler<void(Result<ToolOutput>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	asio::any_io_executor m_ex;
};

}  // namespace ytproxy
