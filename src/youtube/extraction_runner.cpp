#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <mutex>
#include <ytproxy/extractor.hpp>
#include <ytproxy/fallback_binary.hpp>
#include <ytproxy/tool_invoker.hpp>

#include "utils.hpp"
#include "youtube/output_classifier.hpp"
#include "youtube/ytdlp_json.hpp"

namespace ytproxy::youtube {

std::vector<std::string> build_tool_arguments(const ExtractionOptions &options,
											  const std::string &video_id) {
	std::vector<std::string> args = {
		"--dump-single-json",
		"--no-check-certificates",
		"--no-warnings",
		"--prefer-free-formats",
		"--socket-timeout",
		std::to_string(options.timeout.count()),
		"--retries",
		"2",
	};
	if (options.proxy_url) {
		args.emplace_back("--proxy");
		args.push_back(*options.proxy_url);
	}
	if (options.cookies_path) {
		args.emplace_back("--cookies");
		args.push_back(*options.cookies_path);
	}
	args.push_back("https://www.youtube.com/watch?v=" + video_id);
	return args;
}

struct ExtractionRunner::Impl {
	asio::any_io_executor ex;
	std::shared_ptr<ToolInvoker> invoker;
	std::shared_ptr<FallbackInstaller> fallback;
	ExtractionOptions options;

	// fallback_binary is written once, before fallback_enabled is released
	std::atomic<bool> fallback_enabled{false};
	std::mutex flip_mutex;
	std::string fallback_binary;

	Impl(asio::any_io_executor e, std::shared_ptr<ToolInvoker> inv,
		 std::shared_ptr<FallbackInstaller> fb, ExtractionOptions opts)
		: ex(std::move(e)),
		  invoker(std::move(inv)),
		  fallback(std::move(fb)),
		  options(std::move(opts)) {}

	[[nodiscard]] bool on_fallback() const {
		return fallback_enabled.load(std::memory_order_acquire);
	}

	[[nodiscard]] std::string current_binary() const {
		return on_fallback() ? fallback_binary : options.primary_binary;
	}

	void enable_fallback(const std::string &path) {
		std::lock_guard lock(flip_mutex);
		if (fallback_enabled.load(std::memory_order_relaxed)) return;
		fallback_binary = path;
		fallback_enabled.store(true, std::memory_order_release);
		spdlog::info("Extraction switched to fallback binary {}", path);
	}

	Result<ExtractionResult> run_once(const std::string &binary,
									  const std::string &video_id,
									  FailureKind &kind,
									  asio::yield_context yield) {
		kind = FailureKind::other;

		ToolCommand cmd{
			binary, build_tool_arguments(options, video_id), options.timeout};
		auto started = invoker->async_run(std::move(cmd), yield);
		if (!started) {
			kind = classify_spawn_error(started.error());
			spdlog::warn("Could not start {}: {}", binary,
						 started.error().message());
			return outcome::failure(to_errc(kind));
		}

		const ToolOutput &out = started.value();
		if (out.timed_out) {
			spdlog::warn("Extraction of {} timed out after {}s", video_id,
						 options.timeout.count());
			return outcome::failure(errc::timeout);
		}

		if (out.exit_code != 0) {
			std::string text = out.err;
			if (!out.out.empty()) {
				text += '\n';
				text += out.out;
			}
			kind = classify_tool_output(text);
			spdlog::warn("Extraction of {} failed ({}, exit {}): {}", video_id,
						 to_string(kind), out.exit_code,
						 extract_error_message(text));
			return outcome::failure(to_errc(kind));
		}

		return parse_extraction_json(out.out);
	}

	Result<ExtractionResult> extract(const std::string &video_id,
									 asio::yield_context yield) {
		bool using_fallback = on_fallback();
		std::string binary = current_binary();
		int retries = 0;
		bool fallback_attempted = false;

		for (;;) {
			FailureKind kind = FailureKind::other;
			auto res = run_once(binary, video_id, kind, yield);
			if (res) {
				spdlog::debug("Extracted {} with {}", video_id, binary);
				return res;
			}

			if (kind == FailureKind::transient && retries < options.max_retries) {
				++retries;
				spdlog::info("Retrying extraction of {} ({}/{})", video_id,
							 retries, options.max_retries);
				continue;
			}

			if (kind != FailureKind::environment || using_fallback ||
				fallback_attempted || !fallback) {
				return res;
			}
			fallback_attempted = true;

			if (!on_fallback()) {
				spdlog::warn("{} cannot run in this environment, acquiring "
							 "fallback binary",
							 binary);
				auto installed = fallback->async_ensure(yield);
				if (!installed) return outcome::failure(installed.error());
				enable_fallback(installed.value());
			}

			using_fallback = true;
			binary = current_binary();
		}
	}
};

ExtractionRunner::ExtractionRunner(asio::any_io_executor ex,
								   std::shared_ptr<ToolInvoker> invoker,
								   std::shared_ptr<FallbackInstaller> fallback,
								   ExtractionOptions options)
	: m_impl(std::make_shared<Impl>(std::move(ex), std::move(invoker),
									std::move(fallback), std::move(options))) {}

ExtractionRunner::~ExtractionRunner() = default;

asio::any_io_executor ExtractionRunner::get_executor() const {
	return m_impl->ex;
}

bool ExtractionRunner::using_fallback_binary() const {
	return m_impl->on_fallback();
}

std::string ExtractionRunner::active_binary() const {
	return m_impl->current_binary();
}

void ExtractionRunner::async_extract_impl(
	std::string video_id,
	asio::any_completion_handler<void(Result<ExtractionResult>)> handler,
	CompletionExecutor handler_ex) {
	asio::spawn(
		asio::make_strand(m_impl->ex),
		[impl = m_impl, video_id = std::move(video_id),
		 handler = std::move(handler),
		 handler_ex = std::move(handler_ex)](asio::yield_context yield) mutable {
			Result<ExtractionResult> res = outcome::failure(errc::extraction_failed);
			try {
				res = impl->extract(video_id, yield);
			} catch (const std::exception &e) {
				spdlog::error("Extraction of {} threw: {}", video_id, e.what());
			}
			asio::dispatch(handler_ex, [h = std::move(handler),
										res = std::move(res)]() mutable {
				h(std::move(res));
			});
		},
		utils::log_coroutine_exit);
}

}  // namespace ytproxy::youtube
