#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <ytproxy/result.hpp>
#include <ytproxy/types.hpp>

namespace ytproxy {
class ToolInvoker;
}  // namespace ytproxy

namespace ytproxy::youtube {

namespace asio = boost::asio;

class FallbackInstaller;

/// Anything that can turn a video id into format metadata.
class YTPROXY_EXPORT ExtractionSource {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	virtual ~ExtractionSource() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ExtractionResult>))
				  CompletionToken>
	auto async_extract(std::string video_id, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<ExtractionResult>)>(
			[this, ex, video_id = std::move(video_id)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<ExtractionResult>)>{
						std::forward<decltype(handler)>(handler)};

				async_extract_impl(std::move(video_id), std::move(any_handler),
								   std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_extract_impl(
		std::string video_id,
		asio::any_completion_handler<void(Result<ExtractionResult>)> handler,
		CompletionExecutor handler_ex) = 0;
};

struct YTPROXY_EXPORT ExtractionOptions {
	std::string primary_binary = "yt-dlp";
	std::chrono::seconds timeout{15};
	int max_retries = 2;  // Extra attempts after a transient failure
	std::optional<std::string> proxy_url;
	std::optional<std::string> cookies_path;
};

/// Builds the tool argument list for one video.
YTPROXY_EXPORT std::vector<std::string> build_tool_arguments(
	const ExtractionOptions &options, const std::string &video_id);

/// Runs the extraction tool. When the primary binary cannot run in this
/// environment the runner installs the alternate binary through the
/// FallbackInstaller and uses it for the rest of the process lifetime.
class YTPROXY_EXPORT ExtractionRunner final : public ExtractionSource {
   public:
	ExtractionRunner(const ExtractionRunner &) = delete;
	ExtractionRunner &operator=(const ExtractionRunner &) = delete;
	~ExtractionRunner() override;

	ExtractionRunner(asio::any_io_executor ex,
					 std::shared_ptr<ToolInvoker> invoker,
					 std::shared_ptr<FallbackInstaller> fallback,
					 ExtractionOptions options);

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	[[nodiscard]] bool using_fallback_binary() const;
	[[nodiscard]] std::string active_binary() const;

	struct Impl;

   protected:
	void async_extract_impl(
		std::string video_id,
		asio::any_completion_handler<void(Result<ExtractionResult>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	std::shared_ptr<Impl> m_impl;
};

}  // namespace ytproxy::youtube
