#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "http_client.hpp"
#include "result.hpp"

namespace ytproxy::youtube {

namespace asio = boost::asio;

inline constexpr const char *kDefaultDownloadBaseUrl =
	"https://github.com/yt-dlp/yt-dlp/releases/latest/download";

/// Release asset name of the self-contained tool build for this platform,
/// or std::nullopt if none is published.
YTPROXY_EXPORT std::optional<std::string> platform_asset_name();

/// `base_url` with trailing slashes removed, joined with `asset`.
YTPROXY_EXPORT std::string fallback_download_url(std::string_view base_url,
												 std::string_view asset);

struct YTPROXY_EXPORT FallbackOptions {
	std::string download_base_url = kDefaultDownloadBaseUrl;
	std::filesystem::path cache_dir;
	std::optional<std::string> asset_name;	// nullopt: unsupported platform
	bool proxy_configured = false;
};

/// Downloads and installs the alternate tool binary. Concurrent callers
/// share one acquisition and all observe its outcome; a failed acquisition
/// is forgotten so a later call starts afresh.
class YTPROXY_EXPORT FallbackInstaller {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	FallbackInstaller(const FallbackInstaller &) = delete;
	FallbackInstaller &operator=(const FallbackInstaller &) = delete;
	~FallbackInstaller();

	FallbackInstaller(std::shared_ptr<net::HttpFetcher> http,
					  FallbackOptions options);

	[[nodiscard]] asio::any_io_executor get_executor() const;

	/// Where the binary lives once installed.
	[[nodiscard]] std::optional<std::filesystem::path> binary_path() const;

	/// Completes with the installed binary's path.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::string>))
				  CompletionToken>
	auto async_ensure(CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<std::string>)>(
			[this, ex](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<std::string>)>{
						std::forward<decltype(handler)>(handler)};

				async_ensure_impl(std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

   private:
	struct Impl;

	void async_ensure_impl(
		asio::any_completion_handler<void(Result<std::string>)> handler,
		CompletionExecutor handler_ex);

	std::shared_ptr<Impl> m_impl;
};

}  // namespace ytproxy::youtube
