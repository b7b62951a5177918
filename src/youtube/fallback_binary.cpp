#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/scope_exit.hpp>
#include <mutex>
#include <vector>
#include <ytproxy/fallback_binary.hpp>

namespace fs = std::filesystem;

namespace ytproxy::youtube {

std::optional<std::string> platform_asset_name() {
#if defined(_WIN32)
	return "yt-dlp.exe";
#elif defined(__APPLE__)
	return "yt-dlp_macos";
#elif defined(__linux__) && (defined(__aarch64__) || defined(_M_ARM64))
	return "yt-dlp_linux_aarch64";
#elif defined(__linux__)
	return "yt-dlp_linux";
#else
	return std::nullopt;
#endif
}

std::string fallback_download_url(std::string_view base_url,
								  std::string_view asset) {
	while (!base_url.empty() && base_url.back() == '/') {
		base_url.remove_suffix(1);
	}
	std::string url(base_url);
	url += '/';
	url += asset;
	return url;
}

struct FallbackInstaller::Impl : std::enable_shared_from_this<Impl> {
	struct Waiter {
		asio::any_completion_handler<void(Result<std::string>)> handler;
		CompletionExecutor ex;
	};

	std::shared_ptr<net::HttpFetcher> http;
	FallbackOptions options;

	std::mutex mutex;
	bool in_flight = false;
	std::vector<Waiter> waiters;

	Impl(std::shared_ptr<net::HttpFetcher> h, FallbackOptions o)
		: http(std::move(h)), options(std::move(o)) {}

	[[nodiscard]] std::optional<fs::path> target() const {
		if (!options.asset_name) return std::nullopt;
		return options.cache_dir / *options.asset_name;
	}

	void ensure(asio::any_completion_handler<void(Result<std::string>)> handler,
				CompletionExecutor handler_ex) {
		if (!options.asset_name) {
			spdlog::error("No fallback extraction binary for this platform");
			asio::dispatch(handler_ex, [h = std::move(handler)]() mutable {
				h(outcome::failure(errc::unsupported_platform));
			});
			return;
		}

		{
			std::lock_guard lock(mutex);
			waiters.push_back({std::move(handler), std::move(handler_ex)});
			if (in_flight) {
				spdlog::debug("Joining in-flight fallback acquisition");
				return;
			}
			in_flight = true;
		}
		start();
	}

	void start() {
		const fs::path path = *target();

		std::error_code ec;
		if (fs::exists(path, ec)) {
			spdlog::debug("Reusing fallback binary at {}", path.string());
			return finish(path.string());
		}

		fs::create_directories(options.cache_dir, ec);
		if (ec) {
			spdlog::error("Cannot create {}: {}", options.cache_dir.string(),
						  ec.message());
			return finish(outcome::failure(errc::download_failed));
		}

		std::string url =
			fallback_download_url(options.download_base_url, *options.asset_name);
		fs::path part = path;
		part += ".part";

		const net::Route first =
			options.proxy_configured ? net::Route::proxied : net::Route::direct;
		spdlog::info("Downloading fallback extraction binary from {}", url);

		http->async_download_file(
			url, part.string(), first,
			[self = shared_from_this(), url, part, path,
			 first](Result<void> res) {
				if (!res && first == net::Route::proxied) {
					spdlog::warn(
						"Proxied download failed ({}), retrying direct",
						res.error().message());
					self->http->async_download_file(
						url, part.string(), net::Route::direct,
						[self, part, path](Result<void> direct_res) {
							self->install(direct_res, part, path);
						});
					return;
				}
				self->install(res, part, path);
			});
	}

	void install(const Result<void> &res, const fs::path &part,
				 const fs::path &path) {
		bool installed = false;
		BOOST_SCOPE_EXIT_ALL(&installed, &part) {
			if (!installed) {
				std::error_code rm_ec;
				fs::remove(part, rm_ec);
			}
		};

		if (!res) {
			spdlog::error("Failed to download fallback extraction binary: {}",
						  res.error().message());
			return finish(outcome::failure(errc::download_failed));
		}

		std::error_code ec;
		fs::permissions(part,
						fs::perms::owner_all | fs::perms::group_read |
							fs::perms::group_exec | fs::perms::others_read |
							fs::perms::others_exec,
						fs::perm_options::replace, ec);
		if (!ec) fs::rename(part, path, ec);
		if (ec) {
			spdlog::error("Failed to install fallback binary at {}: {}",
						  path.string(), ec.message());
			return finish(outcome::failure(errc::download_failed));
		}

		installed = true;
		spdlog::info("Installed fallback extraction binary at {}", path.string());
		finish(path.string());
	}

	void finish(const Result<std::string> &res) {
		std::vector<Waiter> done;
		{
			std::lock_guard lock(mutex);
			done.swap(waiters);
			in_flight = false;
		}
		for (auto &w : done) {
			asio::dispatch(w.ex, [h = std::move(w.handler), res]() mutable {
				h(res);
			});
		}
	}
};

FallbackInstaller::FallbackInstaller(std::shared_ptr<net::HttpFetcher> http,
									 FallbackOptions options)
	: m_impl(std::make_shared<Impl>(std::move(http), std::move(options))) {}

FallbackInstaller::~FallbackInstaller() = default;

asio::any_io_executor FallbackInstaller::get_executor() const {
	return m_impl->http->get_executor();
}

std::optional<std::filesystem::path> FallbackInstaller::binary_path() const {
	return m_impl->target();
}

void FallbackInstaller::async_ensure_impl(
	asio::any_completion_handler<void(Result<std::string>)> handler,
	CompletionExecutor handler_ex) {
	m_impl->ensure(std::move(handler), std::move(handler_ex));
}

}  // namespace ytproxy::youtube
