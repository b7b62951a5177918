#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "result.hpp"

namespace ytproxy::net {

namespace asio = boost::asio;
namespace http = boost::beast::http;

/// Which network path an upstream request takes.
enum class Route : std::uint8_t {
	proxied,  // Through the configured outbound proxy (direct if none)
	direct
};

struct YTPROXY_EXPORT ProxySettings {
	std::optional<std::string> url;

	/// Reads https_proxy, HTTPS_PROXY, http_proxy, HTTP_PROXY in that order.
	static ProxySettings from_environment();

	[[nodiscard]] bool enabled() const { return url.has_value(); }
};

struct YTPROXY_EXPORT HttpTimeouts {
	// Each connect, handshake, write or read
	std::chrono::steady_clock::duration io = std::chrono::seconds(30);
	// Resolve through response header, redirects included
	std::chrono::steady_clock::duration open = std::chrono::seconds(60);
	// A whole async_download_file, open included
	std::chrono::steady_clock::duration download = std::chrono::seconds(60);
};

struct YTPROXY_EXPORT UpstreamRequest {
	std::string url;
	http::fields headers;
	Route route = Route::proxied;
};

/// An upstream response whose headers have been received and whose body is
/// read incrementally.
class YTPROXY_EXPORT ResponseStream {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	virtual ~ResponseStream() = default;

	[[nodiscard]] virtual unsigned status() const = 0;
	[[nodiscard]] virtual const http::fields &headers() const = 0;

	/// Aborts any pending read and closes the connection.
	virtual void cancel() = 0;

	/// Reads body bytes into `buffer`. Completes with 0 at end of body.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::size_t>))
				  CompletionToken>
	auto async_read_some(asio::mutable_buffer buffer,
						 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::size_t>)>(
			[this, ex, buffer](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<std::size_t>)>{
						std::forward<decltype(handler)>(handler)};

				async_read_some_impl(
					buffer, std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

   protected:
	virtual void async_read_some_impl(
		asio::mutable_buffer buffer,
		asio::any_completion_handler<void(Result<std::size_t>)> handler,
		CompletionExecutor handler_ex) = 0;
};

using ResponseStreamPtr = std::unique_ptr<ResponseStream>;

/// Upstream HTTP access used by the proxy relay and the fallback installer.
class YTPROXY_EXPORT HttpFetcher {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	virtual ~HttpFetcher() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	/// Sends a GET and completes once the final (post-redirect) response
	/// headers are in. Any status code is a success at this level.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResponseStreamPtr>))
				  CompletionToken>
	auto async_open(UpstreamRequest request, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<ResponseStreamPtr>)>(
			[this, ex, request = std::move(request)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(
						Result<ResponseStreamPtr>)>{
						std::forward<decltype(handler)>(handler)};

				async_open_impl(std::move(request), std::move(any_handler),
								std::move(handler_ex));
			},
			token);
	}

	/// Downloads `url` into `output_path`. Fails on any non-200 final status.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<void>))
				  CompletionToken>
	auto async_download_file(std::string url, std::string output_path,
							 Route route, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<void>)>(
			[this, ex, url = std::move(url),
			 output_path = std::move(output_path),
			 route](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<void>)>{
						std::forward<decltype(handler)>(handler)};

				async_download_file_impl(std::move(url), std::move(output_path),
										 route, std::move(any_handler),
										 std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_open_impl(
		UpstreamRequest request,
		asio::any_completion_handler<void(Result<ResponseStreamPtr>)> handler,
		CompletionExecutor handler_ex) = 0;

	virtual void async_download_file_impl(
		std::string url, std::string output_path, Route route,
		asio::any_completion_handler<void(Result<void>)> handler,
		CompletionExecutor handler_ex) = 0;
};

class YTPROXY_EXPORT HttpClient final : public HttpFetcher {
   public:
	static constexpr int kMaxRedirects = 5;

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	~HttpClient() override;

	HttpClient(asio::any_io_executor ex, ProxySettings proxy,
			   HttpTimeouts timeouts = {});

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	struct Impl;

   protected:
	void async_open_impl(
		UpstreamRequest request,
		asio::any_completion_handler<void(Result<ResponseStreamPtr>)> handler,
		CompletionExecutor handler_ex) override;

	void async_download_file_impl(
		std::string url, std::string output_path, Route route,
		asio::any_completion_handler<void(Result<void>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	std::shared_ptr<Impl> m_impl;
};

}  // namespace ytproxy::net
