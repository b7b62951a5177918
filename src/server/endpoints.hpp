#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <ytproxy/access_guard.hpp>
#include <ytproxy/http_client.hpp>
#include <ytproxy/stream_service.hpp>
#include <ytproxy/token_codec.hpp>
#include <ytproxy/types.hpp>

#include "server/http_request.hpp"
#include "server/responder.hpp"
#include "server/router.hpp"

namespace ytproxy::server {

/// `[A-Za-z0-9_-]{1,64}`
bool is_valid_video_id(std::string_view id);

/// Client-facing response for a failed resolution. Tool diagnostics are
/// never included.
http::response<http::string_body> resolution_error_response(
	const std::error_code &ec, bool cookies_configured);

struct StreamEndpointOptions {
	std::chrono::seconds token_ttl{21600};
	unsigned short port = 3000;	 // For the Host fallback
	bool cookies_configured = false;
};

/// GET /api/youtube/stream/{id}?type=video|audio|both
///
/// Resolves the video and answers with metadata plus one proxy URL per
/// requested kind. With a codec, each URL carries its own exp and sig.
class StreamEndpoint {
   public:
	StreamEndpoint(std::shared_ptr<StreamService> service,
				   std::shared_ptr<const auth::TokenCodec> codec,
				   std::shared_ptr<const auth::AccessGuard> guard,
				   StreamEndpointOptions options, Clock clock = system_clock());

	void handle(const HttpRequest &req, Responder &out,
				asio::yield_context yield) const;

	/// Absolute proxy URL for one kind, signed when a codec is configured.
	[[nodiscard]] std::string proxy_url(const HttpRequest &req,
										std::string_view video_id,
										MediaKind kind) const;

   private:
	std::shared_ptr<StreamService> m_service;
	std::shared_ptr<const auth::TokenCodec> m_codec;
	std::shared_ptr<const auth::AccessGuard> m_guard;
	StreamEndpointOptions m_options;
	Clock m_clock;
};

/// GET /api/youtube/proxy/{id}?type=video|audio&exp=..&sig=..
///
/// Checks the capability token (skipped without a codec), resolves the
/// stream and relays the upstream body, Range requests included.
class ProxyEndpoint {
   public:
	static constexpr std::size_t kRelayBufferSize = 64 * 1024;
	static constexpr const char *kUserAgent =
		"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";

	ProxyEndpoint(std::shared_ptr<StreamService> service,
				  std::shared_ptr<net::HttpFetcher> http,
				  std::shared_ptr<const auth::TokenCodec> codec,
				  Clock clock = system_clock());

	void handle(const HttpRequest &req, Responder &out,
				asio::yield_context yield) const;

   private:
	void relay(net::ResponseStream &upstream, MediaKind kind, Responder &out,
			   asio::yield_context yield) const;

	std::shared_ptr<StreamService> m_service;
	std::shared_ptr<net::HttpFetcher> m_http;
	std::shared_ptr<const auth::TokenCodec> m_codec;
	Clock m_clock;
};

/// GET /api/youtube/video/{id}
class VideoInfoEndpoint {
   public:
	explicit VideoInfoEndpoint(std::shared_ptr<StreamService> service);

	void handle(const HttpRequest &req, Responder &out,
				asio::yield_context yield) const;

   private:
	std::shared_ptr<StreamService> m_service;
};

/// Registers the service routes, status routes included.
void register_routes(Router &router,
					 std::shared_ptr<const StreamEndpoint> stream,
					 std::shared_ptr<const ProxyEndpoint> proxy,
					 std::shared_ptr<const VideoInfoEndpoint> video);

}  // namespace ytproxy::server
