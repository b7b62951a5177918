#include <ytproxy/config.hpp>

#include "server/endpoints.hpp"
#include "server/json_response.hpp"

namespace ytproxy::server {

void register_routes(Router &router,
					 std::shared_ptr<const StreamEndpoint> stream,
					 std::shared_ptr<const ProxyEndpoint> proxy,
					 std::shared_ptr<const VideoInfoEndpoint> video) {
	router.add(http::verb::get, "/",
			   [](const HttpRequest &, Responder &out, asio::yield_context yield) {
				   reply(out,
						 json_response(http::status::ok,
									   {{"name", kServiceName},
										{"version", kServiceVersion},
										{"status", "running"}}),
						 yield);
			   });

	auto health = [](const HttpRequest &, Responder &out,
					 asio::yield_context yield) {
		reply(out, json_response(http::status::ok, {{"status", "ok"}}), yield);
	};
	router.add(http::verb::get, "/health", health);
	router.add(http::verb::get, "/api/health", health);

	router.add(http::verb::get, "/api/youtube/stream/{id}",
			   [stream](const HttpRequest &req, Responder &out,
						asio::yield_context yield) {
				   stream->handle(req, out, yield);
			   });
	router.add(http::verb::get, "/api/youtube/proxy/{id}",
			   [proxy](const HttpRequest &req, Responder &out,
					   asio::yield_context yield) {
				   proxy->handle(req, out, yield);
			   });
	router.add(http::verb::get, "/api/youtube/video/{id}",
			   [video](const HttpRequest &req, Responder &out,
					   asio::yield_context yield) {
				   video->handle(req, out, yield);
			   });
}

}  // namespace ytproxy::server
