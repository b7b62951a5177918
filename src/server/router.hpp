#pragma once

#include <boost/asio/spawn.hpp>
#include <functional>
#include <string>
#include <vector>

#include "server/http_request.hpp"
#include "server/responder.hpp"

namespace ytproxy::server {

using Handler =
	std::function<void(const HttpRequest &, Responder &, asio::yield_context)>;

/// Maps (method, path pattern) to handlers. Patterns are literal segments
/// and `{name}` captures, e.g. "/api/youtube/stream/{id}".
///
/// Every response leaving through the router carries CORS headers. OPTIONS
/// is answered with 204 on any path. A handler that throws, or returns
/// without responding, produces a 500.
class Router {
   public:
	void add(http::verb method, std::string pattern, Handler handler);

	void dispatch(HttpRequest request, Responder &responder,
				  asio::yield_context yield) const;

   private:
	struct Route {
		http::verb method;
		std::vector<std::string> segments;
		Handler handler;
	};

	std::vector<Route> m_routes;
};

/// Adds the CORS headers the router puts on every response.
void apply_cors(http::fields &fields);

}  // namespace ytproxy::server
