#include "server/json_response.hpp"

#include <spdlog/spdlog.h>

namespace ytproxy::server {

http::response<http::string_body> json_response(http::status status,
												const nlohmann::json &body) {
	http::response<http::string_body> res{status, 11};
	res.set(http::field::content_type, "application/json");
	res.body() = body.dump();
	res.prepare_payload();
	return res;
}

http::response<http::string_body> json_error(http::status status,
											 std::string_view message) {
	return json_response(status, {{"error", message}});
}

http::response<http::string_body> json_error(http::status status,
											 std::string_view message,
											 std::string_view code) {
	return json_response(status, {{"error", message}, {"code", code}});
}

void reply(Responder &out, http::response<http::string_body> res,
		   asio::yield_context yield) {
	if (auto sent = out.send(std::move(res), yield); !sent) {
		spdlog::debug("Failed to write response: {}", sent.error().message());
	}
}

}  // namespace ytproxy::server
