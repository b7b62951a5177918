#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

#include "server/responder.hpp"

namespace ytproxy::server {

namespace http = boost::beast::http;

http::response<http::string_body> json_response(http::status status,
												const nlohmann::json &body);

/// `{"error": message}`
http::response<http::string_body> json_error(http::status status,
											 std::string_view message);

/// `{"error": message, "code": code}`
http::response<http::string_body> json_error(http::status status,
											 std::string_view message,
											 std::string_view code);

/// Sends `res`; a failed write is logged, the connection is then unusable.
void reply(Responder &out, http::response<http::string_body> res,
		   asio::yield_context yield);

}  // namespace ytproxy::server
