#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <ytproxy/result.hpp>

namespace ytproxy::server {

namespace http = boost::beast::http;

/// An inbound request with its target already split into a decoded path and
/// decoded query parameters.
class HttpRequest {
   public:
	using Message = http::request<http::string_body>;

	/// Fails with errc::invalid_url if the target is not origin-form.
	static Result<HttpRequest> parse(Message message);

	[[nodiscard]] http::verb method() const { return m_message.method(); }
	[[nodiscard]] const std::string &path() const { return m_path; }
	[[nodiscard]] const Message &message() const { return m_message; }

	/// First value of query parameter `key`. A key without `=` yields "".
	[[nodiscard]] std::optional<std::string> query(std::string_view key) const;

	[[nodiscard]] std::optional<std::string> header(http::field name) const;
	[[nodiscard]] std::optional<std::string> header(std::string_view name) const;

	/// Value captured by a `{name}` route segment, or "".
	[[nodiscard]] std::string path_param(std::string_view name) const;
	void set_path_params(std::map<std::string, std::string, std::less<>> params);

   private:
	HttpRequest() = default;

	Message m_message;
	std::string m_path;
	std::vector<std::pair<std::string, std::string>> m_query;
	std::map<std::string, std::string, std::less<>> m_path_params;
};

}  // namespace ytproxy::server
