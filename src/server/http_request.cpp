#include "server/http_request.hpp"

#include <boost/url/parse.hpp>

namespace ytproxy::server {

namespace {

template <typename Fields, typename Key>
std::optional<std::string> find_header(const Fields &fields, const Key &key) {
	auto it = fields.find(key);
	if (it == fields.end()) return std::nullopt;
	auto value = it->value();
	return std::string(value.data(), value.size());
}

}  // namespace

Result<HttpRequest> HttpRequest::parse(Message message) {
	auto target = message.target();
	auto parsed = boost::urls::parse_origin_form(
		boost::core::string_view(target.data(), target.size()));
	if (!parsed) return outcome::failure(errc::invalid_url);

	HttpRequest req;
	req.m_path = parsed->path();
	for (auto param : parsed->params()) {
		req.m_query.emplace_back(std::move(param.key), std::move(param.value));
	}
	req.m_message = std::move(message);
	return req;
}

std::optional<std::string> HttpRequest::query(std::string_view key) const {
	for (const auto &[k, v] : m_query) {
		if (k == key) return v;
	}
	return std::nullopt;
}

std::optional<std::string> HttpRequest::header(http::field name) const {
	return find_header(m_message, name);
}

std::optional<std::string> HttpRequest::header(std::string_view name) const {
	return find_header(m_message,
					   boost::core::string_view(name.data(), name.size()));
}

std::string HttpRequest::path_param(std::string_view name) const {
	auto it = m_path_params.find(name);
	return it == m_path_params.end() ? std::string{} : it->second;
}

void HttpRequest::set_path_params(
	std::map<std::string, std::string, std::less<>> params) {
	m_path_params = std::move(params);
}

}  // namespace ytproxy::server
