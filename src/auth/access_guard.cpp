#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <ytproxy/access_guard.hpp>

namespace ytproxy::auth {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

}  // namespace

AccessGuard::AccessGuard(AccessOptions options)
	: m_options(std::move(options)) {}

bool AccessGuard::enforced() const {
	return m_options.signing_secret_configured ||
		   (m_options.access_token && !m_options.access_token->empty());
}

AccessDecision AccessGuard::check(
	std::optional<std::string_view> stream_token,
	std::optional<std::string_view> authorization) const {
	if (!enforced()) return AccessDecision::allowed;

	const auto &expected = m_options.access_token;
	if (expected && !expected->empty() && stream_token &&
		stream_token->size() == expected->size() &&
		CRYPTO_memcmp(stream_token->data(), expected->data(),
					  expected->size()) == 0) {
		return AccessDecision::allowed;
	}

	if (!authorization || authorization->substr(0, kBearerPrefix.size()) !=
							  kBearerPrefix) {
		return AccessDecision::missing_credentials;
	}

	auto user = verify_bearer(authorization->substr(kBearerPrefix.size()));
	if (!user) return AccessDecision::invalid_credentials;

	spdlog::debug("Stream access granted to user {}", user.value());
	return AccessDecision::allowed;
}

Result<std::string> AccessGuard::verify_bearer(std::string_view token) const {
	if (!m_options.jwt_secret || token.empty()) {
		return outcome::failure(errc::invalid_token);
	}

	try {
		auto decoded = jwt::decode(std::string(token));

		std::error_code ec;
		jwt::verify()
			.allow_algorithm(jwt::algorithm::hs256{*m_options.jwt_secret})
			.verify(decoded, ec);
		if (ec) {
			spdlog::debug("Bearer token rejected: {}", ec.message());
			return outcome::failure(errc::invalid_token);
		}

		if (!decoded.has_payload_claim("userId")) {
			return outcome::failure(errc::invalid_token);
		}
		auto claim = decoded.get_payload_claim("userId");
		if (claim.get_type() != jwt::json::type::string) {
			return outcome::failure(errc::invalid_token);
		}
		return claim.as_string();
	} catch (const std::exception &e) {
		spdlog::debug("Malformed bearer token: {}", e.what());
		return outcome::failure(errc::invalid_token);
	}
}

}  // namespace ytproxy::auth
