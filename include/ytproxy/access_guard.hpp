#pragma once

#include <ytproxy/ytproxy_export.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace ytproxy::auth {

enum class AccessDecision : std::uint8_t {
	allowed,
	missing_credentials,  // No usable Authorization header
	invalid_credentials	  // Bearer token present but rejected
};

struct YTPROXY_EXPORT AccessOptions {
	bool signing_secret_configured = false;
	std::optional<std::string> access_token;
	std::optional<std::string> jwt_secret;
};

/// Gatekeeper for minting stream URLs.
///
/// Open unless a signing secret or a shared access token is configured.
/// When enforced, a request passes with the shared token in the
/// x-ytproxy-stream-token header, or with an HS256 bearer JWT whose payload
/// has a string `userId` claim.
class YTPROXY_EXPORT AccessGuard {
   public:
	static constexpr const char *kStreamTokenHeader = "x-ytproxy-stream-token";

	explicit AccessGuard(AccessOptions options);

	[[nodiscard]] bool enforced() const;

	[[nodiscard]] AccessDecision check(
		std::optional<std::string_view> stream_token,
		std::optional<std::string_view> authorization) const;

	/// Verifies a compact JWT and returns its userId claim.
	[[nodiscard]] Result<std::string> verify_bearer(std::string_view token) const;

   private:
	AccessOptions m_options;
};

}  // namespace ytproxy::auth
