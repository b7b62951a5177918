#pragma once

#include <ytproxy/ytproxy_export.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"
#include "types.hpp"

namespace ytproxy::auth {

/// Signs and checks stream capability tokens.
///
/// A token is the triple (video id, media kind, expiry) plus
/// base64url(HMAC-SHA256(secret, "<video>.<kind>.<exp>")). It carries no
/// user identity and grants access to exactly one (video, kind) pair.
class YTPROXY_EXPORT TokenCodec {
   public:
	static constexpr std::chrono::seconds kDefaultSkew{30};

	explicit TokenCodec(std::string secret,
						std::chrono::seconds skew = kDefaultSkew);

	[[nodiscard]] std::string mint(std::string_view video_id, MediaKind kind,
								   long long expires_at) const;

	/// Signature check only; expiry is not considered. Constant time in the
	/// signature contents.
	[[nodiscard]] bool verify(std::string_view video_id, MediaKind kind,
							  long long expires_at,
							  std::string_view signature) const;

	/// As above with the expiry still in its query-string form. A value that
	/// is not a whole decimal number fails.
	[[nodiscard]] bool verify(std::string_view video_id, MediaKind kind,
							  std::string_view expires_at,
							  std::string_view signature) const;

	/// Full admission check for a proxied request. Fails with
	/// errc::missing_token, errc::expired_token or errc::invalid_token.
	/// Accepted while `now - skew <= exp`.
	[[nodiscard]] Result<void> check(
		std::string_view video_id, MediaKind kind,
		std::optional<std::string_view> expires_at,
		std::optional<std::string_view> signature,
		std::chrono::system_clock::time_point now) const;

	[[nodiscard]] std::chrono::seconds skew() const { return m_skew; }

   private:
	std::string m_secret;
	std::chrono::seconds m_skew;
};

}  // namespace ytproxy::auth
