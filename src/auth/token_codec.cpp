#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <ytproxy/token_codec.hpp>

#include "utils.hpp"

namespace ytproxy::auth {

namespace {

std::string base64url(const unsigned char *data, std::size_t len) {
	std::string out(4 * ((len + 2) / 3), '\0');
	int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
								  data, static_cast<int>(len));
	out.resize(static_cast<std::size_t>(written));

	std::replace(out.begin(), out.end(), '+', '-');
	std::replace(out.begin(), out.end(), '/', '_');
	while (!out.empty() && out.back() == '=') out.pop_back();
	return out;
}

bool constant_time_equal(std::string_view a, std::string_view b) {
	if (a.size() != b.size()) return false;
	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace

TokenCodec::TokenCodec(std::string secret, std::chrono::seconds skew)
	: m_secret(std::move(secret)), m_skew(skew) {}

std::string TokenCodec::mint(std::string_view video_id, MediaKind kind,
							 long long expires_at) const {
	const std::string payload =
		fmt::format("{}.{}.{}", video_id, to_string(kind), expires_at);

	unsigned char mac[EVP_MAX_MD_SIZE];
	unsigned int mac_len = 0;
	HMAC(EVP_sha256(), m_secret.data(), static_cast<int>(m_secret.size()),
		 reinterpret_cast<const unsigned char *>(payload.data()),
		 payload.size(), mac, &mac_len);

	return base64url(mac, mac_len);
}

bool TokenCodec::verify(std::string_view video_id, MediaKind kind,
						long long expires_at,
						std::string_view signature) const {
	if (signature.empty()) return false;
	return constant_time_equal(mint(video_id, kind, expires_at), signature);
}

bool TokenCodec::verify(std::string_view video_id, MediaKind kind,
						std::string_view expires_at,
						std::string_view signature) const {
	auto exp = utils::to_long(expires_at);
	if (!exp) return false;
	return verify(video_id, kind, exp.value(), signature);
}

Result<void> TokenCodec::check(std::string_view video_id, MediaKind kind,
							   std::optional<std::string_view> expires_at,
							   std::optional<std::string_view> signature,
							   std::chrono::system_clock::time_point now) const {
	if (!expires_at || expires_at->empty() || !signature || signature->empty()) {
		return outcome::failure(errc::missing_token);
	}

	auto exp = utils::to_long(*expires_at);
	if (!exp || utils::unix_seconds(now) - m_skew.count() > exp.value()) {
		return outcome::failure(errc::expired_token);
	}

	if (!verify(video_id, kind, exp.value(), *signature)) {
		return outcome::failure(errc::invalid_token);
	}
	return outcome::success();
}

}  // namespace ytproxy::auth
