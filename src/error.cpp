#include <string>
#include <ytproxy/result.hpp>

namespace ytproxy {

struct ytproxy_error_category : std::error_category {
	const char *name() const noexcept override { return "ytproxy"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "HTTP error";
			case errc::upstream_fetch_failed: return "Upstream fetch failed";
			case errc::json_parse_error: return "JSON parse error";
			case errc::invalid_url: return "Invalid URL";
			case errc::video_not_found: return "Video not found";
			case errc::extraction_failed: return "Extraction failed";
			case errc::timeout: return "Extraction timed out";
			case errc::bot_check: return "Upstream requires a bot check";
			case errc::cookies_invalid: return "Extraction cookies are invalid";
			case errc::live_not_started: return "Live event has not started";
			case errc::environment_failure:
				return "Extraction tool cannot run in this environment";
			case errc::download_failed:
				return "Fallback binary download failed";
			case errc::unsupported_platform:
				return "Unsupported platform for fallback binary";
			case errc::no_playable_stream: return "No playable stream";
			case errc::missing_token: return "Missing stream token";
			case errc::expired_token: return "Expired stream token";
			case errc::invalid_token: return "Invalid stream token";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::invalid_number_format: return "Invalid number format";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ytproxy_category() {
	static ytproxy_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ytproxy_category()};
}

}  // namespace ytproxy
