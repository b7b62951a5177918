#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace ytproxy {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Unexpected upstream status
	upstream_fetch_failed,

	// Parsing errors
	json_parse_error = 20,
	invalid_url,

	// Extraction tool
	video_not_found = 30,
	extraction_failed,
	timeout,
	bot_check,
	cookies_invalid,
	live_not_started,
	environment_failure,

	// Fallback binary acquisition
	download_failed = 40,
	unsupported_platform,

	// Stream access
	no_playable_stream = 50,
	missing_token,
	expired_token,
	invalid_token,

	// I/O
	file_open_failed = 60,
	file_write_failed,

	// Conversion
	invalid_number_format = 70,

	unknown = 100
};

const std::error_category &ytproxy_category();

std::error_code make_error_code(errc e);

}  // namespace ytproxy

namespace std {
template <>
struct is_error_code_enum<ytproxy::errc> : true_type {};
}  // namespace std

namespace ytproxy {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ytproxy
