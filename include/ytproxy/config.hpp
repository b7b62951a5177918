#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/program_options/options_description.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "http_client.hpp"

namespace ytproxy {

inline constexpr const char *kServiceName = "ytproxy";
inline constexpr const char *kServiceVersion = "1.0.0";

struct YTPROXY_EXPORT ServerConfig {
	std::string bind_address = "0.0.0.0";
	unsigned short port = 3000;
	unsigned threads = 1;

	// Absent: open proxy mode, no tokens are minted or checked
	std::optional<std::string> stream_secret;
	std::optional<std::string> access_token;
	std::optional<std::string> jwt_secret;
	std::chrono::seconds token_ttl{21600};
	std::chrono::seconds clock_skew{30};

	std::string ytdlp_path = "yt-dlp";
	std::string download_base_url;
	std::filesystem::path cache_dir;
	std::optional<std::string> cookies_path;
	std::chrono::seconds extraction_timeout{15};

	net::ProxySettings proxy;

	bool verbose = false;
	bool help = false;
};

/// Every option the server understands.
YTPROXY_EXPORT boost::program_options::options_description config_options();

/// Maps an environment variable to the option it sets, or "" if none.
YTPROXY_EXPORT std::string environment_option_name(const std::string &variable);

/// Command line first, then the process environment, then defaults.
/// Throws boost::program_options::error on malformed input and
/// std::invalid_argument on out-of-range values.
YTPROXY_EXPORT ServerConfig load_config(int argc, const char *const argv[]);

}  // namespace ytproxy
