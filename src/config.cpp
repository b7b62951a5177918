#include <fmt/format.h>

#include <boost/program_options.hpp>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <ytproxy/config.hpp>
#include <ytproxy/fallback_binary.hpp>

namespace po = boost::program_options;

namespace ytproxy {

namespace {

unsigned default_threads() {
	unsigned n = std::thread::hardware_concurrency();
	return n == 0 ? 1 : n;
}

std::optional<std::string> non_empty(const po::variables_map &vm,
									 const char *name) {
	if (!vm.count(name)) return std::nullopt;
	auto value = vm[name].as<std::string>();
	if (value.empty()) return std::nullopt;
	return value;
}

std::chrono::seconds seconds_option(const po::variables_map &vm,
									const char *name, long long min) {
	auto value = vm[name].as<long long>();
	if (value < min) {
		throw std::invalid_argument(
			fmt::format("--{} must be at least {}, got {}", name, min, value));
	}
	return std::chrono::seconds(value);
}

}  // namespace

po::options_description config_options() {
	po::options_description desc("Options");
	// clang-format off
	desc.add_options()
		("help,h", "Print help message")
		("verbose,v", "Enable debug logging")
		// Server
		("bind", po::value<std::string>()->default_value("0.0.0.0"),
		 "Listen address [BIND_ADDRESS]")
		("port", po::value<int>()->default_value(3000),
		 "Listen port [PORT]")
		("threads", po::value<int>()->default_value(static_cast<int>(default_threads())),
		 "I/O threads [SERVER_THREADS]")
		// Stream tokens
		("stream-proxy-secret", po::value<std::string>(),
		 "Signing secret for proxy URLs; unset means open proxy mode [STREAM_PROXY_SECRET]")
		("stream-access-token", po::value<std::string>(),
		 "Shared token accepted in x-ytproxy-stream-token [STREAM_PROXY_ACCESS_TOKEN]")
		("jwt-secret", po::value<std::string>(),
		 "HS256 secret for bearer tokens on /stream [JWT_SECRET]")
		("token-ttl", po::value<long long>()->default_value(21600),
		 "Proxy URL lifetime in seconds [STREAM_PROXY_TTL_SECONDS]")
		("clock-skew", po::value<long long>()->default_value(30),
		 "Grace after token expiry in seconds [STREAM_PROXY_CLOCK_SKEW_SECONDS]")
		// Extraction tool
		("ytdlp-path", po::value<std::string>()->default_value("yt-dlp"),
		 "Extraction tool binary [YTDLP_PATH]")
		("ytdlp-download-base-url",
		 po::value<std::string>()->default_value(youtube::kDefaultDownloadBaseUrl),
		 "Where the fallback binary is downloaded from [YTDLP_DOWNLOAD_BASE_URL]")
		("ytdlp-cache-dir", po::value<std::string>(),
		 "Fallback binary cache directory [YTDLP_CACHE_DIR]")
		("ytdlp-cookies", po::value<std::string>(),
		 "Cookies file passed to the tool [YTDLP_COOKIES_PATH]")
		("extraction-timeout", po::value<long long>()->default_value(15),
		 "Tool timeout in seconds [YTDLP_TIMEOUT_SECONDS]");
	// clang-format on
	return desc;
}

std::string environment_option_name(const std::string &variable) {
	static const std::unordered_map<std::string, std::string> kMapping = {
		{"BIND_ADDRESS", "bind"},
		{"PORT", "port"},
		{"SERVER_THREADS", "threads"},
		{"STREAM_PROXY_SECRET", "stream-proxy-secret"},
		{"STREAM_PROXY_ACCESS_TOKEN", "stream-access-token"},
		{"JWT_SECRET", "jwt-secret"},
		{"STREAM_PROXY_TTL_SECONDS", "token-ttl"},
		{"STREAM_PROXY_CLOCK_SKEW_SECONDS", "clock-skew"},
		{"YTDLP_PATH", "ytdlp-path"},
		{"YTDLP_DOWNLOAD_BASE_URL", "ytdlp-download-base-url"},
		{"YTDLP_CACHE_DIR", "ytdlp-cache-dir"},
		{"YTDLP_COOKIES_PATH", "ytdlp-cookies"},
		{"YTDLP_TIMEOUT_SECONDS", "extraction-timeout"},
	};
	auto it = kMapping.find(variable);
	return it == kMapping.end() ? std::string{} : it->second;
}

ServerConfig load_config(int argc, const char *const argv[]) {
	auto desc = config_options();

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::store(po::parse_environment(desc, environment_option_name), vm);
	po::notify(vm);

	ServerConfig cfg;
	cfg.help = vm.count("help") > 0;
	cfg.verbose = vm.count("verbose") > 0;

	cfg.bind_address = vm["bind"].as<std::string>();

	int port = vm["port"].as<int>();
	if (port < 1 || port > 65535) {
		throw std::invalid_argument(
			fmt::format("--port must be between 1 and 65535, got {}", port));
	}
	cfg.port = static_cast<unsigned short>(port);

	int threads = vm["threads"].as<int>();
	if (threads < 1) {
		throw std::invalid_argument(
			fmt::format("--threads must be at least 1, got {}", threads));
	}
	cfg.threads = static_cast<unsigned>(threads);

	cfg.stream_secret = non_empty(vm, "stream-proxy-secret");
	cfg.access_token = non_empty(vm, "stream-access-token");
	cfg.jwt_secret = non_empty(vm, "jwt-secret");
	cfg.token_ttl = seconds_option(vm, "token-ttl", 1);
	cfg.clock_skew = seconds_option(vm, "clock-skew", 0);

	cfg.ytdlp_path = vm["ytdlp-path"].as<std::string>();
	cfg.download_base_url = vm["ytdlp-download-base-url"].as<std::string>();
	if (auto dir = non_empty(vm, "ytdlp-cache-dir")) {
		cfg.cache_dir = *dir;
	} else {
		cfg.cache_dir = std::filesystem::temp_directory_path() / "ytproxy";
	}
	cfg.cookies_path = non_empty(vm, "ytdlp-cookies");
	cfg.extraction_timeout = seconds_option(vm, "extraction-timeout", 1);

	cfg.proxy = net::ProxySettings::from_environment();
	return cfg;
}

}  // namespace ytproxy
