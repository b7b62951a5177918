#include <gtest/gtest.h>

#include <boost/program_options/errors.hpp>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <ytproxy/config.hpp>
#include <ytproxy/fallback_binary.hpp>

using namespace ytproxy;

namespace {

const std::vector<std::string> kManagedVariables = {
	"BIND_ADDRESS",
	"PORT",
	"SERVER_THREADS",
	"STREAM_PROXY_SECRET",
	"STREAM_PROXY_ACCESS_TOKEN",
	"JWT_SECRET",
	"STREAM_PROXY_TTL_SECONDS",
	"STREAM_PROXY_CLOCK_SKEW_SECONDS",
	"YTDLP_PATH",
	"YTDLP_DOWNLOAD_BASE_URL",
	"YTDLP_CACHE_DIR",
	"YTDLP_COOKIES_PATH",
	"YTDLP_TIMEOUT_SECONDS",
	"https_proxy",
	"HTTPS_PROXY",
	"http_proxy",
	"HTTP_PROXY",
};

// Clears the variables the server reads and restores them afterwards.
class ConfigTest : public ::testing::Test {
   protected:
	void SetUp() override {
		for (const auto &name : kManagedVariables) {
			if (const char *value = std::getenv(name.c_str())) {
				m_saved[name] = value;
			}
			::unsetenv(name.c_str());
		}
	}

	void TearDown() override {
		for (const auto &name : kManagedVariables) {
			auto it = m_saved.find(name);
			if (it != m_saved.end()) {
				::setenv(name.c_str(), it->second.c_str(), 1);
			} else {
				::unsetenv(name.c_str());
			}
		}
	}

	static void set(const char *name, const char *value) {
		::setenv(name, value, 1);
	}

	static ServerConfig load(std::vector<const char *> args = {}) {
		args.insert(args.begin(), "ytproxy-server");
		return load_config(static_cast<int>(args.size()), args.data());
	}

   private:
	std::map<std::string, std::string> m_saved;
};

}  // namespace

TEST_F(ConfigTest, Defaults) {
	auto cfg = load();

	EXPECT_EQ(cfg.bind_address, "0.0.0.0");
	EXPECT_EQ(cfg.port, 3000);
	EXPECT_GE(cfg.threads, 1u);
	EXPECT_FALSE(cfg.stream_secret.has_value());
	EXPECT_FALSE(cfg.access_token.has_value());
	EXPECT_FALSE(cfg.jwt_secret.has_value());
	EXPECT_EQ(cfg.token_ttl, std::chrono::seconds(21600));
	EXPECT_EQ(cfg.clock_skew, std::chrono::seconds(30));
	EXPECT_EQ(cfg.ytdlp_path, "yt-dlp");
	EXPECT_EQ(cfg.download_base_url, youtube::kDefaultDownloadBaseUrl);
	EXPECT_EQ(cfg.cache_dir, std::filesystem::temp_directory_path() / "ytproxy");
	EXPECT_FALSE(cfg.cookies_path.has_value());
	EXPECT_EQ(cfg.extraction_timeout, std::chrono::seconds(15));
	EXPECT_FALSE(cfg.proxy.enabled());
	EXPECT_FALSE(cfg.help);
}

TEST_F(ConfigTest, ReadsEnvironment) {
	set("PORT", "8080");
	set("STREAM_PROXY_SECRET", "s3cret");
	set("STREAM_PROXY_ACCESS_TOKEN", "shared");
	set("STREAM_PROXY_TTL_SECONDS", "600");
	set("YTDLP_COOKIES_PATH", "/etc/ytproxy/cookies.txt");
	set("YTDLP_CACHE_DIR", "/var/cache/ytproxy");
	set("https_proxy", "http://proxy.internal:3128");

	auto cfg = load();
	EXPECT_EQ(cfg.port, 8080);
	EXPECT_EQ(cfg.stream_secret, "s3cret");
	EXPECT_EQ(cfg.access_token, "shared");
	EXPECT_EQ(cfg.token_ttl, std::chrono::seconds(600));
	EXPECT_EQ(cfg.cookies_path, "/etc/ytproxy/cookies.txt");
	EXPECT_EQ(cfg.cache_dir, std::filesystem::path("/var/cache/ytproxy"));
	ASSERT_TRUE(cfg.proxy.enabled());
	EXPECT_EQ(cfg.proxy.url, "http://proxy.internal:3128");
}

TEST_F(ConfigTest, CommandLineWinsOverEnvironment) {
	set("PORT", "8080");
	set("YTDLP_PATH", "/opt/env/yt-dlp");

	auto cfg = load({"--port", "9090", "--ytdlp-path", "/opt/cli/yt-dlp"});
	EXPECT_EQ(cfg.port, 9090);
	EXPECT_EQ(cfg.ytdlp_path, "/opt/cli/yt-dlp");
}

TEST_F(ConfigTest, EmptySecretMeansUnset) {
	set("STREAM_PROXY_SECRET", "");
	set("JWT_SECRET", "");

	auto cfg = load();
	EXPECT_FALSE(cfg.stream_secret.has_value());
	EXPECT_FALSE(cfg.jwt_secret.has_value());
}

TEST_F(ConfigTest, RejectsOutOfRangeValues) {
	EXPECT_THROW(load({"--port", "0"}), std::invalid_argument);
	EXPECT_THROW(load({"--port", "70000"}), std::invalid_argument);
	EXPECT_THROW(load({"--threads", "0"}), std::invalid_argument);
	EXPECT_THROW(load({"--token-ttl", "0"}), std::invalid_argument);
	EXPECT_THROW(load({"--clock-skew=-1"}), std::invalid_argument);
	EXPECT_THROW(load({"--extraction-timeout", "0"}), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsMalformedValues) {
	EXPECT_THROW(load({"--port", "http"}), boost::program_options::error);
	EXPECT_THROW(load({"--no-such-flag"}), boost::program_options::error);

	set("STREAM_PROXY_TTL_SECONDS", "six hours");
	EXPECT_THROW(load(), boost::program_options::error);
}

TEST_F(ConfigTest, ZeroSkewIsAllowed) {
	auto cfg = load({"--clock-skew", "0"});
	EXPECT_EQ(cfg.clock_skew, std::chrono::seconds(0));
}

TEST_F(ConfigTest, HelpFlag) {
	EXPECT_TRUE(load({"--help"}).help);
}

TEST(EnvironmentMappingTest, KnownAndUnknownVariables) {
	EXPECT_EQ(environment_option_name("PORT"), "port");
	EXPECT_EQ(environment_option_name("STREAM_PROXY_SECRET"),
			  "stream-proxy-secret");
	EXPECT_EQ(environment_option_name("YTDLP_TIMEOUT_SECONDS"),
			  "extraction-timeout");
	EXPECT_EQ(environment_option_name("HOME"), "");
	EXPECT_EQ(environment_option_name("port"), "");
}
