#include <gtest/gtest.h>

#include <boost/url/parse.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <ytproxy/stream_cache.hpp>

#include "server/endpoints.hpp"
#include "server/router.hpp"
#include "support/fakes.hpp"

using namespace ytproxy;
using namespace ytproxy::server;
using namespace ytproxy::testing;
using namespace std::chrono_literals;

namespace {

struct ParsedUrl {
	std::string scheme;
	std::string authority;
	std::string path;
	std::map<std::string, std::string> params;
};

ParsedUrl parse_url(const std::string &s) {
	auto u = boost::urls::parse_absolute_uri(s);
	if (!u) throw std::runtime_error("not an absolute URL: " + s);

	ParsedUrl out;
	auto scheme = u->scheme();
	auto authority = u->encoded_authority();
	out.scheme.assign(scheme.data(), scheme.size());
	out.authority.assign(authority.data(), authority.size());
	out.path = u->path();
	for (auto p : u->params()) out.params[p.key] = p.value;
	return out;
}

Result<ExtractionResult> lookup(const std::string &id) {
	if (id == "missing") return outcome::failure(errc::video_not_found);
	if (id == "botcheck") return outcome::failure(errc::bot_check);
	if (id == "cookies") return outcome::failure(errc::cookies_invalid);
	if (id == "upcoming") return outcome::failure(errc::live_not_started);
	if (id == "nobackend") return outcome::failure(errc::download_failed);
	if (id == "broken") return outcome::failure(errc::extraction_failed);
	if (id == "silent") {
		auto info = sample_extraction(id);
		info.formats.clear();
		return info;
	}
	return sample_extraction(id);
}

class StreamEndpointTest : public ::testing::Test {
   protected:
	void SetUp() override { build(true, "shared", false); }

	void build(bool signed_urls, std::optional<std::string> access_token,
			   bool cookies_configured) {
		m_source = std::make_shared<FakeExtractionSource>(m_ioc.get_executor(),
														  lookup);
		m_service = std::make_shared<StreamService>(
			m_source, std::make_shared<StreamCache>(m_clock.clock()));

		m_codec.reset();
		if (signed_urls) m_codec = std::make_shared<const auth::TokenCodec>("secret");

		auth::AccessOptions access;
		access.signing_secret_configured = signed_urls;
		access.access_token = std::move(access_token);
		access.jwt_secret = "jwt-secret";

		StreamEndpointOptions opts;
		opts.cookies_configured = cookies_configured;

		m_router = Router{};
		register_routes(
			m_router,
			std::make_shared<const StreamEndpoint>(
				m_service, m_codec,
				std::make_shared<const auth::AccessGuard>(access), opts,
				m_clock.clock()),
			std::make_shared<const ProxyEndpoint>(
				m_service, std::make_shared<FakeHttpFetcher>(m_ioc.get_executor()),
				m_codec, m_clock.clock()),
			std::make_shared<const VideoInfoEndpoint>(m_service));
	}

	RecordingResponder get(
		const std::string &target,
		std::vector<std::pair<http::field, std::string>> headers =
			{{http::field::host, "media.example.org"}},
		std::vector<std::pair<std::string, std::string>> named =
			{{"x-ytproxy-stream-token", "shared"}}) {
		RecordingResponder out;
		auto req = make_request(http::verb::get, target, std::move(headers),
								std::move(named));
		run_coroutine(m_ioc, [&](asio::yield_context yield) {
			m_router.dispatch(std::move(req), out, yield);
		});
		return out;
	}

	asio::io_context m_ioc;
	ManualClock m_clock;
	std::shared_ptr<FakeExtractionSource> m_source;
	std::shared_ptr<StreamService> m_service;
	std::shared_ptr<const auth::TokenCodec> m_codec;
	Router m_router;
};

}  // namespace

TEST_F(StreamEndpointTest, ReturnsSignedProxyUrls) {
	auto out = get("/api/youtube/stream/abc");
	ASSERT_EQ(out.status, 200u);

	auto body = nlohmann::json::parse(out.body);
	EXPECT_EQ(body["title"], "Sample abc");
	ASSERT_TRUE(body["duration"].is_number_integer());
	EXPECT_EQ(body["duration"].get<long long>(), 212);
	EXPECT_EQ(body["thumbnailUrl"], "https://i.example/abc.jpg");

	const long long expected_exp =
		std::chrono::duration_cast<std::chrono::seconds>(
			m_clock.now().time_since_epoch())
			.count() +
		21600;

	for (auto [key, kind] : {std::pair{"videoUrl", MediaKind::video},
							 std::pair{"audioUrl", MediaKind::audio}}) {
		ASSERT_TRUE(body[key].is_string()) << key;
		auto url = parse_url(body[key].get<std::string>());
		EXPECT_EQ(url.scheme, "http");
		EXPECT_EQ(url.authority, "media.example.org");
		EXPECT_EQ(url.path, "/api/youtube/proxy/abc");
		EXPECT_EQ(url.params["type"], to_string(kind));
		EXPECT_EQ(url.params["exp"], std::to_string(expected_exp));
		EXPECT_TRUE(
			m_codec->verify("abc", kind, expected_exp, url.params["sig"]));
	}

	// Upstream URLs never leak to the client
	EXPECT_EQ(out.body.find("media.example/"), std::string::npos);
	EXPECT_EQ(out.header(http::field::access_control_allow_origin), "*");
}

TEST_F(StreamEndpointTest, OnlyRequestedKind) {
	auto out = get("/api/youtube/stream/abc?type=audio");
	ASSERT_EQ(out.status, 200u);

	auto body = nlohmann::json::parse(out.body);
	EXPECT_TRUE(body["audioUrl"].is_string());
	EXPECT_FALSE(body.contains("videoUrl"));
}

TEST_F(StreamEndpointTest, HonoursForwardedProto) {
	auto out = get("/api/youtube/stream/abc?type=video",
				   {{http::field::host, "yt.example.net"}},
				   {{"x-ytproxy-stream-token", "shared"},
					{"x-forwarded-proto", "https, http"}});
	ASSERT_EQ(out.status, 200u);

	auto url = parse_url(
		nlohmann::json::parse(out.body)["videoUrl"].get<std::string>());
	EXPECT_EQ(url.scheme, "https");
	EXPECT_EQ(url.authority, "yt.example.net");
}

TEST_F(StreamEndpointTest, FallsBackToLocalhostWithoutHost) {
	auto out = get("/api/youtube/stream/abc?type=video", {});
	ASSERT_EQ(out.status, 200u);

	auto url = parse_url(
		nlohmann::json::parse(out.body)["videoUrl"].get<std::string>());
	EXPECT_EQ(url.authority, "localhost:3000");
}

TEST_F(StreamEndpointTest, UnknownVideoMintsNothing) {
	auto out = get("/api/youtube/stream/missing");
	EXPECT_EQ(out.status, 404u);

	auto body = nlohmann::json::parse(out.body);
	EXPECT_EQ(body["error"], "Video not found");
	EXPECT_EQ(out.body.find("sig"), std::string::npos);
}

TEST_F(StreamEndpointTest, NoPlayableStreams) {
	auto out = get("/api/youtube/stream/silent");
	EXPECT_EQ(out.status, 404u);
	EXPECT_EQ(nlohmann::json::parse(out.body)["error"],
			  "No playable streams found");
}

TEST_F(StreamEndpointTest, RejectsBadInput) {
	EXPECT_EQ(get("/api/youtube/stream/abc?type=subtitles").status, 400u);
	EXPECT_EQ(get("/api/youtube/stream/bad$id").status, 400u);
	EXPECT_EQ(m_source->calls.load(), 0);
}

TEST_F(StreamEndpointTest, RequiresCredentials) {
	auto missing = get("/api/youtube/stream/abc",
					   {{http::field::host, "media.example.org"}}, {});
	EXPECT_EQ(missing.status, 401u);
	EXPECT_EQ(nlohmann::json::parse(missing.body)["error"],
			  "Missing or invalid token");

	auto bad = get("/api/youtube/stream/abc",
				   {{http::field::host, "media.example.org"},
					{http::field::authorization, "Bearer nonsense"}},
				   {});
	EXPECT_EQ(bad.status, 401u);
	EXPECT_EQ(nlohmann::json::parse(bad.body)["error"],
			  "Invalid or expired token");

	EXPECT_EQ(m_source->calls.load(), 0);
}

TEST_F(StreamEndpointTest, OpenModeMintsUnsignedUrls) {
	build(false, std::nullopt, false);

	auto out = get("/api/youtube/stream/abc?type=video",
				   {{http::field::host, "media.example.org"}}, {});
	ASSERT_EQ(out.status, 200u);

	auto url = parse_url(
		nlohmann::json::parse(out.body)["videoUrl"].get<std::string>());
	EXPECT_EQ(url.params["type"], "video");
	EXPECT_EQ(url.params.count("exp"), 0u);
	EXPECT_EQ(url.params.count("sig"), 0u);
}

TEST_F(StreamEndpointTest, ResolutionFailuresMapToStatusCodes) {
	auto bot = get("/api/youtube/stream/botcheck");
	EXPECT_EQ(bot.status, 503u);
	EXPECT_EQ(nlohmann::json::parse(bot.body)["code"], "YOUTUBE_BOT_CHECK");

	auto cookies = get("/api/youtube/stream/cookies");
	EXPECT_EQ(cookies.status, 503u);
	EXPECT_EQ(nlohmann::json::parse(cookies.body)["code"],
			  "YOUTUBE_COOKIES_INVALID");

	auto live = get("/api/youtube/stream/upcoming");
	EXPECT_EQ(live.status, 409u);
	EXPECT_EQ(nlohmann::json::parse(live.body)["code"], "LIVE_NOT_STARTED");

	auto backend = get("/api/youtube/stream/nobackend");
	EXPECT_EQ(backend.status, 500u);
	EXPECT_EQ(nlohmann::json::parse(backend.body)["code"],
			  "STREAM_BACKEND_UNAVAILABLE");

	auto other = get("/api/youtube/stream/broken");
	EXPECT_EQ(other.status, 500u);
	EXPECT_EQ(nlohmann::json::parse(other.body)["error"],
			  "Failed to get stream URLs");
	EXPECT_FALSE(nlohmann::json::parse(other.body).contains("code"));
}

TEST_F(StreamEndpointTest, BotCheckHintDependsOnCookies) {
	auto without = nlohmann::json::parse(
		get("/api/youtube/stream/botcheck").body)["error"].get<std::string>();

	build(true, "shared", true);
	auto with = nlohmann::json::parse(
		get("/api/youtube/stream/botcheck").body)["error"].get<std::string>();

	EXPECT_NE(without, with);
	EXPECT_NE(with.find("Cookies are configured"), std::string::npos);
}

TEST_F(StreamEndpointTest, RepeatedRequestsHitCache) {
	EXPECT_EQ(get("/api/youtube/stream/abc").status, 200u);
	EXPECT_EQ(get("/api/youtube/stream/abc?type=audio").status, 200u);
	EXPECT_EQ(m_source->calls.load(), 1);
}

// -----------------------------------------------------------------------------
// Video metadata and status routes
// -----------------------------------------------------------------------------

TEST_F(StreamEndpointTest, VideoInfo) {
	auto out = get("/api/youtube/video/abc");
	ASSERT_EQ(out.status, 200u);

	auto body = nlohmann::json::parse(out.body);
	EXPECT_EQ(body["video"]["id"], "abc");
	EXPECT_EQ(body["video"]["formats"].size(), 3u);

	EXPECT_EQ(get("/api/youtube/video/missing").status, 404u);

	auto failed = get("/api/youtube/video/broken");
	EXPECT_EQ(failed.status, 500u);
	EXPECT_EQ(nlohmann::json::parse(failed.body)["error"],
			  "Failed to get video info");
}

TEST_F(StreamEndpointTest, StatusRoutes) {
	auto root = get("/");
	ASSERT_EQ(root.status, 200u);
	auto body = nlohmann::json::parse(root.body);
	EXPECT_EQ(body["name"], "ytproxy");
	EXPECT_EQ(body["status"], "running");

	EXPECT_EQ(nlohmann::json::parse(get("/health").body)["status"], "ok");
	EXPECT_EQ(nlohmann::json::parse(get("/api/health").body)["status"], "ok");
}
