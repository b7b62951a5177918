#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include "server/endpoints.hpp"
#include "server/json_response.hpp"
#include "utils.hpp"
#include "youtube/ytdlp_json.hpp"

namespace ytproxy::server {

namespace {

constexpr std::string_view kCookiesInvalidHint =
	"YouTube cookies are configured but invalid or rotated. Re-export cookies "
	"and reinstall them (YTDLP_COOKIES_PATH), then restart the service.";

constexpr std::string_view kBotCheckHintWithCookies =
	"YouTube blocked this server (bot check). Cookies are configured, but "
	"YouTube still requires verification. This is usually caused by the "
	"server or proxy exit IP reputation. Try a different proxy exit, or "
	"complete the challenge in a browser using the same exit IP, then "
	"re-export cookies and restart the service.";

constexpr std::string_view kBotCheckHint =
	"YouTube blocked this server (bot check). Configure yt-dlp cookies "
	"(YTDLP_COOKIES_PATH) on the backend and restart the service.";

std::optional<std::string_view> as_view(const std::optional<std::string> &s) {
	if (!s) return std::nullopt;
	return std::string_view(*s);
}

}  // namespace

bool is_valid_video_id(std::string_view id) {
	if (id.empty() || id.size() > 64) return false;
	return std::all_of(id.begin(), id.end(), [](char c) {
		return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
			   (c >= '0' && c <= '9') || c == '_' || c == '-';
	});
}

http::response<http::string_body> resolution_error_response(
	const std::error_code &ec, bool cookies_configured) {
	if (ec == errc::video_not_found) {
		return json_error(http::status::not_found, "Video not found");
	}
	if (ec == errc::no_playable_stream) {
		return json_error(http::status::not_found, "No playable streams found");
	}
	if (ec == errc::cookies_invalid) {
		return json_error(http::status::service_unavailable,
						  kCookiesInvalidHint, "YOUTUBE_COOKIES_INVALID");
	}
	if (ec == errc::bot_check) {
		return json_error(
			http::status::service_unavailable,
			cookies_configured ? kBotCheckHintWithCookies : kBotCheckHint,
			"YOUTUBE_BOT_CHECK");
	}
	if (ec == errc::live_not_started) {
		return json_error(http::status::conflict,
						  "This live event has not started yet",
						  "LIVE_NOT_STARTED");
	}
	if (ec == errc::download_failed || ec == errc::unsupported_platform) {
		return json_error(http::status::internal_server_error,
						  "Stream backend unavailable",
						  "STREAM_BACKEND_UNAVAILABLE");
	}
	return json_error(http::status::internal_server_error,
					  "Failed to get stream URLs");
}

StreamEndpoint::StreamEndpoint(std::shared_ptr<StreamService> service,
							   std::shared_ptr<const auth::TokenCodec> codec,
							   std::shared_ptr<const auth::AccessGuard> guard,
							   StreamEndpointOptions options, Clock clock)
	: m_service(std::move(service)),
	  m_codec(std::move(codec)),
	  m_guard(std::move(guard)),
	  m_options(options),
	  m_clock(std::move(clock)) {}

std::string StreamEndpoint::proxy_url(const HttpRequest &req,
									  std::string_view video_id,
									  MediaKind kind) const {
	std::string proto = req.header("x-forwarded-proto").value_or("http");
	if (auto comma = proto.find(','); comma != std::string::npos) {
		proto.resize(comma);
	}
	std::string host = req.header(http::field::host)
						   .value_or(fmt::format("localhost:{}", m_options.port));

	const std::string origin = fmt::format("{}://{}", proto, host);
	boost::urls::url url;
	if (auto base = boost::urls::parse_absolute_uri(origin)) {
		url = *base;
	} else {
		spdlog::warn("Unusable Host/X-Forwarded-Proto ({}://{}), using localhost",
					 proto, host);
		url = boost::urls::url(fmt::format("http://localhost:{}", m_options.port));
	}

	url.set_path(fmt::format("/api/youtube/proxy/{}", video_id));
	url.params().append({"type", to_string(kind)});

	if (m_codec) {
		const long long exp =
			utils::unix_seconds(m_clock()) + m_options.token_ttl.count();
		const std::string exp_str = std::to_string(exp);
		const std::string sig = m_codec->mint(video_id, kind, exp);
		url.params().append({"exp", exp_str});
		url.params().append({"sig", sig});
	}

	auto buffer = url.buffer();
	return std::string(buffer.data(), buffer.size());
}

void StreamEndpoint::handle(const HttpRequest &req, Responder &out,
							asio::yield_context yield) const {
	const std::string video_id = req.path_param("id");
	if (!is_valid_video_id(video_id)) {
		return reply(out, json_error(http::status::bad_request, "Invalid video id"),
					 yield);
	}

	const std::string type = req.query("type").value_or("both");
	const bool want_video = type == "video" || type == "both";
	const bool want_audio = type == "audio" || type == "both";
	if (!want_video && !want_audio) {
		return reply(out,
					 json_error(http::status::bad_request, "Invalid stream type"),
					 yield);
	}

	const auto stream_token = req.header(auth::AccessGuard::kStreamTokenHeader);
	const auto authorization = req.header(http::field::authorization);
	switch (m_guard->check(as_view(stream_token), as_view(authorization))) {
		case auth::AccessDecision::allowed: break;
		case auth::AccessDecision::missing_credentials:
			return reply(out,
						 json_error(http::status::unauthorized,
									"Missing or invalid token"),
						 yield);
		case auth::AccessDecision::invalid_credentials:
			return reply(out,
						 json_error(http::status::unauthorized,
									"Invalid or expired token"),
						 yield);
	}

	auto resolved = m_service->async_resolve(video_id, yield);
	if (!resolved) {
		spdlog::warn("Stream request for {} failed: {}", video_id,
					 resolved.error().message());
		return reply(out,
					 resolution_error_response(resolved.error(),
											   m_options.cookies_configured),
					 yield);
	}

	const ResolvedStream &stream = resolved.value();
	const bool has_video = want_video && stream.video_url.has_value();
	const bool has_audio = want_audio && stream.audio_url.has_value();
	if (!has_video && !has_audio) {
		return reply(out,
					 resolution_error_response(errc::no_playable_stream,
											   m_options.cookies_configured),
					 yield);
	}

	nlohmann::json body = {
		{"title", stream.title},
		{"duration", youtube::json_number(stream.duration_seconds)},
		{"thumbnailUrl", stream.thumbnail_url},
	};
	if (want_video) {
		body["videoUrl"] = has_video
							   ? nlohmann::json(proxy_url(req, video_id,
														  MediaKind::video))
							   : nlohmann::json(nullptr);
	}
	if (want_audio) {
		body["audioUrl"] = has_audio
							   ? nlohmann::json(proxy_url(req, video_id,
														  MediaKind::audio))
							   : nlohmann::json(nullptr);
	}

	reply(out, json_response(http::status::ok, body), yield);
}

}  // namespace ytproxy::server
