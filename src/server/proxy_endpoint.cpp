#include <spdlog/spdlog.h>

#include <vector>

#include "server/endpoints.hpp"
#include "server/json_response.hpp"

namespace ytproxy::server {

namespace {

std::string_view default_content_type(MediaKind kind) {
	return kind == MediaKind::audio ? "audio/mp4" : "video/mp4";
}

std::optional<std::string_view> query_view(const std::optional<std::string> &s) {
	if (!s) return std::nullopt;
	return std::string_view(*s);
}

}  // namespace

ProxyEndpoint::ProxyEndpoint(std::shared_ptr<StreamService> service,
							 std::shared_ptr<net::HttpFetcher> http,
							 std::shared_ptr<const auth::TokenCodec> codec,
							 Clock clock)
	: m_service(std::move(service)),
	  m_http(std::move(http)),
	  m_codec(std::move(codec)),
	  m_clock(std::move(clock)) {}

void ProxyEndpoint::handle(const HttpRequest &req, Responder &out,
						   asio::yield_context yield) const {
	const std::string video_id = req.path_param("id");
	if (!is_valid_video_id(video_id)) {
		return reply(out, json_error(http::status::bad_request, "Invalid video id"),
					 yield);
	}

	auto kind = parse_media_kind(req.query("type").value_or("video"));
	if (!kind) {
		return reply(out,
					 json_error(http::status::bad_request, "Invalid stream type"),
					 yield);
	}

	if (m_codec) {
		const auto exp = req.query("exp");
		const auto sig = req.query("sig");
		auto admitted = m_codec->check(video_id, *kind, query_view(exp),
									   query_view(sig), m_clock());
		if (!admitted) {
			const auto &ec = admitted.error();
			spdlog::debug("Rejected proxy request for {}: {}", video_id,
						  ec.message());
			if (ec == errc::missing_token) {
				return reply(out,
							 json_error(http::status::unauthorized,
										"Missing stream token"),
							 yield);
			}
			if (ec == errc::expired_token) {
				return reply(out,
							 json_error(http::status::unauthorized,
										"Expired stream token"),
							 yield);
			}
			return reply(
				out, json_error(http::status::forbidden, "Invalid stream token"),
				yield);
		}
	}

	auto resolved = m_service->async_resolve(video_id, yield);
	if (!resolved) {
		spdlog::warn("Proxy resolution for {} failed: {}", video_id,
					 resolved.error().message());
		return reply(out,
					 json_error(http::status::internal_server_error,
								"Failed to proxy stream"),
					 yield);
	}

	const auto &url = resolved.value().url_for(*kind);
	if (!url) {
		return reply(out,
					 json_error(http::status::not_found, "No stream URL found"),
					 yield);
	}

	net::UpstreamRequest upstream_req;
	upstream_req.url = *url;
	upstream_req.headers.set(http::field::user_agent, kUserAgent);
	if (auto range = req.header(http::field::range)) {
		upstream_req.headers.set(http::field::range, *range);
	}
	spdlog::debug("Proxying {} {} from {}", video_id, to_string(*kind), *url);

	auto opened = m_http->async_open(std::move(upstream_req), yield);
	if (!opened) {
		spdlog::warn("Upstream fetch for {} failed: {}", video_id,
					 opened.error().message());
		return reply(out,
					 json_error(http::status::internal_server_error,
								"Failed to proxy stream"),
					 yield);
	}

	relay(*opened.value(), *kind, out, yield);
}

void ProxyEndpoint::relay(net::ResponseStream &upstream, MediaKind kind,
						  Responder &out, asio::yield_context yield) const {
	const auto &in = upstream.headers();

	http::response_header<> header;
	header.version(11);
	header.result(upstream.status());

	auto content_type = in.find(http::field::content_type);
	if (content_type != in.end()) {
		header.set(http::field::content_type, content_type->value());
	} else {
		header.set(http::field::content_type, default_content_type(kind));
	}
	for (auto field : {http::field::content_length, http::field::content_range,
					   http::field::accept_ranges}) {
		if (auto it = in.find(field); it != in.end()) {
			header.set(field, it->value());
		}
	}
	header.set(http::field::cache_control, "no-cache");

	if (auto started = out.begin_stream(std::move(header), yield); !started) {
		spdlog::debug("Client went away before the body: {}",
					  started.error().message());
		upstream.cancel();
		out.abort();
		return;
	}

	std::vector<char> buffer(kRelayBufferSize);
	for (;;) {
		auto n = upstream.async_read_some(asio::buffer(buffer), yield);
		if (!n) {
			spdlog::warn("Upstream read failed mid-body: {}",
						 n.error().message());
			out.abort();
			return;
		}
		if (n.value() == 0) break;

		auto written =
			out.write_stream(asio::buffer(buffer.data(), n.value()), yield);
		if (!written) {
			spdlog::debug("Client disconnected, cancelling upstream: {}",
						  written.error().message());
			upstream.cancel();
			out.abort();
			return;
		}
	}

	if (auto ended = out.end_stream(yield); !ended) {
		spdlog::debug("Failed to finish response: {}", ended.error().message());
	}
}

}  // namespace ytproxy::server
