#include <spdlog/spdlog.h>

#include "server/endpoints.hpp"
#include "server/json_response.hpp"
#include "youtube/ytdlp_json.hpp"

namespace ytproxy::server {

VideoInfoEndpoint::VideoInfoEndpoint(std::shared_ptr<StreamService> service)
	: m_service(std::move(service)) {}

void VideoInfoEndpoint::handle(const HttpRequest &req, Responder &out,
							   asio::yield_context yield) const {
	const std::string video_id = req.path_param("id");
	if (!is_valid_video_id(video_id)) {
		return reply(out, json_error(http::status::bad_request, "Invalid video id"),
					 yield);
	}

	auto info = m_service->async_describe(video_id, yield);
	if (!info) {
		spdlog::warn("Video info for {} failed: {}", video_id,
					 info.error().message());
		if (info.error() == errc::video_not_found) {
			return reply(out, json_error(http::status::not_found, "Video not found"),
						 yield);
		}
		return reply(out,
					 json_error(http::status::internal_server_error,
								"Failed to get video info"),
					 yield);
	}

	nlohmann::json video;
	youtube::to_json(video, info.value());
	reply(out, json_response(http::status::ok, {{"video", std::move(video)}}),
		  yield);
}

}  // namespace ytproxy::server
