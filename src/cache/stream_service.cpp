#include <spdlog/spdlog.h>

#include <ytproxy/format_selector.hpp>
#include <ytproxy/stream_service.hpp>

namespace ytproxy {

ResolvedStream make_resolved_stream(const std::string &video_id,
									const ExtractionResult &info) {
	auto selection = youtube::select_stream_urls(info.formats);

	ResolvedStream stream;
	stream.video_id = video_id;
	stream.video_url = std::move(selection.video_url);
	stream.audio_url = std::move(selection.audio_url);
	stream.title = info.title;
	stream.thumbnail_url = info.thumbnail;
	stream.duration_seconds = info.duration;
	return stream;
}

StreamService::StreamService(std::shared_ptr<youtube::ExtractionSource> source,
							 std::shared_ptr<StreamCache> cache)
	: m_source(std::move(source)), m_cache(std::move(cache)) {}

StreamCache::Resolver StreamService::make_resolver() const {
	return [source = m_source](std::string video_id,
							   StreamCache::ResolveHandler handler) {
		source->async_extract(
			video_id,
			[video_id, handler = std::move(handler)](
				Result<ExtractionResult> res) mutable {
				if (!res) {
					handler(outcome::failure(res.error()));
					return;
				}

				auto stream = make_resolved_stream(video_id, res.value());
				spdlog::info("Resolved {} ({} formats, video: {}, audio: {})",
							 video_id, res.value().formats.size(),
							 stream.video_url.has_value(),
							 stream.audio_url.has_value());
				handler(std::move(stream));
			});
	};
}

}  // namespace ytproxy
