#pragma once

#include <ytproxy/ytproxy_export.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ytproxy {

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock system_clock() {
	return [] { return std::chrono::system_clock::now(); };
}

enum class MediaKind : std::uint8_t { video, audio };

YTPROXY_EXPORT std::string_view to_string(MediaKind kind);
YTPROXY_EXPORT std::optional<MediaKind> parse_media_kind(std::string_view s);

// One entry of the extraction tool's "formats" array.
// Only the literal "none" marks a track as absent; an empty codec string
// means the tool did not report one.
struct YTPROXY_EXPORT CandidateFormat {
	std::string format_id;
	std::string url;
	std::string ext;
	std::string vcodec;
	std::string acodec;
	std::optional<int> width;
	std::optional<int> height;
	std::optional<double> fps;
	std::optional<double> abr;
	std::optional<double> tbr;
	std::optional<double> quality;	// yt-dlp's relative ranking
	std::optional<long long> filesize;
	std::string format_note;
	std::string protocol;

	[[nodiscard]] bool has_video() const { return vcodec != "none"; }
	[[nodiscard]] bool has_audio() const { return acodec != "none"; }
};

struct YTPROXY_EXPORT ExtractionResult {
	std::string id;
	std::string title;
	std::string description;
	std::string thumbnail;
	std::string channel;
	std::string channel_id;
	std::string upload_date;  // YYYYMMDD
	std::string live_status;
	double duration = 0.0;
	long long view_count = 0;
	std::vector<CandidateFormat> formats;
};

struct YTPROXY_EXPORT ResolvedStream {
	std::string video_id;
	std::optional<std::string> video_url;
	std::optional<std::string> audio_url;
	std::string title;
	std::string thumbnail_url;
	double duration_seconds = 0.0;
	std::chrono::system_clock::time_point resolved_at;

	[[nodiscard]] bool usable() const {
		return video_url.has_value() || audio_url.has_value();
	}

	[[nodiscard]] const std::optional<std::string> &url_for(
		MediaKind kind) const {
		return kind == MediaKind::video ? video_url : audio_url;
	}
};

}  // namespace ytproxy
