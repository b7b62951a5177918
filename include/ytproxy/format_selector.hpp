#pragma once

#include <ytproxy/ytproxy_export.h>

#include <optional>
#include <string>
#include <vector>
#include <ytproxy/types.hpp>

namespace ytproxy::youtube {

/// Preferred ceiling for progressive video.
inline constexpr int kPreferredMaxHeight = 720;

struct YTPROXY_EXPORT StreamInfo {
	const CandidateFormat *video = nullptr;
	const CandidateFormat *audio = nullptr;
};

/// Picks the video and audio formats to serve.
///
/// Video: progressive mp4 (both tracks) with a URL, tallest first, first one
/// at or below 720p, else the tallest. Falls back to video-only mp4 under
/// the same rule.
/// Audio: audio-only m4a/mp4/webm, highest abr first, first m4a, else the
/// highest abr.
/// The returned pointers refer into `formats`.
YTPROXY_EXPORT StreamInfo select_streams(
	const std::vector<CandidateFormat> &formats);

struct YTPROXY_EXPORT StreamSelection {
	std::optional<std::string> video_url;
	std::optional<std::string> audio_url;
};

/// URL-level view of select_streams. When no audio-only format qualifies,
/// the video URL doubles as the audio URL.
YTPROXY_EXPORT StreamSelection select_stream_urls(
	const std::vector<CandidateFormat> &formats);

}  // namespace ytproxy::youtube
