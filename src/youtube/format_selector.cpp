#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <ytproxy/format_selector.hpp>

namespace ytproxy::youtube {

namespace {

bool has_url(const CandidateFormat &f) { return !f.url.empty(); }

// Stable sort keeps the extractor's order among equal heights
const CandidateFormat *pick_by_height(
	std::vector<const CandidateFormat *> candidates) {
	if (candidates.empty()) return nullptr;

	std::stable_sort(candidates.begin(), candidates.end(),
					 [](const CandidateFormat *a, const CandidateFormat *b) {
						 return a->height.value_or(0) > b->height.value_or(0);
					 });

	// Formats without a height never satisfy the ceiling
	auto it = std::find_if(
		candidates.begin(), candidates.end(), [](const CandidateFormat *f) {
			return f->height && *f->height <= kPreferredMaxHeight;
		});
	return it != candidates.end() ? *it : candidates.front();
}

}  // namespace

StreamInfo select_streams(const std::vector<CandidateFormat> &formats) {
	StreamInfo result;

	std::vector<const CandidateFormat *> progressive;
	std::vector<const CandidateFormat *> video_only;
	std::vector<const CandidateFormat *> audio_only;

	static constexpr std::array<std::string_view, 3> kAudioExts = {
		"m4a", "mp4", "webm"};

	for (const auto &f : formats) {
		if (f.has_video() && f.has_audio() && f.ext == "mp4" && has_url(f)) {
			progressive.push_back(&f);
		} else if (f.has_video() && !f.has_audio() && f.ext == "mp4" &&
				   has_url(f)) {
			video_only.push_back(&f);
		} else if (!f.has_video() && f.has_audio() && has_url(f) &&
				   std::find(kAudioExts.begin(), kAudioExts.end(), f.ext) !=
					   kAudioExts.end()) {
			audio_only.push_back(&f);
		}
	}

	result.video = pick_by_height(std::move(progressive));
	if (!result.video) { result.video = pick_by_height(std::move(video_only)); }

	if (!audio_only.empty()) {
		std::stable_sort(audio_only.begin(), audio_only.end(),
						 [](const CandidateFormat *a, const CandidateFormat *b) {
							 return a->abr.value_or(0.0) > b->abr.value_or(0.0);
						 });
		auto it = std::find_if(
			audio_only.begin(), audio_only.end(),
			[](const CandidateFormat *f) { return f->ext == "m4a"; });
		result.audio = it != audio_only.end() ? *it : audio_only.front();
	}

	if (result.video) {
		spdlog::debug("Selected video format {} ({}p, {})",
					  result.video->format_id, result.video->height.value_or(0),
					  result.video->vcodec);
	}
	if (result.audio) {
		spdlog::debug("Selected audio format {} ({}, abr={:.1f})",
					  result.audio->format_id, result.audio->ext,
					  result.audio->abr.value_or(0.0));
	}
	return result;
}

StreamSelection select_stream_urls(const std::vector<CandidateFormat> &formats) {
	auto streams = select_streams(formats);

	StreamSelection selection;
	if (streams.video) selection.video_url = streams.video->url;
	if (streams.audio) {
		selection.audio_url = streams.audio->url;
	} else {
		selection.audio_url = selection.video_url;
	}
	return selection;
}

}  // namespace ytproxy::youtube
