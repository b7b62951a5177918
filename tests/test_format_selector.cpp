#include <gtest/gtest.h>

#include <ytproxy/format_selector.hpp>

#include "support/fakes.hpp"

using namespace ytproxy;
using namespace ytproxy::youtube;
using ytproxy::testing::make_format;

TEST(FormatSelectorTest, PrefersProgressiveAtOrBelow720p) {
	std::vector<CandidateFormat> formats = {
		make_format("37", "mp4", "avc1", "mp4a", 1080),
		make_format("22", "mp4", "avc1", "mp4a", 720),
		make_format("18", "mp4", "avc1", "mp4a", 360),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.video, nullptr);
	EXPECT_EQ(streams.video->format_id, "22");
}

TEST(FormatSelectorTest, FallsBackToTallestWhenAllExceedCeiling) {
	std::vector<CandidateFormat> formats = {
		make_format("a", "mp4", "avc1", "mp4a", 1080),
		make_format("b", "mp4", "avc1", "mp4a", 1440),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.video, nullptr);
	EXPECT_EQ(streams.video->format_id, "b");
}

TEST(FormatSelectorTest, IgnoresNonMp4AndUrlLessProgressive) {
	auto no_url = make_format("22", "mp4", "avc1", "mp4a", 720);
	no_url.url.clear();
	std::vector<CandidateFormat> formats = {
		make_format("43", "webm", "vp8", "vorbis", 360),
		no_url,
		make_format("18", "mp4", "avc1", "mp4a", 360),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.video, nullptr);
	EXPECT_EQ(streams.video->format_id, "18");
}

TEST(FormatSelectorTest, UsesVideoOnlyWhenNoProgressive) {
	std::vector<CandidateFormat> formats = {
		make_format("137", "mp4", "avc1", "none", 1080),
		make_format("136", "mp4", "avc1", "none", 720),
		make_format("248", "webm", "vp9", "none", 1080),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.video, nullptr);
	EXPECT_EQ(streams.video->format_id, "136");
}

TEST(FormatSelectorTest, PrefersM4aOverHigherBitrateWebm) {
	std::vector<CandidateFormat> formats = {
		make_format("251", "webm", "none", "opus", std::nullopt, 160.0),
		make_format("140", "m4a", "none", "mp4a", std::nullopt, 129.5),
		make_format("139", "m4a", "none", "mp4a", std::nullopt, 48.0),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.audio, nullptr);
	EXPECT_EQ(streams.audio->format_id, "140");
}

TEST(FormatSelectorTest, TakesHighestBitrateWithoutM4a) {
	std::vector<CandidateFormat> formats = {
		make_format("250", "webm", "none", "opus", std::nullopt, 70.0),
		make_format("251", "webm", "none", "opus", std::nullopt, 160.0),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.audio, nullptr);
	EXPECT_EQ(streams.audio->format_id, "251");
	EXPECT_EQ(streams.video, nullptr);
}

TEST(FormatSelectorTest, CombinedUrlDoublesAsAudio) {
	std::vector<CandidateFormat> formats = {
		make_format("18", "mp4", "avc1", "mp4a", 360),
	};

	auto selection = select_stream_urls(formats);
	ASSERT_TRUE(selection.video_url.has_value());
	ASSERT_TRUE(selection.audio_url.has_value());
	EXPECT_EQ(*selection.audio_url, *selection.video_url);
}

TEST(FormatSelectorTest, NothingUsable) {
	std::vector<CandidateFormat> formats = {
		make_format("sb0", "mhtml", "none", "none", std::nullopt),
	};

	auto selection = select_stream_urls(formats);
	EXPECT_FALSE(selection.video_url.has_value());
	EXPECT_FALSE(selection.audio_url.has_value());
}

TEST(FormatSelectorTest, EmptyCodecCountsAsPresent) {
	// Tools sometimes omit codec fields entirely
	std::vector<CandidateFormat> formats = {
		make_format("x", "mp4", "", "", 480),
	};

	auto streams = select_streams(formats);
	ASSERT_NE(streams.video, nullptr);
	EXPECT_EQ(streams.video->format_id, "x");
}
