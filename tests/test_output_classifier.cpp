#include <gtest/gtest.h>

#include <string>

#include "youtube/output_classifier.hpp"

using namespace ytproxy;
using namespace ytproxy::youtube;

TEST(OutputClassifierTest, EnvironmentFailures) {
	EXPECT_EQ(classify_tool_output(
				  "/usr/bin/env: 'python3': No such file or directory"),
			  FailureKind::environment);
	EXPECT_EQ(classify_tool_output("/usr/bin/env: python: not found"),
			  FailureKind::environment);
	EXPECT_EQ(classify_tool_output("bash: ./yt-dlp: Permission denied"),
			  FailureKind::environment);
	EXPECT_EQ(classify_tool_output("cannot execute binary file: Exec format error"),
			  FailureKind::environment);
}

TEST(OutputClassifierTest, CookieAndBotChecks) {
	EXPECT_EQ(classify_tool_output(
				  "ERROR: [youtube] abc: The provided YouTube account cookies "
				  "are no longer valid. They have likely been rotated in the "
				  "browser as a security measure."),
			  FailureKind::cookies_invalid);

	EXPECT_EQ(classify_tool_output("ERROR: [youtube] abc: Sign in to confirm "
								   "you're not a bot. Use --cookies-from-browser"),
			  FailureKind::bot_check);

	// Typographic apostrophe
	EXPECT_EQ(classify_tool_output("Sign in to confirm you\xE2\x80\x99re not a bot"),
			  FailureKind::bot_check);
}

TEST(OutputClassifierTest, CookiesTakePrecedenceOverBotCheck) {
	EXPECT_EQ(classify_tool_output("cookies are no longer valid; use --cookies"),
			  FailureKind::cookies_invalid);
}

TEST(OutputClassifierTest, LiveAndNotFound) {
	EXPECT_EQ(classify_tool_output(
				  "ERROR: [youtube] abc: This live event will begin in 3 hours."),
			  FailureKind::live_not_started);
	EXPECT_EQ(classify_tool_output("ERROR: [youtube] abc: Video unavailable"),
			  FailureKind::not_found);
	EXPECT_EQ(classify_tool_output("ERROR: [youtube] abc: Private video"),
			  FailureKind::not_found);
	EXPECT_EQ(classify_tool_output("ERROR: Incomplete YouTube ID abc"),
			  FailureKind::not_found);
}

TEST(OutputClassifierTest, TransientAndOther) {
	EXPECT_EQ(classify_tool_output("ERROR: Unable to download webpage: timed out"),
			  FailureKind::transient);
	EXPECT_EQ(classify_tool_output("HTTP Error 503: Service Unavailable"),
			  FailureKind::transient);
	EXPECT_EQ(classify_tool_output("ERROR: something odd happened"),
			  FailureKind::other);
}

TEST(OutputClassifierTest, SpawnErrors) {
	EXPECT_EQ(classify_spawn_error(
				  std::make_error_code(std::errc::no_such_file_or_directory)),
			  FailureKind::environment);
	EXPECT_EQ(
		classify_spawn_error(std::make_error_code(std::errc::permission_denied)),
		FailureKind::environment);
	EXPECT_EQ(classify_spawn_error(
				  std::make_error_code(std::errc::resource_unavailable_try_again)),
			  FailureKind::other);
}

TEST(OutputClassifierTest, ErrorCodes) {
	EXPECT_EQ(to_errc(FailureKind::not_found), errc::video_not_found);
	EXPECT_EQ(to_errc(FailureKind::bot_check), errc::bot_check);
	EXPECT_EQ(to_errc(FailureKind::environment), errc::environment_failure);
	EXPECT_EQ(to_errc(FailureKind::transient), errc::extraction_failed);
	EXPECT_EQ(to_errc(FailureKind::other), errc::extraction_failed);
}

TEST(OutputClassifierTest, ExtractsFirstErrorLine) {
	const std::string out =
		"[youtube] abc: Downloading webpage\n"
		"WARNING: something\n"
		"ERROR: [youtube] dQw4w9WgXcQ: Video unavailable. This video is private\n"
		"ERROR: second\n";
	EXPECT_EQ(extract_error_message(out),
			  "Video unavailable. This video is private");
}

TEST(OutputClassifierTest, ExtractFallsBackToTrimmedText) {
	EXPECT_EQ(extract_error_message("  plain failure \n"), "plain failure");
	EXPECT_EQ(extract_error_message("ERROR: bare message"), "bare message");
}

TEST(OutputClassifierTest, ExtractCapsLength) {
	const std::string out = "ERROR: " + std::string(5000, 'x');
	EXPECT_EQ(extract_error_message(out).size(), 2000u);
}
