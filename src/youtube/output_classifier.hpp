#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <ytproxy/result.hpp>

namespace ytproxy::youtube {

enum class FailureKind : std::uint8_t {
	environment,  // Tool cannot run here (interpreter missing, not executable)
	cookies_invalid,
	bot_check,
	live_not_started,
	not_found,
	transient,	// Network hiccup worth retrying
	other
};

std::string_view to_string(FailureKind kind);

/// Classifies the combined stderr/stdout text of a failed tool run.
/// Matching is case-insensitive; typographic apostrophes are normalized.
FailureKind classify_tool_output(std::string_view text);

/// Classifies an error raised while spawning the tool process.
FailureKind classify_spawn_error(const std::error_code &ec);

/// Maps a failure kind to the error reported to callers.
errc to_errc(FailureKind kind);

/// First "ERROR:" line of the tool output with the "ERROR: [extractor] id:"
/// prefix stripped, capped at 2000 characters. Falls back to the trimmed
/// text when no such line exists.
std::string extract_error_message(std::string_view text);

}  // namespace ytproxy::youtube
