#include "youtube/output_classifier.hpp"

#include <algorithm>
#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <cerrno>

namespace ytproxy::youtube {

namespace {

constexpr std::size_t kMaxMessageLength = 2000;

std::string normalize(std::string_view text) {
	std::string out = boost::algorithm::to_lower_copy(std::string(text));
	boost::algorithm::replace_all(out, "\xE2\x80\x99", "'");  // U+2019
	return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
	return haystack.find(needle) != std::string_view::npos;
}

template <std::size_t N>
bool contains_any(std::string_view haystack,
				  const std::array<std::string_view, N> &needles) {
	return std::any_of(needles.begin(), needles.end(),
					   [&](std::string_view n) { return contains(haystack, n); });
}

bool is_environment_problem(std::string_view t) {
	if (contains(t, "python3") && contains(t, "no such file or directory")) {
		return true;
	}
	if (contains(t, "/usr/bin/env") && contains(t, "python") &&
		contains(t, "not found")) {
		return true;
	}
	if (contains(t, "spawn") && contains(t, "enoent")) return true;

	static constexpr std::array<std::string_view, 4> kSignatures = {
		"eacces", "permission denied", "exec format error", "bad interpreter"};
	return contains_any(t, kSignatures);
}

}  // namespace

std::string_view to_string(FailureKind kind) {
	switch (kind) {
		case FailureKind::environment: return "environment";
		case FailureKind::cookies_invalid: return "cookies_invalid";
		case FailureKind::bot_check: return "bot_check";
		case FailureKind::live_not_started: return "live_not_started";
		case FailureKind::not_found: return "not_found";
		case FailureKind::transient: return "transient";
		case FailureKind::other: return "other";
	}
	return "other";
}

FailureKind classify_tool_output(std::string_view text) {
	const std::string t = normalize(text);

	if (is_environment_problem(t)) return FailureKind::environment;

	static constexpr std::array<std::string_view, 2> kCookies = {
		"cookies are no longer valid", "likely been rotated in the browser"};
	if (contains_any(t, kCookies)) return FailureKind::cookies_invalid;

	static constexpr std::array<std::string_view, 4> kBotCheck = {
		"confirm you're not a bot", "please sign in to continue",
		"cookies-from-browser", "use --cookies"};
	if (contains_any(t, kBotCheck)) return FailureKind::bot_check;

	if (contains(t, "this live event will begin in")) {
		return FailureKind::live_not_started;
	}

	static constexpr std::array<std::string_view, 8> kNotFound = {
		"video unavailable",
		"this video is unavailable",
		"private video",
		"this video has been removed",
		"incomplete youtube id",
		"is not a valid url",
		"does not exist",
		"http error 404"};
	if (contains_any(t, kNotFound)) return FailureKind::not_found;

	static constexpr std::array<std::string_view, 7> kTransient = {
		"timed out",
		"connection reset",
		"temporary failure in name resolution",
		"unable to download",
		"http error 5",
		"network is unreachable",
		"remote end closed connection"};
	if (contains_any(t, kTransient)) return FailureKind::transient;

	return FailureKind::other;
}

FailureKind classify_spawn_error(const std::error_code &ec) {
	if (ec == std::errc::no_such_file_or_directory ||
		ec == std::errc::permission_denied ||
		ec == std::errc::executable_format_error) {
		return FailureKind::environment;
	}
	return FailureKind::other;
}

errc to_errc(FailureKind kind) {
	switch (kind) {
		case FailureKind::environment: return errc::environment_failure;
		case FailureKind::cookies_invalid: return errc::cookies_invalid;
		case FailureKind::bot_check: return errc::bot_check;
		case FailureKind::live_not_started: return errc::live_not_started;
		case FailureKind::not_found: return errc::video_not_found;
		case FailureKind::transient:
		case FailureKind::other: return errc::extraction_failed;
	}
	return errc::extraction_failed;
}

std::string extract_error_message(std::string_view text) {
	std::string line;
	std::size_t pos = 0;
	while (pos <= text.size()) {
		auto end = text.find('\n', pos);
		if (end == std::string_view::npos) end = text.size();
		std::string candidate(text.substr(pos, end - pos));
		boost::algorithm::trim(candidate);
		if (boost::algorithm::starts_with(candidate, "ERROR:")) {
			line = std::move(candidate);
			break;
		}
		pos = end + 1;
	}
	if (line.empty()) {
		line = boost::algorithm::trim_copy(std::string(text));
	}

	static const boost::regex kPrefix(
		R"(^ERROR:\s*(?:\[[^\]]+\]\s*)?(?:[A-Za-z0-9_-]{11}:)?\s*)",
		boost::regex::icase);
	std::string cleaned = boost::regex_replace(
		line, kPrefix, "", boost::format_first_only);

	if (cleaned.size() > kMaxMessageLength) cleaned.resize(kMaxMessageLength);
	return cleaned;
}

}  // namespace ytproxy::youtube
