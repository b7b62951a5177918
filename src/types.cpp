#include <ytproxy/types.hpp>

namespace ytproxy {

std::string_view to_string(MediaKind kind) {
	return kind == MediaKind::video ? "video" : "audio";
}

std::optional<MediaKind> parse_media_kind(std::string_view s) {
	if (s == "video") return MediaKind::video;
	if (s == "audio") return MediaKind::audio;
	return std::nullopt;
}

}  // namespace ytproxy
