#include "youtube/ytdlp_json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

#include "utils.hpp"

namespace ytproxy::youtube {

namespace {

CandidateFormat parse_format(const nlohmann::json &f) {
	CandidateFormat format;
	format.format_id = utils::traverse_obj_default<std::string>(f, {"format_id"}, "");
	format.url = utils::traverse_obj_default<std::string>(f, {"url"}, "");
	format.ext = utils::traverse_obj_default<std::string>(f, {"ext"}, "");
	format.vcodec = utils::traverse_obj_default<std::string>(f, {"vcodec"}, "");
	format.acodec = utils::traverse_obj_default<std::string>(f, {"acodec"}, "");
	format.width = utils::traverse_obj<int>(f, {"width"});
	format.height = utils::traverse_obj<int>(f, {"height"});
	format.fps = utils::traverse_obj<double>(f, {"fps"});
	format.abr = utils::traverse_obj<double>(f, {"abr"});
	format.tbr = utils::traverse_obj<double>(f, {"tbr"});
	format.quality = utils::traverse_obj<double>(f, {"quality"});
	format.filesize = utils::traverse_obj<long long>(f, {"filesize"});
	if (!format.filesize) {
		format.filesize = utils::traverse_obj<long long>(f, {"filesize_approx"});
	}
	format.format_note =
		utils::traverse_obj_default<std::string>(f, {"format_note"}, "");
	format.protocol = utils::traverse_obj_default<std::string>(f, {"protocol"}, "");
	return format;
}

nlohmann::json quality_json(const CandidateFormat &f) {
	if (!f.format_note.empty()) return f.format_note;
	if (f.quality && *f.quality != 0.0) return json_number(*f.quality);
	return "unknown";
}

}  // namespace

nlohmann::json json_number(double value) {
	double whole = 0.0;
	if (std::modf(value, &whole) == 0.0 && std::abs(whole) < 9.0e15) {
		return static_cast<long long>(whole);
	}
	return value;
}

Result<ExtractionResult> parse_extraction_json(std::string_view text) {
	auto info = nlohmann::json::parse(text, nullptr, false);
	if (info.is_discarded() || !info.is_object()) {
		spdlog::warn("Extraction output is not a JSON object ({} bytes)",
					 text.size());
		return outcome::failure(errc::json_parse_error);
	}

	ExtractionResult result;
	result.id = utils::traverse_obj_default<std::string>(info, {"id"}, "");
	result.title = utils::traverse_obj_default<std::string>(info, {"title"}, "");
	result.description =
		utils::traverse_obj_default<std::string>(info, {"description"}, "");
	result.thumbnail =
		utils::traverse_obj_default<std::string>(info, {"thumbnail"}, "");
	result.channel = utils::traverse_obj_default<std::string>(info, {"channel"}, "");
	result.channel_id =
		utils::traverse_obj_default<std::string>(info, {"channel_id"}, "");
	result.upload_date =
		utils::traverse_obj_default<std::string>(info, {"upload_date"}, "");
	result.live_status =
		utils::traverse_obj_default<std::string>(info, {"live_status"}, "");
	result.duration = utils::traverse_obj_default<double>(info, {"duration"}, 0.0);
	result.view_count =
		utils::traverse_obj_default<long long>(info, {"view_count"}, 0);

	if (auto formats = info.find("formats");
		formats != info.end() && formats->is_array()) {
		result.formats.reserve(formats->size());
		for (const auto &f : *formats) {
			if (!f.is_object()) continue;
			result.formats.push_back(parse_format(f));
		}
	}

	spdlog::debug("Parsed extraction for {}: {} formats", result.id,
				  result.formats.size());
	return result;
}

void to_json(nlohmann::json &j, const CandidateFormat &f) {
	j = nlohmann::json{{"formatId", f.format_id},
					   {"ext", f.ext},
					   {"quality", quality_json(f)},
					   {"vcodec", f.vcodec},
					   {"acodec", f.acodec}};

	// Explicit null handling
	j["width"] = f.width ? nlohmann::json(*f.width) : nlohmann::json(nullptr);
	j["height"] = f.height ? nlohmann::json(*f.height) : nlohmann::json(nullptr);
	j["fps"] = f.fps ? nlohmann::json(*f.fps) : nlohmann::json(nullptr);
	j["abr"] = f.abr ? nlohmann::json(*f.abr) : nlohmann::json(nullptr);
	j["filesize"] =
		f.filesize ? nlohmann::json(*f.filesize) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json &j, const ExtractionResult &r) {
	nlohmann::json formats_json = nlohmann::json::array();
	for (const auto &f : r.formats) {
		nlohmann::json fmt_j;
		to_json(fmt_j, f);
		formats_json.push_back(std::move(fmt_j));
	}

	j = nlohmann::json{{"id", r.id},
					   {"title", r.title},
					   {"description", r.description},
					   {"thumbnailUrl", r.thumbnail},
					   {"duration", json_number(r.duration)},
					   {"viewCount", r.view_count},
					   {"channelId", r.channel_id},
					   {"channelTitle", r.channel},
					   {"uploadDate", r.upload_date},
					   {"formats", formats_json}};
}

}  // namespace ytproxy::youtube
