#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <ytproxy/result.hpp>
#include <ytproxy/types.hpp>

namespace ytproxy::youtube {

/// Parses the single JSON document printed by `yt-dlp --dump-single-json`.
Result<ExtractionResult> parse_extraction_json(std::string_view text);

/// Whole numbers as JSON integers ("212", not "212.0").
nlohmann::json json_number(double value);

// JSON Serialization for the metadata endpoint. Format URLs are left out.
void to_json(nlohmann::json &j, const CandidateFormat &f);
void to_json(nlohmann::json &j, const ExtractionResult &r);

}  // namespace ytproxy::youtube
