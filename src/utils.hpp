#pragma once

#include <spdlog/spdlog.h>

#include <boost/charconv.hpp>
#include <chrono>
#include <exception>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <ytproxy/result.hpp>

namespace ytproxy::utils {

// =============================================================================
// Numeric conversions utilizing boost::charconv
// =============================================================================

// The whole input must be consumed; "12abc" and "" are rejected.
template <typename T>
Result<T> to_number(std::string_view sv) {
	T val{};
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

namespace detail {

inline const nlohmann::json *traverse(
	const nlohmann::json *j, std::initializer_list<std::string_view> path) {
	for (auto key : path) {
		if (!j || !j->is_object()) return nullptr;
		auto it = j->find(key);
		if (it == j->end()) return nullptr;
		j = &*it;
	}
	return j;
}

}  // namespace detail

/// Traverse nested JSON objects by key.
/// Returns std::nullopt if the path doesn't exist, holds null, or the value
/// can't be converted to T.
///
/// Usage:
///   auto title = traverse_obj<std::string>(info, {"title"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<std::string_view> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result || result->is_null()) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

template <typename T>
T traverse_obj_default(const nlohmann::json &j,
					   std::initializer_list<std::string_view> path, T default_val) {
	auto result = traverse_obj<T>(j, path);
	return result.value_or(std::move(default_val));
}

// =============================================================================
// Misc
// =============================================================================

inline long long unix_seconds(std::chrono::system_clock::time_point tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(
			   tp.time_since_epoch())
		.count();
}

// Completion handler for detached asio::spawn coroutines.
inline void log_coroutine_exit(std::exception_ptr e) {
	if (!e) return;
	try {
		std::rethrow_exception(e);
	} catch (const std::exception &ex) {
		spdlog::error("Coroutine terminated with exception: {}", ex.what());
	}
}

}  // namespace ytproxy::utils
