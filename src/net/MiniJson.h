#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <utility>
#include <vector>

// Minimal JSON helpers for flat lookups in API responses. Only keys of the
// outermost object are matched. Malformed input throws std::runtime_error.

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key);
std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
std::string json_extract_string(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);

// Raw text of the value stored under `key` (object, array, string or scalar).
std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key);

// Raw text of each element of a JSON array.
std::vector<std::string> json_split_array(const std::string& array_js);
