// Repository: loopcast
// Component: JSON Field Extraction
// Purpose: Minimal key lookup over JSON text for config and progress files.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_JSON_FIELDS_HPP_
#define LOOPCAST_UTIL_JSON_FIELDS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loopcast::util {

// Minimal parser - only handles the structure loopcast writes and reads.
// Lookups are by key name anywhere in the given text, so callers narrow the
// text to the enclosing object first (JsonGetObject) when keys can repeat.
// A key only matches where it is followed by ':' (never a string value).

std::string JsonEscape(const std::string& s);

std::optional<std::string> JsonGetString(const std::string& json, const std::string& key);
std::optional<int64_t> JsonGetInt(const std::string& json, const std::string& key);
std::optional<double> JsonGetDouble(const std::string& json, const std::string& key);
std::optional<bool> JsonGetBool(const std::string& json, const std::string& key);

// Returns the text of the object value (from '{' to the matching '}').
std::optional<std::string> JsonGetObject(const std::string& json, const std::string& key);

// Returns the text of each object element of an array value.
std::optional<std::vector<std::string>> JsonGetObjectArray(const std::string& json,
                                                           const std::string& key);

std::optional<std::vector<std::string>> JsonGetStringArray(const std::string& json,
                                                           const std::string& key);

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_JSON_FIELDS_HPP_
