// Repository: RTMix
// Component: JSON Field Extraction
// Purpose: Minimal extractors for the fixed, flat config schemas.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_UTIL_JSON_FIELDS_HPP_
#define RTMIX_UTIL_JSON_FIELDS_HPP_

#include <cstdint>
#include <string>

namespace rtmix::util {

// The config schemas are fixed and shallow, so they are parsed manually
// rather than adding a JSON dependency. Field names are assumed unique
// within the object passed in.

// True when "field_name": appears in json.
bool HasJsonField(const std::string& json, const std::string& field_name);

bool ExtractJsonInt(const std::string& json, const std::string& field_name,
                    int64_t& out_value);
bool ExtractJsonNumber(const std::string& json, const std::string& field_name,
                       double& out_value);
bool ExtractJsonString(const std::string& json, const std::string& field_name,
                       std::string& out_value);
bool ExtractJsonBool(const std::string& json, const std::string& field_name,
                     bool& out_value);

// Extract a nested object ("name": { ... }) including its braces.
bool ExtractJsonObject(const std::string& json, const std::string& field_name,
                       std::string& out_json);

std::string JsonEscape(const std::string& s);

}  // namespace rtmix::util

#endif  // RTMIX_UTIL_JSON_FIELDS_HPP_
