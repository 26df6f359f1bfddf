// Repository: RTMix
// Component: JSON Field Extraction
// Purpose: Minimal extractors for the fixed, flat config schemas.
// Copyright (c) 2025 RetroVue

#include "rtmix/util/JsonFields.hpp"

#include <regex>
#include <stdexcept>

namespace rtmix::util {

namespace {

// Position just past `"field_name"\s*:\s*`, or npos.
size_t ValueStart(const std::string& json, const std::string& field_name) {
  std::regex pattern("\"" + field_name + "\"\\s*:\\s*");
  std::smatch match;
  if (!std::regex_search(json, match, pattern)) {
    return std::string::npos;
  }
  return static_cast<size_t>(match.position() + match.length());
}

}  // namespace

bool HasJsonField(const std::string& json, const std::string& field_name) {
  return ValueStart(json, field_name) != std::string::npos;
}

bool ExtractJsonInt(const std::string& json, const std::string& field_name,
                    int64_t& out_value) {
  std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)\\s*[,}]");
  std::smatch match;
  if (!std::regex_search(json, match, pattern)) return false;
  try {
    out_value = std::stoll(match[1].str());
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool ExtractJsonNumber(const std::string& json, const std::string& field_name,
                       double& out_value) {
  std::regex pattern("\"" + field_name +
                     "\"\\s*:\\s*(-?\\d+(?:\\.\\d+)?(?:[eE][+-]?\\d+)?)\\s*[,}]");
  std::smatch match;
  if (!std::regex_search(json, match, pattern)) return false;
  try {
    out_value = std::stod(match[1].str());
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool ExtractJsonString(const std::string& json, const std::string& field_name,
                       std::string& out_value) {
  size_t pos = ValueStart(json, field_name);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return false;
  }
  std::string value;
  for (size_t i = pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\' && i + 1 < json.size()) {
      const char next = json[i + 1];
      if (next == '"' || next == '\\' || next == '/') { value += next; ++i; continue; }
      if (next == 'n') { value += '\n'; ++i; continue; }
      if (next == 't') { value += '\t'; ++i; continue; }
      return false;
    }
    if (json[i] == '"') {
      out_value = value;
      return true;
    }
    value += json[i];
  }
  return false;
}

bool ExtractJsonBool(const std::string& json, const std::string& field_name,
                     bool& out_value) {
  size_t pos = ValueStart(json, field_name);
  if (pos == std::string::npos) return false;
  if (json.compare(pos, 4, "true") == 0) {
    out_value = true;
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    out_value = false;
    return true;
  }
  return false;
}

bool ExtractJsonObject(const std::string& json, const std::string& field_name,
                       std::string& out_json) {
  size_t start_pos = ValueStart(json, field_name);
  if (start_pos == std::string::npos || start_pos >= json.size() ||
      json[start_pos] != '{') {
    return false;
  }

  int brace_count = 1;
  size_t pos = start_pos + 1;
  while (pos < json.size() && brace_count > 0) {
    if (json[pos] == '{') brace_count++;
    else if (json[pos] == '}') brace_count--;
    pos++;
  }

  if (brace_count != 0) return false;
  out_json = json.substr(start_pos, pos - start_pos);
  return true;
}

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

}  // namespace rtmix::util
