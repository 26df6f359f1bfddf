// Repository: RTMix
// Component: Filter Graph Serializer
// Purpose: Render a SignalGraph in ffmpeg -filter_complex syntax.
// Copyright (c) 2025 RetroVue

#include "rtmix/engine/FilterGraphSerializer.hpp"

#include <sstream>

namespace rtmix::engine {

namespace {

std::string EscapeChars(const std::string& text, const char* specials) {
  std::string out;
  out.reserve(text.size() + 4);
  for (char c : text) {
    for (const char* s = specials; *s != '\0'; ++s) {
      if (c == *s) {
        out += '\\';
        break;
      }
    }
    out += c;
  }
  return out;
}

// Named inputs map to "<index>:a"; anything else is an internal link label.
std::string LinkLabel(const mix::SignalGraph& graph, const std::string& label) {
  const int index = graph.InputIndex(label);
  if (index >= 0) {
    return "[" + std::to_string(index) + ":a]";
  }
  return "[" + label + "]";
}

}  // namespace

std::string EscapeOptionValue(const std::string& value) {
  return EscapeChars(value, "\\':");
}

std::string EscapeGraphText(const std::string& text) {
  return EscapeChars(text, "\\'[],;");
}

std::string SerializeFilterComplex(const mix::SignalGraph& graph) {
  std::ostringstream oss;
  bool first_node = true;
  for (const auto& node : graph.nodes()) {
    if (!first_node) oss << ";";
    first_node = false;

    for (const auto& in : node.inputs) oss << LinkLabel(graph, in);
    oss << node.filter;
    for (size_t i = 0; i < node.params.size(); ++i) {
      const auto& param = node.params[i];
      oss << (i == 0 ? "=" : ":") << param.key << "="
          << EscapeGraphText(EscapeOptionValue(param.value));
    }
    for (const auto& out : node.outputs) oss << "[" << out << "]";
  }
  return oss.str();
}

}  // namespace rtmix::engine
