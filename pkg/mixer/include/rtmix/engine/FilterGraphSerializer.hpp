// Repository: RTMix
// Component: Filter Graph Serializer
// Purpose: Render a SignalGraph in ffmpeg -filter_complex syntax.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_ENGINE_FILTER_GRAPH_SERIALIZER_HPP_
#define RTMIX_ENGINE_FILTER_GRAPH_SERIALIZER_HPP_

#include <string>

#include "rtmix/mix/SignalGraph.hpp"

namespace rtmix::engine {

// Serializes nodes as "[a][b]filter=k=v:k=v[out]" joined by ';'. Named
// inputs become "[<index>:a]" in submission order. Parameter values are
// escaped at both ffmpeg levels (option value, then filtergraph), so text
// can never introduce extra options, filters or links.
//
// The graph must pass SignalGraph::Validate(); labels are emitted verbatim.
std::string SerializeFilterComplex(const mix::SignalGraph& graph);

// First escaping level: characters special inside an option value.
std::string EscapeOptionValue(const std::string& value);

// Second escaping level: characters special to the filtergraph parser.
std::string EscapeGraphText(const std::string& text);

}  // namespace rtmix::engine

#endif  // RTMIX_ENGINE_FILTER_GRAPH_SERIALIZER_HPP_
