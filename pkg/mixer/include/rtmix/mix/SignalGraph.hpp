// Repository: RTMix
// Component: Signal Graph
// Purpose: Declarative, engine-neutral description of one stage's filter network.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_SIGNAL_GRAPH_HPP_
#define RTMIX_MIX_SIGNAL_GRAPH_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace rtmix::mix {

// One filter parameter. Values are rendered to text at insertion so the
// graph is byte-for-byte deterministic for identical inputs.
struct FilterParam {
  std::string key;
  std::string value;
};

// FilterNode is one processing node: an engine filter name, its ordered
// parameters, and the stream labels it consumes and produces.
struct FilterNode {
  std::string filter;
  std::vector<FilterParam> params;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;

  FilterNode& Param(const std::string& key, double value);
  FilterNode& Param(const std::string& key, int64_t value);
  FilterNode& Param(const std::string& key, int value);
  FilterNode& Param(const std::string& key, const std::string& value);
  FilterNode& Param(const std::string& key, const char* value);

  // Value for key, or nullptr.
  const std::string* Find(const std::string& key) const;
};

// SignalGraph holds named inputs (one per submitted file, in submission
// order), filter nodes in evaluation order, and the one output label the
// engine encodes.
//
// Labels: [A-Za-z0-9_]+. Each label is produced once and consumed once;
// fan-out is modelled with an explicit split node.
class SignalGraph {
 public:
  void AddInput(const std::string& name);

  // Appends a node and returns it for Param() chaining. The reference is
  // valid until the next AddNode().
  FilterNode& AddNode(const std::string& filter,
                      std::vector<std::string> inputs,
                      std::vector<std::string> outputs);

  void SetOutput(const std::string& label) { output_ = label; }

  const std::vector<std::string>& inputs() const { return inputs_; }
  const std::vector<FilterNode>& nodes() const { return nodes_; }
  const std::string& output() const { return output_; }

  // Index of a named input in submission order, or -1.
  int InputIndex(const std::string& name) const;

  // True when the graph declares the input and some node consumes it.
  bool ReferencesInput(const std::string& name) const;

  // First node using filter, or nullptr.
  const FilterNode* FindNode(const std::string& filter) const;
  std::vector<const FilterNode*> FindNodes(const std::string& filter) const;

  // Structural check: labels well-formed; every consumed label is an input
  // or produced earlier; nothing consumed twice; the output is produced and
  // not consumed; every input is consumed. On failure writes a reason.
  bool Validate(std::string* error) const;

  // Multi-line human-readable rendering for logs.
  std::string Describe() const;

  bool operator==(const SignalGraph& other) const;
  bool operator!=(const SignalGraph& other) const { return !(*this == other); }

 private:
  std::vector<std::string> inputs_;
  std::vector<FilterNode> nodes_;
  std::string output_;
};

// Deterministic, locale-independent number rendering used for parameters.
// Always fixed notation with trailing zeros trimmed (5e-05 → "0.00005");
// ten fractional digits at most.
std::string FormatNumber(double value);

bool IsValidLabel(const std::string& label);

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_SIGNAL_GRAPH_HPP_
