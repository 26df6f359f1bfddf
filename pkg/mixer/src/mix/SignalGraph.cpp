// Repository: RTMix
// Component: Signal Graph
// Purpose: Node bookkeeping, structural validation and log rendering.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/SignalGraph.hpp"

#include <iomanip>
#include <locale>
#include <set>
#include <sstream>

namespace rtmix::mix {

std::string FormatNumber(double value) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  // Fixed notation: ffmpeg duration options do not parse exponents.
  oss << std::fixed << std::setprecision(10) << value;
  std::string text = oss.str();
  const size_t dot = text.find('.');
  if (dot != std::string::npos) {
    const size_t last = text.find_last_not_of('0');
    text.erase(last == dot ? dot : last + 1);
  }
  if (text == "-0") text = "0";
  return text;
}

bool IsValidLabel(const std::string& label) {
  if (label.empty()) return false;
  for (char c : label) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// FilterNode
// -----------------------------------------------------------------------------

FilterNode& FilterNode::Param(const std::string& key, double value) {
  params.push_back({key, FormatNumber(value)});
  return *this;
}

FilterNode& FilterNode::Param(const std::string& key, int64_t value) {
  params.push_back({key, std::to_string(value)});
  return *this;
}

FilterNode& FilterNode::Param(const std::string& key, int value) {
  params.push_back({key, std::to_string(value)});
  return *this;
}

FilterNode& FilterNode::Param(const std::string& key, const std::string& value) {
  params.push_back({key, value});
  return *this;
}

FilterNode& FilterNode::Param(const std::string& key, const char* value) {
  params.push_back({key, std::string(value)});
  return *this;
}

const std::string* FilterNode::Find(const std::string& key) const {
  for (const auto& p : params) {
    if (p.key == key) return &p.value;
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// SignalGraph
// -----------------------------------------------------------------------------

void SignalGraph::AddInput(const std::string& name) {
  inputs_.push_back(name);
}

FilterNode& SignalGraph::AddNode(const std::string& filter,
                                 std::vector<std::string> inputs,
                                 std::vector<std::string> outputs) {
  FilterNode node;
  node.filter = filter;
  node.inputs = std::move(inputs);
  node.outputs = std::move(outputs);
  nodes_.push_back(std::move(node));
  return nodes_.back();
}

int SignalGraph::InputIndex(const std::string& name) const {
  for (size_t i = 0; i < inputs_.size(); ++i) {
    if (inputs_[i] == name) return static_cast<int>(i);
  }
  return -1;
}

bool SignalGraph::ReferencesInput(const std::string& name) const {
  if (InputIndex(name) < 0) return false;
  for (const auto& node : nodes_) {
    for (const auto& in : node.inputs) {
      if (in == name) return true;
    }
  }
  return false;
}

const FilterNode* SignalGraph::FindNode(const std::string& filter) const {
  for (const auto& node : nodes_) {
    if (node.filter == filter) return &node;
  }
  return nullptr;
}

std::vector<const FilterNode*> SignalGraph::FindNodes(const std::string& filter) const {
  std::vector<const FilterNode*> found;
  for (const auto& node : nodes_) {
    if (node.filter == filter) found.push_back(&node);
  }
  return found;
}

bool SignalGraph::Validate(std::string* error) const {
  auto fail = [error](const std::string& reason) {
    if (error != nullptr) *error = reason;
    return false;
  };

  std::set<std::string> available;
  std::set<std::string> consumed;
  for (const auto& in : inputs_) {
    if (!IsValidLabel(in)) return fail("invalid input name '" + in + "'");
    if (!available.insert(in).second) return fail("duplicate input '" + in + "'");
  }

  for (const auto& node : nodes_) {
    if (node.filter.empty() || !IsValidLabel(node.filter)) {
      return fail("invalid filter name '" + node.filter + "'");
    }
    if (node.inputs.empty() || node.outputs.empty()) {
      return fail("node " + node.filter + " has no inputs or no outputs");
    }
    for (const auto& in : node.inputs) {
      if (available.count(in) == 0) {
        return fail("node " + node.filter + " consumes unknown label '" + in + "'");
      }
      if (!consumed.insert(in).second) {
        return fail("label '" + in + "' consumed more than once");
      }
    }
    for (const auto& out : node.outputs) {
      if (!IsValidLabel(out)) return fail("invalid label '" + out + "'");
      if (!available.insert(out).second) {
        return fail("label '" + out + "' produced more than once");
      }
    }
  }

  if (output_.empty() || available.count(output_) == 0) {
    return fail("output label '" + output_ + "' is never produced");
  }
  if (consumed.count(output_) != 0) {
    return fail("output label '" + output_ + "' is consumed inside the graph");
  }
  for (const auto& in : inputs_) {
    if (consumed.count(in) == 0) return fail("input '" + in + "' is never consumed");
  }
  // Any other dangling label would be an unconnected engine pad.
  for (const auto& label : available) {
    if (label != output_ && consumed.count(label) == 0) {
      return fail("label '" + label + "' is produced but never consumed");
    }
  }
  return true;
}

std::string SignalGraph::Describe() const {
  std::ostringstream oss;
  oss << "inputs:";
  for (const auto& in : inputs_) oss << " " << in;
  for (const auto& node : nodes_) {
    oss << "\n  ";
    for (const auto& in : node.inputs) oss << "[" << in << "]";
    oss << " " << node.filter;
    for (size_t i = 0; i < node.params.size(); ++i) {
      oss << (i == 0 ? " " : ":") << node.params[i].key << "=" << node.params[i].value;
    }
    oss << " ";
    for (const auto& out : node.outputs) oss << "[" << out << "]";
  }
  oss << "\n  output: [" << output_ << "]";
  return oss.str();
}

bool SignalGraph::operator==(const SignalGraph& other) const {
  if (inputs_ != other.inputs_ || output_ != other.output_ ||
      nodes_.size() != other.nodes_.size()) {
    return false;
  }
  for (size_t i = 0; i < nodes_.size(); ++i) {
    const auto& a = nodes_[i];
    const auto& b = other.nodes_[i];
    if (a.filter != b.filter || a.inputs != b.inputs || a.outputs != b.outputs ||
        a.params.size() != b.params.size()) {
      return false;
    }
    for (size_t p = 0; p < a.params.size(); ++p) {
      if (a.params[p].key != b.params[p].key || a.params[p].value != b.params[p].value) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace rtmix::mix
