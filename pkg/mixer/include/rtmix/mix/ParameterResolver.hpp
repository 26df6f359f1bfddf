// Repository: RTMix
// Component: Parameter Resolver
// Purpose: Collapse query-style, form-style and default knob values into one MixRequest.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_PARAMETER_RESOLVER_HPP_
#define RTMIX_MIX_PARAMETER_RESOLVER_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rtmix/mix/MixRequest.hpp"

namespace rtmix::mix {

// Raw knob values as the transport delivered them (key → text).
using KnobSource = std::map<std::string, std::string>;

// ParameterResolver turns up to two candidate sources into a MixRequest.
//
// Precedence per knob: primary > secondary > compiled default. A candidate is
// present when its key exists with non-blank text. The first present
// candidate is coerced; if coercion fails (unparsable text, non-finite value,
// or a value that breaks the field's invariant) the knob takes its default.
// It does not fall through to the secondary source.
//
// Flags are parsed as integers: exactly 1 is true, anything else (including
// unparsable text) is false.
//
// Resolve() never fails and never throws.
class ParameterResolver {
 public:
  struct KnobInfo {
    std::string key;                   // canonical key
    std::vector<std::string> aliases;  // legacy spellings, lower precedence
    bool is_flag;
  };

  static MixRequest Resolve(const KnobSource& primary,
                            const KnobSource& secondary = {});

  // Every knob the resolver understands, in declaration order.
  static const std::vector<KnobInfo>& Knobs();

  // Whole-string decimal parse; nullopt for blank, trailing junk, inf or nan.
  static std::optional<double> ParseNumber(const std::string& text);

  // Integer parse; true only for exactly 1.
  static bool ParseFlag(const std::string& text);

 private:
  // First present value for key (canonical before aliases) in one source.
  static std::optional<std::string> Lookup(const KnobSource& source,
                                           const KnobInfo& knob);
};

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_PARAMETER_RESOLVER_HPP_
