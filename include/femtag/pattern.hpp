#pragma once

#include "femtag/tag_registry.hpp"

#include <string>
#include <utility>

namespace femtag {

class Pattern;

template <>
struct kind_of<Pattern> : std::integral_constant<EntityKind, EntityKind::Pattern> {};

using PatternRegistry = TagRegistry<Pattern>;

// Load pattern (Plain, UniformExcitation, H5DRM, ...).
class Pattern : public Tagged<Pattern> {
public:
  Pattern(PatternRegistry& registry, std::string pattern_type)
      : Tagged<Pattern>(registry),
        pattern_type_(std::move(pattern_type)) {}

  virtual ~Pattern() = default;

  const std::string& pattern_type() const { return pattern_type_; }

  virtual std::string to_tcl() const = 0;

private:
  std::string pattern_type_;
};

} // namespace femtag
