#pragma once

#include "femtag/tag_registry.hpp"

#include <string>

namespace femtag {

class Damping;

template <>
struct kind_of<Damping> : std::integral_constant<EntityKind, EntityKind::Damping> {};

using DampingRegistry = TagRegistry<Damping>;

class Damping : public Tagged<Damping> {
public:
  explicit Damping(DampingRegistry& registry)
      : Tagged<Damping>(registry) {}

  virtual ~Damping() = default;

  virtual std::string to_tcl() const = 0;
};

} // namespace femtag
