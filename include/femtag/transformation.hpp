#pragma once

#include "femtag/tag_registry.hpp"

#include <string>
#include <utility>

namespace femtag {

class Transformation;

template <>
struct kind_of<Transformation> : std::integral_constant<EntityKind, EntityKind::Transformation> {};

using TransformationRegistry = TagRegistry<Transformation>;

// Geometric transformation (Linear, PDelta, Corotational) for 2D or 3D frames.
class Transformation : public Tagged<Transformation> {
public:
  Transformation(TransformationRegistry& registry, std::string transf_type, int dimension)
      : Tagged<Transformation>(registry),
        transf_type_(std::move(transf_type)),
        dimension_(dimension) {}

  virtual ~Transformation() = default;

  const std::string& transf_type() const { return transf_type_; }
  int dimension() const { return dimension_; }

  virtual std::string to_tcl() const = 0;

private:
  std::string transf_type_;
  int dimension_ = 3;
};

} // namespace femtag
