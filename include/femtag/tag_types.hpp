#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace femtag {

// Solver-facing handle. Scripts reference entities by plain int.
using Tag = std::int32_t;
using CreationOrder = std::uint64_t;

constexpr Tag kInvalidTag = 0;
constexpr Tag kDefaultStartTag = 1;
constexpr Tag kMaxTag = std::numeric_limits<Tag>::max();

enum class EntityKind : std::uint8_t {
  Material,
  Damping,
  Pattern,
  Section,
  TimeSeries,
  Transformation,
};

constexpr std::size_t kEntityKindCount = 6;

constexpr std::string_view entity_kind_name(EntityKind kind) {
  switch (kind) {
    case EntityKind::Material:       return "material";
    case EntityKind::Damping:        return "damping";
    case EntityKind::Pattern:        return "pattern";
    case EntityKind::Section:        return "section";
    case EntityKind::TimeSeries:     return "time series";
    case EntityKind::Transformation: return "transformation";
  }
  return "unknown";
}

constexpr std::size_t entity_kind_index(EntityKind kind) {
  return static_cast<std::size_t>(kind);
}

// Maps an entity base class to its kind. Each kind header specializes this.
template <typename T>
struct kind_of;

template <typename T>
inline constexpr EntityKind kind_of_v = kind_of<T>::value;

} // namespace femtag
