#pragma once

#include "femtag/error.hpp"
#include "femtag/tag_types.hpp"

#include <array>

namespace femtag {

// Per-session numbering. The log threshold is process-wide and is set with
// log::set_level, not here.
struct ModelConfig {
  // Indexed by entity_kind_index().
  std::array<Tag, kEntityKindCount> start_tags{kDefaultStartTag, kDefaultStartTag, kDefaultStartTag,
                                               kDefaultStartTag, kDefaultStartTag, kDefaultStartTag};

  Tag start_tag(EntityKind kind) const {
    return start_tags[entity_kind_index(kind)];
  }

  ModelConfig& with_start_tag(EntityKind kind, Tag start) {
    start_tags[entity_kind_index(kind)] = start;
    return *this;
  }

  // Checks the start tags only; capacity against live entities is checked
  // when the config is applied.
  ErrorCode validate() const {
    for (const Tag start : start_tags) {
      if (start <= 0) {
        return ErrorCode::InvalidArgument;
      }
    }
    return ErrorCode::Success;
  }
};

} // namespace femtag
