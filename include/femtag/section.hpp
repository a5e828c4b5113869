#pragma once

#include "femtag/tag_registry.hpp"

#include <string>
#include <utility>

namespace femtag {

class Section;

template <>
struct kind_of<Section> : std::integral_constant<EntityKind, EntityKind::Section> {};

using SectionRegistry = TagRegistry<Section>;

class Section : public Tagged<Section> {
public:
  Section(SectionRegistry& registry, std::string section_type, std::string section_name,
          std::string user_name)
      : Tagged<Section>(registry, check_user_name(registry, user_name)),
        section_type_(std::move(section_type)),
        section_name_(std::move(section_name)),
        user_name_(std::move(user_name)) {}

  virtual ~Section() = default;

  const std::string& section_type() const { return section_type_; }
  const std::string& section_name() const { return section_name_; }
  const std::string& user_name() const { return user_name_; }

  virtual std::string to_tcl() const = 0;

private:
  // User names are unique among live sections.
  static ErrorCode check_user_name(const SectionRegistry& registry, const std::string& user_name) {
    const auto* taken =
        registry.find_if([&](const Section& other) { return other.user_name() == user_name; });
    if (taken != nullptr) {
      log::warn("section name '{}' already exists (tag {})", user_name, taken->tag());
      return ErrorCode::AlreadyExists;
    }
    return ErrorCode::Success;
  }

  std::string section_type_;
  std::string section_name_;
  std::string user_name_;
};

} // namespace femtag
