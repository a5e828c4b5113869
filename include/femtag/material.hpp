#pragma once

#include "femtag/tag_registry.hpp"

#include <string>
#include <utility>

namespace femtag {

class Material;

template <>
struct kind_of<Material> : std::integral_constant<EntityKind, EntityKind::Material> {};

using MaterialRegistry = TagRegistry<Material>;

// Base of all materials. material_type is the solver command family
// (uniaxialMaterial, nDMaterial), material_name the concrete model, user_name
// the label shown to the user.
class Material : public Tagged<Material> {
public:
  Material(MaterialRegistry& registry, std::string material_type, std::string material_name,
           std::string user_name)
      : Tagged<Material>(registry, check_user_name(registry, user_name)),
        material_type_(std::move(material_type)),
        material_name_(std::move(material_name)),
        user_name_(std::move(user_name)) {}

  virtual ~Material() = default;

  const std::string& material_type() const { return material_type_; }
  const std::string& material_name() const { return material_name_; }
  const std::string& user_name() const { return user_name_; }

  virtual std::string to_tcl() const = 0;

private:
  // User names are unique among live materials.
  static ErrorCode check_user_name(const MaterialRegistry& registry, const std::string& user_name) {
    const auto* taken =
        registry.find_if([&](const Material& other) { return other.user_name() == user_name; });
    if (taken != nullptr) {
      log::warn("material name '{}' already exists (tag {})", user_name, taken->tag());
      return ErrorCode::AlreadyExists;
    }
    return ErrorCode::Success;
  }

  std::string material_type_;
  std::string material_name_;
  std::string user_name_;
};

} // namespace femtag
