#pragma once

#include "femtag/damping.hpp"
#include "femtag/material.hpp"
#include "femtag/model_config.hpp"
#include "femtag/pattern.hpp"
#include "femtag/section.hpp"
#include "femtag/time_series.hpp"
#include "femtag/transformation.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <tuple>

namespace femtag {

// One modelling session: an independent tag space per entity kind.
// Entities still live when the Model is destroyed are detached.
class Model {
public:
  Model() = default;

  Model(const Model&) = delete;
  Model& operator=(const Model&) = delete;

  MaterialRegistry& materials() { return std::get<MaterialRegistry>(registries_); }
  DampingRegistry& dampings() { return std::get<DampingRegistry>(registries_); }
  PatternRegistry& patterns() { return std::get<PatternRegistry>(registries_); }
  SectionRegistry& sections() { return std::get<SectionRegistry>(registries_); }
  TimeSeriesRegistry& time_series() { return std::get<TimeSeriesRegistry>(registries_); }
  TransformationRegistry& transformations() { return std::get<TransformationRegistry>(registries_); }

  const MaterialRegistry& materials() const { return std::get<MaterialRegistry>(registries_); }
  const DampingRegistry& dampings() const { return std::get<DampingRegistry>(registries_); }
  const PatternRegistry& patterns() const { return std::get<PatternRegistry>(registries_); }
  const SectionRegistry& sections() const { return std::get<SectionRegistry>(registries_); }
  const TimeSeriesRegistry& time_series() const { return std::get<TimeSeriesRegistry>(registries_); }
  const TransformationRegistry& transformations() const {
    return std::get<TransformationRegistry>(registries_);
  }

  // All or nothing: every start tag is checked against its registry before
  // any registry is renumbered.
  ErrorCode apply(const ModelConfig& config) {
    if (const ErrorCode ec = config.validate(); !ok(ec)) {
      log::warn("model: config has a non-positive start tag");
      return ec;
    }
    ErrorCode capacity = ErrorCode::Success;
    for_each_registry([&](const auto& reg) {
      if (ok(capacity)) {
        capacity = fits(config.start_tag(reg.kind()), reg.size());
      }
    });
    if (!ok(capacity)) {
      log::warn("model: config start tags leave no room for live entities");
      return capacity;
    }

    ErrorCode result = ErrorCode::Success;
    for_each_registry([&](auto& reg) {
      if (ok(result)) {
        result = reg.set_start(config.start_tag(reg.kind()));
      }
    });
    return result;
  }

  void reset() {
    for_each_registry([](auto& reg) { reg.reset(); });
  }

  std::size_t live_count(EntityKind kind) const {
    std::size_t count = 0;
    for_each_registry([&](const auto& reg) {
      if (reg.kind() == kind) {
        count = reg.size();
      }
    });
    return count;
  }

  Material* material_by_name(std::string_view user_name) {
    return materials().find_if([&](const Material& m) { return m.user_name() == user_name; });
  }

  Section* section_by_name(std::string_view user_name) {
    return sections().find_if([&](const Section& s) { return s.user_name() == user_name; });
  }

private:
  template <typename Fn>
  void for_each_registry(Fn&& fn) {
    std::apply([&](auto&... reg) { (fn(reg), ...); }, registries_);
  }

  template <typename Fn>
  void for_each_registry(Fn&& fn) const {
    std::apply([&](const auto&... reg) { (fn(reg), ...); }, registries_);
  }

  static ErrorCode fits(Tag start, std::size_t live) {
    if (static_cast<std::int64_t>(start) + static_cast<std::int64_t>(live) > kMaxTag) {
      return ErrorCode::OutOfRange;
    }
    return ErrorCode::Success;
  }

  std::tuple<MaterialRegistry, DampingRegistry, PatternRegistry, SectionRegistry, TimeSeriesRegistry,
             TransformationRegistry>
      registries_;
};

} // namespace femtag
