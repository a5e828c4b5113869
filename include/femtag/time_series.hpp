#pragma once

#include "femtag/tag_registry.hpp"

#include <string>
#include <utility>

namespace femtag {

class TimeSeries;

template <>
struct kind_of<TimeSeries> : std::integral_constant<EntityKind, EntityKind::TimeSeries> {};

using TimeSeriesRegistry = TagRegistry<TimeSeries>;

class TimeSeries : public Tagged<TimeSeries> {
public:
  TimeSeries(TimeSeriesRegistry& registry, std::string series_type)
      : Tagged<TimeSeries>(registry),
        series_type_(std::move(series_type)) {}

  virtual ~TimeSeries() = default;

  const std::string& series_type() const { return series_type_; }

  virtual std::string to_tcl() const = 0;

private:
  std::string series_type_;
};

} // namespace femtag
