#pragma once

#include "femtag/damping.hpp"
#include "femtag/error.hpp"
#include "femtag/log.hpp"
#include "femtag/material.hpp"
#include "femtag/model.hpp"
#include "femtag/model_config.hpp"
#include "femtag/pattern.hpp"
#include "femtag/section.hpp"
#include "femtag/tag_registry.hpp"
#include "femtag/tag_types.hpp"
#include "femtag/time_series.hpp"
#include "femtag/transformation.hpp"
