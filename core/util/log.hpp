#pragma once

#include <spdlog/spdlog.h>

namespace gearopt {

/// Set the level of the global spdlog logger used by the engine.
/// Messages carry a "[Component]" prefix; progress callbacks remain the
/// machine-readable channel.
void configureLogging(spdlog::level::level_enum level);

} // namespace gearopt
