#include "util/log.hpp"

namespace gearopt {

void configureLogging(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace gearopt
