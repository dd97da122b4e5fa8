#include <pgtemp/temp_db/options.h>

#include <spdlog/spdlog.h>

namespace pgtemp {

void Verbosity::progress(const std::string& message, int level) const {
    if (enabled(level)) {
        spdlog::info("{}", message);
    }
}

void Verbosity::warn(const std::string& message, int level) const {
    if (enabled(level)) {
        spdlog::warn("{}", message);
    }
}

} // namespace pgtemp
