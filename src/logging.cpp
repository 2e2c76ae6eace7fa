#include <episode_title/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace episode_title {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

void set_log_level(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

}  // namespace episode_title
