// SPDX-License-Identifier: MIT

#include "rowkit/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rowkit::log {

namespace {

constexpr const char* kLoggerName = "rowkit";

std::mutex logger_mtx;

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mtx);
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace rowkit::log
