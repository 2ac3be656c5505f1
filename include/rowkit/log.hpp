// SPDX-License-Identifier: MIT

// include/rowkit/log.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace rowkit::log {

/// Library logger named "rowkit", writing to stderr.  Created on first use
/// and registered with spdlog so applications can reconfigure it by name.
std::shared_ptr<spdlog::logger> logger();

/// Set the library logger's level (default: warn).
void set_level(spdlog::level::level_enum level);

}  // namespace rowkit::log
