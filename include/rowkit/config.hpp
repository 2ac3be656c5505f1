// SPDX-License-Identifier: MIT

// include/rowkit/config.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "rowkit/error.hpp"
#include "rowkit/key_mapper.hpp"

namespace rowkit {

/// Parameters for opening a session.
///
/// JSON form (every key optional, no other keys allowed):
/// @code
/// {
///   "database": "/var/lib/app/data.duckdb",
///   "schema": "staging",
///   "read_only": false,
///   "threads": 4,
///   "key_convention": "snake-kebab"
/// }
/// @endcode
struct SessionConfig {
    std::string database;                  ///< File path; empty or ":memory:" for in-memory.
    std::optional<std::string> schema;     ///< Schema to create and make current.
    bool read_only = false;                ///< Open the database read-only.
    std::optional<int64_t> threads;        ///< Engine worker-thread cap.
    std::string key_convention{kDefaultKeyConvention};  ///< Key Mapper preset name.

    /// @return true when no database file is involved.
    bool in_memory() const { return database.empty() || database == ":memory:"; }
};

/// Check field-level rules that the JSON shape cannot express.
/// @return ErrorCode::InvalidConfig describing the first violation.
std::expected<void, Error> validate(const SessionConfig& config);

/// @name JSON loading
/// Defined in the rowkit_json library.
/// @{

/// Parse and validate a JSON configuration document.
std::expected<SessionConfig, Error> load_config(std::string_view json);

/// Read, parse and validate a JSON configuration file.
std::expected<SessionConfig, Error> load_config_file(const std::filesystem::path& path);
/// @}

/// Key Mapper selected by @p config.
std::expected<KeyMapper, Error> key_mapper_for(const SessionConfig& config);

}  // namespace rowkit
