// SPDX-License-Identifier: MIT

#include "rowkit/config.hpp"

#include <fmt/format.h>

namespace rowkit {

namespace {

std::unexpected<Error> invalid(std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, "Invalid config: " + message});
}

}  // namespace

std::expected<void, Error> validate(const SessionConfig& config) {
    if (config.schema && config.schema->empty()) {
        return invalid("'schema' must not be empty");
    }
    if (config.threads && *config.threads <= 0) {
        return invalid(fmt::format("'threads' must be positive, got {}", *config.threads));
    }
    if (config.read_only && config.in_memory()) {
        return invalid("'read_only' requires a database file");
    }
    if (auto keys = key_mapper_for(config.key_convention); !keys) {
        return invalid(keys.error().message);
    }
    return {};
}

std::expected<KeyMapper, Error> key_mapper_for(const SessionConfig& config) {
    return key_mapper_for(std::string_view(config.key_convention));
}

}  // namespace rowkit
