// SPDX-License-Identifier: MIT

#include "rowkit/config.hpp"

#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "rowkit/json_reader.hpp"
#include "rowkit/log.hpp"

namespace rowkit {

namespace {

// Builds a SessionConfig from one flat JSON object.
//
// The first violation is kept; later events are ignored.
class SessionConfigBuilder {
public:
    using Result = SessionConfig;

    void on_key(std::string_view key) {
        if (depth_ == 1) current_key_ = key;
    }

    void on_string(std::string_view value) {
        if (!accept_value()) return;
        if (current_key_ == "database") {
            config_.database = value;
        } else if (current_key_ == "schema") {
            config_.schema = std::string(value);
        } else if (current_key_ == "key_convention") {
            config_.key_convention = value;
        } else {
            wrong_type("a string");
        }
    }

    void on_int(int64_t value) {
        if (!accept_value()) return;
        if (current_key_ == "threads") {
            config_.threads = value;
        } else {
            wrong_type("an integer");
        }
    }

    void on_uint(uint64_t) {
        if (!accept_value()) return;
        fail(fmt::format("'{}' is out of range", current_key_));
    }

    void on_double(double) {
        if (!accept_value()) return;
        wrong_type("a number");
    }

    void on_bool(bool value) {
        if (!accept_value()) return;
        if (current_key_ == "read_only") {
            config_.read_only = value;
        } else {
            wrong_type("a boolean");
        }
    }

    void on_null() {
        if (!accept_value()) return;
        wrong_type("null");
    }

    void on_start(JsonScope scope) {
        if (depth_++ == 0) {
            if (scope == JsonScope::Object) {
                saw_object_ = true;
            } else {
                fail("configuration must be a JSON object");
            }
            return;
        }
        fail(fmt::format("'{}' must be a scalar, not an {}", current_key_,
                         scope == JsonScope::Object ? "object" : "array"));
    }

    void on_end(JsonScope) { --depth_; }

    std::expected<Result, std::string> build() {
        if (error_) return std::unexpected(*error_);
        if (!saw_object_) return std::unexpected(std::string("configuration must be a JSON object"));
        return config_;
    }

private:
    // Top-level scalars and values nested below depth 1 are rejected.
    bool accept_value() {
        if (error_) return false;
        if (depth_ == 0) {
            fail("configuration must be a JSON object");
            return false;
        }
        if (depth_ > 1) return false;
        if (!is_known_key(current_key_)) {
            fail(fmt::format("unknown key '{}'", current_key_));
            return false;
        }
        return true;
    }

    static bool is_known_key(std::string_view key) {
        return key == "database" || key == "schema" || key == "read_only" ||
               key == "threads" || key == "key_convention";
    }

    void wrong_type(std::string_view got) {
        fail(fmt::format("'{}' has the wrong type (got {})", current_key_, got));
    }

    void fail(std::string message) {
        if (!error_) error_ = std::move(message);
    }

    SessionConfig config_;
    std::string current_key_;
    int depth_ = 0;
    bool saw_object_ = false;
    std::optional<std::string> error_;
};

static_assert(JsonBuilder<SessionConfigBuilder>);

std::unexpected<Error> invalid(std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, "Invalid config: " + message});
}

}  // namespace

std::expected<SessionConfig, Error> load_config(std::string_view json) {
    SessionConfigBuilder builder;
    auto parsed = read_json(json, builder);
    if (!parsed) {
        return invalid(parsed.error());
    }
    if (auto ok = validate(*parsed); !ok) {
        return std::unexpected(ok.error());
    }
    return *parsed;
}

std::expected<SessionConfig, Error> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return invalid(fmt::format("cannot open '{}'", path.string()));
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    log::logger()->debug("loading session config from {}", path.string());
    return load_config(contents.str());
}

}  // namespace rowkit
