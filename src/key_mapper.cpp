// SPDX-License-Identifier: MIT

#include "rowkit/key_mapper.hpp"

#include <cctype>

namespace rowkit {

namespace {

std::string to_upper(std::string_view s) {
    std::string result(s);
    for (auto& c : result) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string replace_all(std::string s, char from, char to) {
    for (auto& c : s) {
        if (c == from) c = to;
    }
    return s;
}

}  // namespace

KeyMapper identity_keys() {
    return KeyMapper{
        "identity",
        [](std::string_view name) { return std::string(name); },
        [](std::string_view key) { return std::string(key); },
    };
}

KeyMapper upper_lower_keys() {
    return KeyMapper{
        "upper-lower",
        [](std::string_view name) { return to_lower(name); },
        [](std::string_view key) { return to_upper(key); },
    };
}

KeyMapper snake_kebab_keys() {
    return KeyMapper{
        "snake-kebab",
        [](std::string_view name) { return replace_all(to_lower(name), '_', '-'); },
        [](std::string_view key) { return replace_all(to_upper(key), '-', '_'); },
    };
}

std::expected<KeyMapper, Error> key_mapper_for(std::string_view convention) {
    if (convention == "identity") return identity_keys();
    if (convention == "upper-lower") return upper_lower_keys();
    if (convention == "snake-kebab") return snake_kebab_keys();
    return std::unexpected(Error{
        ErrorCode::InvalidConfig,
        "Unknown key convention: " + std::string(convention)});
}

}  // namespace rowkit
