// SPDX-License-Identifier: MIT

// include/rowkit/json_reader.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>

namespace rowkit {

/// Container opened or closed by a JSON event.
enum class JsonScope { Object, Array };

/// Receives the events of one JSON document and produces a result.
///
/// Integers that fit int64_t arrive through on_int(); larger unsigned values
/// through on_uint().
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view text, int64_t i, uint64_t u,
                               double d, bool flag, JsonScope scope) {
    typename B::Result;
    { b.on_key(text) } -> std::same_as<void>;
    { b.on_string(text) } -> std::same_as<void>;
    { b.on_int(i) } -> std::same_as<void>;
    { b.on_uint(u) } -> std::same_as<void>;
    { b.on_double(d) } -> std::same_as<void>;
    { b.on_bool(flag) } -> std::same_as<void>;
    { b.on_null() } -> std::same_as<void>;
    { b.on_start(scope) } -> std::same_as<void>;
    { b.on_end(scope) } -> std::same_as<void>;
    { b.build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

/// Parse a complete JSON document, feeding its events to @p builder.
///
/// @return The builder's result, or "Parse error at offset N: cause" for
/// malformed input.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, std::string> read_json(std::string_view json,
                                                              Builder& builder) {
    struct Handler : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, Handler> {
        Builder& out;

        explicit Handler(Builder& b) : out(b) {}

        bool Null() { return out.on_null(), true; }
        bool Bool(bool b) { return out.on_bool(b), true; }
        bool Int(int i) { return out.on_int(i), true; }
        bool Int64(int64_t i) { return out.on_int(i), true; }
        bool Uint(unsigned u) { return out.on_int(static_cast<int64_t>(u)), true; }
        bool Uint64(uint64_t u) {
            if (u <= static_cast<uint64_t>(INT64_MAX)) {
                out.on_int(static_cast<int64_t>(u));
            } else {
                out.on_uint(u);
            }
            return true;
        }
        bool Double(double d) { return out.on_double(d), true; }
        bool String(const char* str, rapidjson::SizeType length, bool) {
            return out.on_string(std::string_view(str, length)), true;
        }
        bool Key(const char* str, rapidjson::SizeType length, bool) {
            return out.on_key(std::string_view(str, length)), true;
        }
        bool StartObject() { return out.on_start(JsonScope::Object), true; }
        bool EndObject(rapidjson::SizeType) { return out.on_end(JsonScope::Object), true; }
        bool StartArray() { return out.on_start(JsonScope::Array), true; }
        bool EndArray(rapidjson::SizeType) { return out.on_end(JsonScope::Array), true; }
    };

    // StringStream stops at the first NUL, so parse a terminated copy
    const std::string buffer(json);
    rapidjson::StringStream stream(buffer.c_str());
    Handler handler(builder);
    rapidjson::Reader reader;

    if (auto status = reader.Parse(stream, handler); status.IsError()) {
        return std::unexpected(fmt::format("Parse error at offset {}: {}", status.Offset(),
                                           rapidjson::GetParseError_En(status.Code())));
    }
    return builder.build();
}

}  // namespace rowkit
