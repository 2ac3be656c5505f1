// SPDX-License-Identifier: MIT

// include/rowkit/key_mapper.hpp
#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>

#include "rowkit/error.hpp"

namespace rowkit {

/// Translates a storage-side name into an application key.
using DecodeFn = std::function<std::string(std::string_view)>;
/// Translates an application key into a storage-side name.
using EncodeFn = std::function<std::string(std::string_view)>;

/// Pair of mutually inverse key translations.
///
/// Conversion and facade code only ever call the two functions held here;
/// no casing or prefix rule is applied anywhere else.  The pair is never
/// checked for invertibility.  @c name labels the convention for display
/// and equality of wrapping objects.
struct KeyMapper {
    std::string name;
    DecodeFn decode;
    EncodeFn encode;
};

/// @name Named conventions
/// Callers pick one explicitly (directly or through SessionConfig).
/// @{

/// Both directions return their input.
KeyMapper identity_keys();

/// encode upper-cases, decode lower-cases.  Default session convention.
KeyMapper upper_lower_keys();

/// encode upper-cases and maps '-' to '_'; decode lower-cases and maps '_' to '-'.
KeyMapper snake_kebab_keys();

/// @}

/// Name of the convention used when configuration does not choose one.
inline constexpr std::string_view kDefaultKeyConvention = "upper-lower";

/// Resolve a convention by name ("identity", "upper-lower", "snake-kebab").
/// @return The mapper, or ErrorCode::InvalidConfig for an unknown name.
std::expected<KeyMapper, Error> key_mapper_for(std::string_view convention);

}  // namespace rowkit
