// SPDX-License-Identifier: MIT

// include/rowkit/value.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rowkit {

/// Arbitrary-precision decimal, kept as its decimal text (e.g. "12.50").
///
/// Equality is numeric: "12.50", "12.5" and "012.500" are the same value.
struct Decimal {
    std::string text;

    /// Text without sign-on-zero, leading integer zeros or trailing
    /// fractional zeros ("12.50" -> "12.5", "-0.00" -> "0").  Text that is
    /// not a plain decimal numeral is returned unchanged.
    std::string canonical() const;

    friend bool operator==(const Decimal& lhs, const Decimal& rhs) {
        return lhs.canonical() == rhs.canonical();
    }
};

/// Calendar date.
//
// Thread safety: Value type, safe to copy and use across threads.
class Date {
public:
    // Parse ISO-8601 date string "YYYY-MM-DD"
    // Throws std::invalid_argument on malformed or impossible dates.
    static Date from_iso_string(std::string_view iso_date);

    constexpr Date() = default;
    constexpr Date(int year, unsigned month, unsigned day)
        : year_(year), month_(month), day_(day) {}

    int year() const { return year_; }
    unsigned month() const { return month_; }
    unsigned day() const { return day_; }

    std::string to_iso_string() const;

    auto operator<=>(const Date&) const = default;

private:
    int year_ = 1970;
    unsigned month_ = 1;
    unsigned day_ = 1;
};

/// Point in time, microseconds since the Unix epoch (UTC).
struct Timestamp {
    int64_t micros_since_epoch = 0;

    static constexpr Timestamp from_unix_ns(int64_t ns) { return Timestamp{ns / 1000}; }

    // "YYYY-MM-DD hh:mm:ss.ffffff" in UTC
    std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
};

/// Symbolic token (enum member, keyword, interned identifier).
/// Stored as its plain name.
struct Symbol {
    std::string name;

    bool operator==(const Symbol&) const = default;
};

/// Scalar value carried by records and rows.
///
/// The alternative order matches the precedence schema inference applies.
using Value = std::variant<int64_t, double, Decimal, bool, Date, Timestamp, std::string, Symbol>;

/// One row slot; std::nullopt is Null.
using Cell = std::optional<Value>;

/// Schema-positioned sequence of cells.
using Row = std::vector<Cell>;

/// @return Short name of the value's alternative ("integer", "string", ...).
std::string_view value_kind(const Value& value);

/// Display text: numbers as written, dates and timestamps in ISO form,
/// strings and symbols bare.
std::string value_text(const Value& value);

/// Application-side record: a key/value mapping that remembers insertion order.
///
/// Presence of a key, not a null value, marks an optional field as set.
/// Equality ignores key order.
class Record {
public:
    using value_type = std::pair<std::string, Value>;
    using const_iterator = std::vector<value_type>::const_iterator;

    Record() = default;
    Record(std::initializer_list<value_type> init);

    /// Insert or replace. A replaced key keeps its original position.
    void set(std::string key, Value value);

    /// @return Pointer to the value for @p key, or nullptr if absent.
    const Value* find(std::string_view key) const;

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// @return true if the key was present.
    bool erase(std::string_view key);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    friend bool operator==(const Record& lhs, const Record& rhs);

private:
    std::vector<value_type> entries_;
};

}  // namespace rowkit
