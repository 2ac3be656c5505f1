// SPDX-License-Identifier: MIT

#include "rowkit/value.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <fmt/format.h>

namespace rowkit {

Date Date::from_iso_string(std::string_view iso_date) {
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    if (iso_date.size() != 10 || iso_date[4] != '-' || iso_date[7] != '-') {
        throw std::invalid_argument(
            "Invalid ISO date format (expected YYYY-MM-DD): " + std::string(iso_date));
    }
    for (size_t i : {0U, 1U, 2U, 3U, 5U, 6U, 8U, 9U}) {
        if (!is_digit(iso_date[i])) {
            throw std::invalid_argument(
                "Invalid ISO date format (expected YYYY-MM-DD): " + std::string(iso_date));
        }
    }

    int year = (iso_date[0] - '0') * 1000 + (iso_date[1] - '0') * 100 +
               (iso_date[2] - '0') * 10 + (iso_date[3] - '0');
    unsigned month = static_cast<unsigned>((iso_date[5] - '0') * 10 + (iso_date[6] - '0'));
    unsigned day = static_cast<unsigned>((iso_date[8] - '0') * 10 + (iso_date[9] - '0'));

    std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        throw std::invalid_argument("Invalid calendar date: " + std::string(iso_date));
    }

    return Date(year, month, day);
}

std::string Date::to_iso_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year_, month_, day_);
}

std::string Timestamp::to_iso_string() const {
    using namespace std::chrono;
    const sys_time<microseconds> tp{microseconds{micros_since_epoch}};
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss tod{tp - day};
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:06d}",
                       static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), tod.hours().count(),
                       tod.minutes().count(), tod.seconds().count(),
                       tod.subseconds().count());
}

std::string Decimal::canonical() const {
    std::string_view digits = text;
    bool negative = false;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }

    const auto dot = digits.find('.');
    std::string_view whole = digits.substr(0, dot);
    std::string_view fraction =
        dot == std::string_view::npos ? std::string_view() : digits.substr(dot + 1);

    auto all_digits = [](std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
    };
    if (whole.empty() && fraction.empty()) return text;
    if (!all_digits(whole) || !all_digits(fraction)) return text;

    while (whole.size() > 1 && whole.front() == '0') whole.remove_prefix(1);
    while (!fraction.empty() && fraction.back() == '0') fraction.remove_suffix(1);

    std::string result = whole.empty() ? std::string("0") : std::string(whole);
    if (!fraction.empty()) {
        result += '.';
        result.append(fraction);
    }
    if (negative && result != "0") {
        result.insert(result.begin(), '-');
    }
    return result;
}

std::string_view value_kind(const Value& value) {
    switch (value.index()) {
        case 0: return "integer";
        case 1: return "double";
        case 2: return "decimal";
        case 3: return "boolean";
        case 4: return "date";
        case 5: return "timestamp";
        case 6: return "string";
        case 7: return "symbol";
    }
    return "unknown";
}

std::string value_text(const Value& value) {
    switch (value.index()) {
        case 0: return fmt::format("{}", std::get<int64_t>(value));
        case 1: return fmt::format("{}", std::get<double>(value));
        case 2: return std::get<Decimal>(value).text;
        case 3: return std::get<bool>(value) ? "true" : "false";
        case 4: return std::get<Date>(value).to_iso_string();
        case 5: return std::get<Timestamp>(value).to_iso_string();
        case 6: return std::get<std::string>(value);
        case 7: return std::get<Symbol>(value).name;
    }
    return {};
}

Record::Record(std::initializer_list<value_type> init) {
    entries_.reserve(init.size());
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

void Record::set(std::string key, Value value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const value_type& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Record::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

bool Record::erase(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const value_type& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool operator==(const Record& lhs, const Record& rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (const auto& [key, value] : lhs) {
        const Value* other = rhs.find(key);
        if (other == nullptr || !(*other == value)) return false;
    }
    return true;
}

}  // namespace rowkit
