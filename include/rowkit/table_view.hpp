// SPDX-License-Identifier: MIT

// include/rowkit/table_view.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "rowkit/key_mapper.hpp"
#include "rowkit/table.hpp"

namespace rowkit {

/// Read-only, name-addressed view over a table's columns.
///
/// Columns are looked up by application key: the key is encoded, matched
/// against the table's live field names and, on a hit, resolved through the
/// table.  Field names are read from the table on every call; nothing is
/// cached, so the view always reflects the table's current schema.
///
/// Call syntax, operator[] and find() are the same lookup.  entries(),
/// keys(), values() and iteration all derive from one ordered entry list.
///
/// A quote-wrapped aggregate field such as "\"COUNT(DEPT)\"" is exposed
/// under decode("COUNT-DEPT").
class TableView {
public:
    using value_type = std::pair<std::string, ColumnRef>;  ///< (decoded key, column)

    /// Input iterator over one snapshot of the entry list.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TableView::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() = default;

        reference operator*() const { return (*entries_)[index_]; }
        pointer operator->() const { return &(*entries_)[index_]; }

        iterator& operator++() {
            ++index_;
            return *this;
        }
        iterator operator++(int) {
            iterator prev = *this;
            ++index_;
            return prev;
        }

        bool operator==(std::default_sentinel_t) const {
            return !entries_ || index_ >= entries_->size();
        }

    private:
        friend class TableView;
        explicit iterator(std::shared_ptr<const std::vector<value_type>> entries)
            : entries_(std::move(entries)) {}

        std::shared_ptr<const std::vector<value_type>> entries_;
        std::size_t index_ = 0;
    };

    TableView(std::shared_ptr<const ITable> table, KeyMapper keys);

    /// @name Lookup by application key
    /// @return The column, or std::nullopt if the table has no such field.
    /// @{
    std::optional<ColumnRef> find(std::string_view key) const;
    std::optional<ColumnRef> operator()(std::string_view key) const { return find(key); }
    std::optional<ColumnRef> operator[](std::string_view key) const { return find(key); }
    bool contains(std::string_view key) const { return find(key).has_value(); }
    /// @}

    /// Number of fields in the table's current schema.
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    /// (decoded key, column) pairs in schema order.
    std::vector<value_type> entries() const;
    std::vector<std::string> keys() const;
    std::vector<ColumnRef> values() const;

    iterator begin() const;
    std::default_sentinel_t end() const { return std::default_sentinel; }

    /// @name Mutation
    /// The view mirrors a remote schema and cannot be edited.
    /// @throws UnsupportedOperationError always.
    /// @{
    [[noreturn]] void insert(std::string_view key, const ColumnRef& column);
    [[noreturn]] void erase(std::string_view key);
    /// @}

    const ITable& table() const { return *table_; }
    const std::shared_ptr<const ITable>& table_handle() const { return table_; }
    const KeyMapper& key_mapper() const { return keys_; }

    /// Same table handle and same key convention.
    bool operator==(const TableView& other) const;

    /// e.g. "TableView[MemoryTable[2 fields, 0 rows], keys=upper-lower]"
    std::string to_string() const;

private:
    std::shared_ptr<const ITable> table_;
    KeyMapper keys_;
};

}  // namespace rowkit

template <>
struct std::hash<rowkit::TableView> {
    std::size_t operator()(const rowkit::TableView& view) const noexcept {
        std::size_t h = std::hash<const rowkit::ITable*>{}(view.table_handle().get());
        return h ^ (std::hash<std::string>{}(view.key_mapper().name) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

template <>
struct fmt::formatter<rowkit::TableView> : fmt::formatter<std::string_view> {
    auto format(const rowkit::TableView& view, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(view.to_string(), ctx);
    }
};
