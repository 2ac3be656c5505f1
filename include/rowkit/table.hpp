// SPDX-License-Identifier: MIT

// include/rowkit/table.hpp
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rowkit/schema.hpp"
#include "rowkit/value.hpp"

namespace rowkit {

/// Opaque reference to one column of a table.
///
/// @c name is the storage column name it was resolved from; @c expression
/// is the engine-specific text that addresses it (e.g. a quoted identifier).
class ColumnRef {
public:
    ColumnRef(std::string name, std::string expression)
        : name_(std::move(name)), expression_(std::move(expression)) {}

    const std::string& name() const { return name_; }
    const std::string& expression() const { return expression_; }

    bool operator==(const ColumnRef&) const = default;

private:
    std::string name_;
    std::string expression_;
};

/// Handle to a table held by a storage engine.
///
/// Implementations answer from the table's current state on every call.
class ITable {
public:
    virtual ~ITable() = default;

    /// Current schema (field names in storage convention).
    virtual Schema schema() const = 0;

    /// Reference to the column named @p name.  Does not check existence.
    virtual ColumnRef column(std::string_view name) const = 0;

    /// Short human-readable identification, e.g. "Table[trades]".
    virtual std::string describe() const = 0;
};

/// In-process table over a fixed schema and rows.
class MemoryTable : public ITable {
public:
    MemoryTable(Schema schema, std::vector<Row> rows)
        : schema_(std::move(schema)), rows_(std::move(rows)) {}

    Schema schema() const override { return schema_; }

    ColumnRef column(std::string_view name) const override {
        return ColumnRef(std::string(name), std::string(name));
    }

    std::string describe() const override;

    const std::vector<Row>& rows() const { return rows_; }

private:
    Schema schema_;
    std::vector<Row> rows_;
};

}  // namespace rowkit
