// SPDX-License-Identifier: MIT

// include/rowkit/record_converter.hpp
#pragma once

#include <span>
#include <string>
#include <vector>

#include "rowkit/key_mapper.hpp"
#include "rowkit/schema.hpp"
#include "rowkit/value.hpp"

namespace rowkit {

/// Storage-friendly form of a value: symbols become their plain name,
/// every other scalar is returned unchanged.
Value to_storage_value(const Value& value);

/// Position a record's values according to @p schema.
///
/// For each field, the record key whose encoded form matches the field name
/// case-insensitively supplies the slot; no match leaves the slot Null.
/// Keys with no matching field are ignored.  When several keys match one
/// field, the last in record order wins.
Row record_to_row(const Record& record, const Schema& schema, const EncodeFn& encode);

/// Rebuild a record from a schema-positioned row.
///
/// Null slots are omitted: the key is absent from the result, never present
/// with an empty value.
/// @throws SchemaMismatchError if the row length differs from the schema.
Record row_to_record(const Row& row, const Schema& schema, const DecodeFn& decode);

/// Element-wise record_to_row, order preserved.
std::vector<Row> records_to_rows(std::span<const Record> records, const Schema& schema,
                                 const EncodeFn& encode);

/// Element-wise row_to_record, order preserved.
std::vector<Record> rows_to_records(std::span<const Row> rows, const Schema& schema,
                                    const DecodeFn& decode);

/// One disagreement between a row and its schema.
struct SchemaMismatch {
    std::string column;
    std::string expected;
    std::string actual;

    bool operator==(const SchemaMismatch&) const = default;
};

/// @return true if a non-null @p value may be stored in a column of @p type.
bool is_assignable(const Value& value, const DataType& type);

/// Check arity, nullability and cell types of @p row against @p schema.
/// @return Every mismatch found; empty when the row fits.
std::vector<SchemaMismatch> validate_row(const Row& row, const Schema& schema);

}  // namespace rowkit
