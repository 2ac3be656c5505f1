// SPDX-License-Identifier: MIT

// include/rowkit/schema_resolver.hpp
#pragma once

#include <span>

#include "rowkit/key_mapper.hpp"
#include "rowkit/schema.hpp"
#include "rowkit/type_spec.hpp"
#include "rowkit/value.hpp"

namespace rowkit {

/// Storage type for a runtime value.
///
/// Precedence: integer, double, decimal, boolean, date, timestamp; anything
/// else (strings, symbols) falls back to String.
DataType infer_type(const Value& value);

/// Infer a schema from one sample record.
///
/// Fields follow the sample's key order, are named by @p encode and are all
/// nullable: a single sample cannot prove a column is always present.
Schema infer_schema(const Record& sample, const EncodeFn& encode);

/// Infer a schema from the first of @p records.
/// @throws EmptyInputError if @p records is empty.
Schema infer_schema(std::span<const Record> records, const EncodeFn& encode);

/// Derive a schema from a record type description.
///
/// A field is nullable iff it is declared optional.
/// @throws InvalidSchemaError if @p spec is not a record description.
/// @throws UnsupportedTypeError for a field type with no storage counterpart,
///         including nested records, collections and unions.
Schema derive_schema(const TypeSpec& spec, const EncodeFn& encode);

/// Storage type for a scalar or enumeration description.
/// @throws UnsupportedTypeError as derive_schema.
DataType storage_type_for(const TypeSpec& spec);

}  // namespace rowkit
