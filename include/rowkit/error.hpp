// SPDX-License-Identifier: MIT

// include/rowkit/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rowkit {

/// Error codes for conversion, schema and engine operations.
enum class ErrorCode {
    // Input
    EmptyInput,             ///< Schema inference attempted on no data

    // Schema
    InvalidSchema,          ///< Type description is not a flat field list
    UnsupportedType,        ///< Field type has no storage counterpart
    SchemaMismatch,         ///< Row shape or cell type disagrees with the schema

    // Column names
    UnsupportedColumnName,  ///< Quoted column name is not an aggregate expression

    // Facade
    UnsupportedOperation,   ///< Structural mutation of a read-only view

    // Config
    InvalidConfig,          ///< Session configuration failed validation

    // Engine
    EngineError,            ///< Storage engine rejected a statement
};

/// Error payload returned by fallible factories and carried by exceptions.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "schema", "engine").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptyInput:
            return "input";
        case ErrorCode::InvalidSchema:
        case ErrorCode::UnsupportedType:
        case ErrorCode::SchemaMismatch:
            return "schema";
        case ErrorCode::UnsupportedColumnName:
            return "column";
        case ErrorCode::UnsupportedOperation:
            return "facade";
        case ErrorCode::InvalidConfig:
            return "config";
        case ErrorCode::EngineError:
            return "engine";
    }
    return "unknown";
}

/// Base exception for synchronous failures.  Carries the classified Error.
class Exception : public std::runtime_error {
public:
    Exception(ErrorCode code, const std::string& message)
        : std::runtime_error(message), error_{code, message} {}

    ErrorCode code() const { return error_.code; }
    const Error& error() const { return error_; }

private:
    Error error_;
};

/// Schema inference was given no sample.
class EmptyInputError : public Exception {
public:
    explicit EmptyInputError(const std::string& message)
        : Exception(ErrorCode::EmptyInput, message) {}
};

/// Type description is not a record of named, typed fields.
class InvalidSchemaError : public Exception {
public:
    explicit InvalidSchemaError(const std::string& message)
        : Exception(ErrorCode::InvalidSchema, message) {}
};

/// Declared field type is not modelled.
class UnsupportedTypeError : public Exception {
public:
    explicit UnsupportedTypeError(const std::string& message)
        : Exception(ErrorCode::UnsupportedType, message) {}
};

/// Row does not fit the schema it is converted against.
class SchemaMismatchError : public Exception {
public:
    explicit SchemaMismatchError(const std::string& message)
        : Exception(ErrorCode::SchemaMismatch, message) {}
};

/// Quoted column name outside the FUNC(ARG) shape.
class UnsupportedColumnNameError : public Exception {
public:
    explicit UnsupportedColumnNameError(const std::string& message)
        : Exception(ErrorCode::UnsupportedColumnName, message) {}
};

/// Mutation attempted on a read-only view.
class UnsupportedOperationError : public Exception {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : Exception(ErrorCode::UnsupportedOperation, message) {}
};

/// Storage engine failure.
class EngineError : public Exception {
public:
    explicit EngineError(const std::string& message)
        : Exception(ErrorCode::EngineError, message) {}
};

}  // namespace rowkit
