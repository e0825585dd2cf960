#include "tabula/Errors.h"

#include <utility>

namespace tabula {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::Lex:
        return "LexError";
    case ErrorCode::Parse:
        return "ParseError";
    case ErrorCode::UnknownTable:
        return "UnknownTable";
    case ErrorCode::UnknownColumn:
        return "UnknownColumn";
    case ErrorCode::DuplicateTable:
        return "DuplicateTable";
    case ErrorCode::DuplicateColumn:
        return "DuplicateColumn";
    case ErrorCode::MultiplePrimaryKeys:
        return "MultiplePrimaryKeys";
    case ErrorCode::ArityMismatch:
        return "ArityMismatch";
    case ErrorCode::TypeMismatch:
        return "TypeMismatch";
    case ErrorCode::ConstraintViolation:
        return "ConstraintViolation";
    case ErrorCode::Io:
        return "IoError";
    case ErrorCode::Format:
        return "FormatError";
    }
    return "UnknownError";
}

DbError::DbError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

LexError::LexError(std::size_t position, std::string found)
    : DbError(ErrorCode::Lex,
              "Unexpected " + found + " at position " + std::to_string(position)),
      position(position), found(std::move(found)) {}

ParseError::ParseError(std::string expected, std::string found, std::size_t position,
                       const std::string& context)
    : DbError(ErrorCode::Parse, "Expected " + expected + (context.empty() ? "" : " " + context) +
                                    ", found " + found + " at position " +
                                    std::to_string(position)),
      expected(std::move(expected)), found(std::move(found)), position(position) {}

UnknownTable::UnknownTable(std::string table)
    : DbError(ErrorCode::UnknownTable, "Table '" + table + "' not found"),
      table(std::move(table)) {}

UnknownColumn::UnknownColumn(std::string column)
    : DbError(ErrorCode::UnknownColumn, "Column '" + column + "' not found"),
      column(std::move(column)) {}

DuplicateTable::DuplicateTable(std::string table)
    : DbError(ErrorCode::DuplicateTable, "Table '" + table + "' already exists"),
      table(std::move(table)) {}

DuplicateColumn::DuplicateColumn(std::string column)
    : DbError(ErrorCode::DuplicateColumn, "Duplicate column name: " + column),
      column(std::move(column)) {}

MultiplePrimaryKeys::MultiplePrimaryKeys(std::string column)
    : DbError(ErrorCode::MultiplePrimaryKeys,
              "Table already has a primary key, cannot make '" + column + "' primary"),
      column(std::move(column)) {}

ArityMismatch::ArityMismatch(std::size_t expected, std::size_t actual)
    : DbError(ErrorCode::ArityMismatch, "Expected " + std::to_string(expected) +
                                            " values, got " + std::to_string(actual)),
      expected(expected), actual(actual) {}

TypeMismatch::TypeMismatch(std::string column, std::string expectedType)
    : DbError(ErrorCode::TypeMismatch,
              "Type mismatch for column '" + column + "': expected " + expectedType),
      column(std::move(column)), expectedType(std::move(expectedType)) {}

ConstraintViolation::ConstraintViolation(std::string column, RowValue value)
    : DbError(ErrorCode::ConstraintViolation, "Unique constraint violation on column '" +
                                                  column + "': " + valueToSql(value) +
                                                  " already exists"),
      column(std::move(column)), value(std::move(value)) {}

IoError::IoError(const std::string& message) : DbError(ErrorCode::Io, "IO error: " + message) {}

FormatError::FormatError(const std::string& message)
    : DbError(ErrorCode::Format, "Corrupt database file: " + message) {}

} // namespace tabula
