#ifndef TABULA_ERRORS_H
#define TABULA_ERRORS_H

#include "Row.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tabula {

enum class ErrorCode {
    Lex,
    Parse,
    UnknownTable,
    UnknownColumn,
    DuplicateTable,
    DuplicateColumn,
    MultiplePrimaryKeys,
    ArityMismatch,
    TypeMismatch,
    ConstraintViolation,
    Io,
    Format,
};

[[nodiscard]] const char* toString(ErrorCode code) noexcept;

// Base of every error the engine reports. Front-ends catch this at the
// statement boundary; the concrete type carries the details.
class DbError : public std::runtime_error {
  public:
    DbError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

struct LexError : DbError {
    LexError(std::size_t position, std::string found);

    std::size_t position;
    std::string found;
};

struct ParseError : DbError {
    // context completes the message, e.g. expected "TABLE", context "after CREATE"
    ParseError(std::string expected, std::string found, std::size_t position,
               const std::string& context = "");

    std::string expected;
    std::string found;
    std::size_t position;
};

struct UnknownTable : DbError {
    explicit UnknownTable(std::string table);
    std::string table;
};

struct UnknownColumn : DbError {
    explicit UnknownColumn(std::string column);
    std::string column;
};

struct DuplicateTable : DbError {
    explicit DuplicateTable(std::string table);
    std::string table;
};

struct DuplicateColumn : DbError {
    explicit DuplicateColumn(std::string column);
    std::string column;
};

struct MultiplePrimaryKeys : DbError {
    explicit MultiplePrimaryKeys(std::string column);
    std::string column;
};

struct ArityMismatch : DbError {
    ArityMismatch(std::size_t expected, std::size_t actual);
    std::size_t expected;
    std::size_t actual;
};

struct TypeMismatch : DbError {
    TypeMismatch(std::string column, std::string expectedType);
    std::string column;
    std::string expectedType;
};

struct ConstraintViolation : DbError {
    ConstraintViolation(std::string column, RowValue value);
    std::string column;
    RowValue value;
};

struct IoError : DbError {
    explicit IoError(const std::string& message);
};

struct FormatError : DbError {
    explicit FormatError(const std::string& message);
};

} // namespace tabula

#endif // TABULA_ERRORS_H
