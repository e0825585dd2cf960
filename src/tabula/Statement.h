#ifndef TABULA_STATEMENT_H
#define TABULA_STATEMENT_H

#include "Row.h"
#include "Schema.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

// ===== SQL Statements =====

namespace tabula {

// `col` or `table.col`
struct ColumnRef {
    std::optional<std::string> table;
    std::string column;

    [[nodiscard]] std::string toString() const { return table ? *table + "." + column : column; }
};

struct CreateTable {
    std::string tableName;
    // unchecked: duplicate names and multiple primary keys are rejected at execution
    std::vector<Column> columns;
};

struct Insert {
    std::string tableName;
    std::vector<RowValue> values;
};

struct Join {
    std::string table;
    ColumnRef left;  // operand before '='
    ColumnRef right; // operand after '='
};

struct Select {
    std::string table;
    // projection: either * or a list of column references
    struct Star {};
    using Projection = std::variant<Star, std::vector<ColumnRef>>;
    Projection projection;
    std::optional<Join> join;
};

using Statement = std::variant<CreateTable, Insert, Select>;

[[nodiscard]] inline bool isReadOnly(const Statement& st) noexcept {
    return std::holds_alternative<Select>(st);
}

} // namespace tabula

#endif // TABULA_STATEMENT_H
