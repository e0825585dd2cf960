#ifndef TABULA_SCHEMA_H
#define TABULA_SCHEMA_H

#include "Row.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula {

enum class ColumnType { Int, Text };

[[nodiscard]] const char* toString(ColumnType t) noexcept;

// true when v holds the alternative that matches t
[[nodiscard]] bool valueTypeMatches(ColumnType t, const RowValue& v) noexcept;

struct Column {
    std::string name;
    ColumnType type = ColumnType::Int;
    bool primaryKey = false;
    bool unique = false;

    // PRIMARY implies UNIQUE
    [[nodiscard]] bool constrained() const noexcept { return primaryKey || unique; }
};

class Schema {
  public:
    // throws DuplicateColumn / MultiplePrimaryKeys
    explicit Schema(std::vector<Column> columns);

    // basic metadata
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const std::vector<Column>& columns() const noexcept;
    [[nodiscard]] const Column& column(std::size_t i) const;

    // name lookup
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;
    [[nodiscard]] std::size_t require_index(std::string_view name) const; // throws UnknownColumn

    [[nodiscard]] std::optional<std::size_t> primaryKey() const noexcept;
    // positions of PRIMARY / UNIQUE columns, ascending
    [[nodiscard]] std::vector<std::size_t> constrainedColumns() const;

  private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, std::size_t> name_to_index_;
    std::optional<std::size_t> primary_;
};

} // namespace tabula

#endif // TABULA_SCHEMA_H
