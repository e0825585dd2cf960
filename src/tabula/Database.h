#ifndef TABULA_DATABASE_H
#define TABULA_DATABASE_H

#include "Table.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula {

// The catalog: table name -> Table. Owns every table.
class Database {
  public:
    Database() = default;

    void createTable(std::string tableName, Schema schema); // throws DuplicateTable
    Table& getTable(std::string_view tableName);            // throws UnknownTable
    [[nodiscard]] const Table& getTable(std::string_view tableName) const;
    [[nodiscard]] bool hasTable(std::string_view tableName) const;

    // Only used to undo a createTable whose persistence failed.
    void dropTable(std::string_view tableName);

    // Takes ownership of an already populated table (used when loading).
    void adoptTable(std::string tableName, Table table); // throws DuplicateTable

    [[nodiscard]] std::size_t tableCount() const noexcept;
    // sorted, so callers get a stable order
    [[nodiscard]] std::vector<std::string> tableNames() const;

  private:
    std::unordered_map<std::string, Table> tables_;
};

} // namespace tabula

#endif // TABULA_DATABASE_H
