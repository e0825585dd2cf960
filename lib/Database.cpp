#include "tabula/Database.h"

#include "tabula/Errors.h"

#include <algorithm>

namespace tabula {
void Database::createTable(std::string tableName, Schema schema) {
    adoptTable(std::move(tableName), Table{std::move(schema)});
}

void Database::adoptTable(std::string tableName, Table table) {
    if (tables_.find(tableName) != tables_.end())
        throw DuplicateTable(std::move(tableName));
    tables_.emplace(std::move(tableName), std::move(table));
}

Table& Database::getTable(std::string_view tableName) {
    auto it = tables_.find(std::string{tableName});
    if (it == tables_.end())
        throw UnknownTable(std::string{tableName});
    return it->second;
}

const Table& Database::getTable(std::string_view tableName) const {
    auto it = tables_.find(std::string{tableName});
    if (it == tables_.end())
        throw UnknownTable(std::string{tableName});
    return it->second;
}

bool Database::hasTable(std::string_view tableName) const {
    return tables_.contains(std::string{tableName});
}

void Database::dropTable(std::string_view tableName) {
    if (tables_.erase(std::string{tableName}) == 0)
        throw UnknownTable(std::string{tableName});
}

std::size_t Database::tableCount() const noexcept {
    return tables_.size();
}

std::vector<std::string> Database::tableNames() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_)
        names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}
} // namespace tabula
