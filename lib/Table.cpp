#include "tabula/Table.h"

#include "tabula/Errors.h"

#include <stdexcept>
#include <utility>

namespace tabula {

Table::Table(Schema schema) : schema_(std::move(schema)) {
    resetIndexes();
}

Table Table::restore(Schema schema, std::vector<Row> rows) {
    Table t{std::move(schema)};
    for (const auto& r : rows)
        t.checkShape(r);
    t.rows_ = std::move(rows);
    t.rebuildIndexes();
    return t;
}

const Schema& Table::getSchema() const noexcept {
    return schema_;
}

std::size_t Table::rowCount() const noexcept {
    return rows_.size();
}

void Table::checkShape(const Row& row) const {
    if (row.size() != schema_.size()) {
        throw ArityMismatch(schema_.size(), row.size());
    }
    for (std::size_t i = 0; i < schema_.size(); ++i) {
        const auto& col = schema_.column(i);
        if (!valueTypeMatches(col.type, row.at(i))) {
            throw TypeMismatch(col.name, toString(col.type));
        }
    }
}

void Table::insertRow(Row row) {
    checkShape(row);

    // every check runs before the first write
    for (const auto& [idx, values] : indexes_) {
        const RowValue& v = row.at(idx);
        if (values.count(v) != 0)
            throw ConstraintViolation(schema_.column(idx).name, v);
    }

    for (auto& [idx, values] : indexes_)
        values.insert(row.at(idx));
    rows_.push_back(std::move(row));
}

void Table::removeLastRow() {
    if (rows_.empty())
        throw std::out_of_range("removeLastRow on empty table");

    const Row& last = rows_.back();
    for (auto& [idx, values] : indexes_)
        values.erase(last.at(idx));
    rows_.pop_back();
}

void Table::resetIndexes() {
    indexes_.clear();
    for (auto idx : schema_.constrainedColumns())
        indexes_.emplace(idx, ColumnIndex{});
}

void Table::rebuildIndexes() {
    resetIndexes();
    for (const auto& r : rows_) {
        for (auto& [idx, values] : indexes_) {
            auto [it, inserted] = values.insert(r.at(idx));
            if (!inserted)
                throw ConstraintViolation(schema_.column(idx).name, *it);
        }
    }
}

const std::vector<Row>& Table::rows() const noexcept {
    return rows_;
}

std::vector<Row> Table::getColumnRows(const std::vector<std::size_t>& columnIndices) const {
    for (auto idx : columnIndices) {
        if (idx >= schema_.size())
            throw std::out_of_range("Projection index out of range");
    }

    std::vector<Row> out;
    out.reserve(rows_.size());
    for (const auto& r : rows_) {
        std::vector<RowValue> projected;
        projected.reserve(columnIndices.size());
        for (auto idx : columnIndices) {
            projected.push_back(r.at(idx)); // copy cell
        }
        out.emplace_back(std::move(projected));
    }
    return out;
}

bool Table::hasIndex(std::size_t column) const noexcept {
    return indexes_.find(column) != indexes_.end();
}

bool Table::indexContains(std::size_t column, const RowValue& value) const {
    return index(column).count(value) != 0;
}

const ColumnIndex& Table::index(std::size_t column) const {
    auto it = indexes_.find(column);
    if (it == indexes_.end())
        throw std::out_of_range("Column " + std::to_string(column) + " has no index");
    return it->second;
}

} // namespace tabula
