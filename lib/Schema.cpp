#include "tabula/Schema.h"

#include "tabula/Errors.h"

namespace tabula {

const char* toString(ColumnType t) noexcept {
    switch (t) {
    case ColumnType::Int:
        return "INT";
    case ColumnType::Text:
        return "TEXT";
    }
    return "?";
}

bool valueTypeMatches(ColumnType t, const RowValue& v) noexcept {
    return (t == ColumnType::Int && std::holds_alternative<int64_t>(v)) ||
           (t == ColumnType::Text && std::holds_alternative<std::string>(v));
}

Schema::Schema(std::vector<Column> columns) {
    name_to_index_.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const auto& col = columns.at(i);
        auto [it, inserted] = name_to_index_.emplace(col.name, i);
        if (!inserted) {
            throw DuplicateColumn(col.name);
        }
        if (col.primaryKey) {
            if (primary_)
                throw MultiplePrimaryKeys(col.name);
            primary_ = i;
        }
    }
    columns_ = std::move(columns);
}

std::size_t Schema::size() const noexcept {
    return columns_.size();
}

const std::vector<Column>& Schema::columns() const noexcept {
    return columns_;
}

const Column& Schema::column(std::size_t i) const {
    return columns_.at(i);
}

std::optional<std::size_t> Schema::index_of(std::string_view name) const {
    auto it = name_to_index_.find(std::string{name});
    if (it == name_to_index_.end())
        return std::nullopt;
    return it->second;
}

std::size_t Schema::require_index(std::string_view name) const {
    if (auto idx = index_of(name))
        return *idx;
    throw UnknownColumn(std::string{name});
}

std::optional<std::size_t> Schema::primaryKey() const noexcept {
    return primary_;
}

std::vector<std::size_t> Schema::constrainedColumns() const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].constrained())
            out.push_back(i);
    }
    return out;
}

} // namespace tabula
