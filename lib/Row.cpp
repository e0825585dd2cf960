#include "tabula/Row.h"

#include <utility>

tabula::Row::Row() = default;

tabula::Row::Row(std::vector<RowValue> data) {
    this->data_ = std::move(data);
}

tabula::Row::Row(std::initializer_list<RowValue> init) {
    this->data_ = std::vector<RowValue>(init);
}

const tabula::RowValue& tabula::Row::at(std::size_t i) const {
    return data_.at(i);
}

tabula::RowValue& tabula::Row::at(std::size_t i) {
    return data_.at(i);
}

std::size_t tabula::Row::size() const noexcept {
    return data_.size();
}

const std::vector<tabula::RowValue>& tabula::Row::values() const noexcept {
    return data_;
}

tabula::Row tabula::Row::concat(const Row& other) const {
    std::vector<RowValue> out;
    out.reserve(data_.size() + other.data_.size());
    out.insert(out.end(), data_.begin(), data_.end());
    out.insert(out.end(), other.data_.begin(), other.data_.end());
    return Row{std::move(out)};
}

std::string tabula::valueToString(const RowValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v))
        return std::to_string(*i);
    return std::get<std::string>(v);
}

std::string tabula::valueToSql(const RowValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v))
        return std::to_string(*i);

    const auto& s = std::get<std::string>(v);
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'')
            out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}
