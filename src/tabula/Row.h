#ifndef TABULA_ROW_H
#define TABULA_ROW_H

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace tabula {

// Int or Text. Equality and hashing come from std::variant, so values of
// different kinds never compare equal.
using RowValue = std::variant<int64_t, std::string>;

// SQL rendering: integers bare, text single-quoted with '' escaping.
[[nodiscard]] std::string valueToSql(const RowValue& v);

// Plain rendering for result tables.
[[nodiscard]] std::string valueToString(const RowValue& v);

class Row {
  public:
    Row();
    explicit Row(std::vector<RowValue> data);
    Row(std::initializer_list<RowValue> init);

    [[nodiscard]] const RowValue& at(std::size_t i) const;
    [[nodiscard]] RowValue& at(std::size_t i);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const std::vector<RowValue>& values() const noexcept;

    // this row's values followed by other's
    [[nodiscard]] Row concat(const Row& other) const;

    friend bool operator==(const Row& a, const Row& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Row& a, const Row& b) { return !(a == b); }

  private:
    std::vector<RowValue> data_;
};

} // namespace tabula

#endif // TABULA_ROW_H
