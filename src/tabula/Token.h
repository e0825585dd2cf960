#ifndef TABULA_TOKEN_H
#define TABULA_TOKEN_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace tabula {

enum class TokenType {
    End, // end of input
    Identifier,
    Integer,
    String,
    LParen,
    RParen,
    Comma,
    Star,
    Equal,
    Dot,
    KeywordCreate,
    KeywordTable,
    KeywordInsert,
    KeywordInto,
    KeywordValues,
    KeywordSelect,
    KeywordFrom,
    KeywordJoin,
    KeywordInner,
    KeywordOn,
    KeywordInt,
    KeywordInteger,
    KeywordText,
    KeywordPrimary,
    KeywordKey,
    KeywordUnique,
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;        // keywords upper-cased, string literals unquoted
    std::size_t pos = 0;     // character offset in the statement
    int64_t number = 0;      // only for Integer
    std::string spelling;    // only for keywords: the word as written
};

// Name used in diagnostics: "TABLE", "'('", "identifier", ...
[[nodiscard]] const char* toString(TokenType t) noexcept;

// How a concrete token shows up in diagnostics: 'TBL', string 'x', end of input
[[nodiscard]] std::string describe(const Token& t);

} // namespace tabula

#endif // TABULA_TOKEN_H
