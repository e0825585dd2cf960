#ifndef TABULA_LEXER_H
#define TABULA_LEXER_H

#include "Token.h"

#include <string_view>
#include <vector>

namespace tabula {

// Splits one statement into tokens. Throws LexError on an unterminated
// string literal, an out-of-range integer or an unrecognised character.
class Lexer {
  public:
    explicit Lexer(std::string_view input) : input_(input) {}

    // Always ends with a TokenType::End token.
    [[nodiscard]] std::vector<Token> tokenize();

    [[nodiscard]] static std::vector<Token> tokenize(std::string_view input) {
        return Lexer{input}.tokenize();
    }

  private:
    Token next();
    Token makeIdentifierOrKeyword(std::size_t start);
    Token makeNumber(std::size_t start);
    Token makeString(std::size_t start);

    void skipSpaces();

    std::string_view input_;
    std::size_t pos_ = 0;
};

} // namespace tabula

#endif // TABULA_LEXER_H
