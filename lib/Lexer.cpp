#include "tabula/Lexer.h"

#include "tabula/Errors.h"

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tabula {

namespace {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
bool isValidUtf8(std::string_view s) {
    static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};

    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        char32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size())
            return false;

        for (std::size_t k = 1; k < len; ++k) {
            const auto b = static_cast<unsigned char>(s[i + k]);
            if ((b & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (b & 0x3F);
        }
        if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

} // namespace

const char* toString(TokenType t) noexcept {
    switch (t) {
    case TokenType::End:
        return "end of input";
    case TokenType::Identifier:
        return "identifier";
    case TokenType::Integer:
        return "integer literal";
    case TokenType::String:
        return "string literal";
    case TokenType::LParen:
        return "'('";
    case TokenType::RParen:
        return "')'";
    case TokenType::Comma:
        return "','";
    case TokenType::Star:
        return "'*'";
    case TokenType::Equal:
        return "'='";
    case TokenType::Dot:
        return "'.'";
    case TokenType::KeywordCreate:
        return "CREATE";
    case TokenType::KeywordTable:
        return "TABLE";
    case TokenType::KeywordInsert:
        return "INSERT";
    case TokenType::KeywordInto:
        return "INTO";
    case TokenType::KeywordValues:
        return "VALUES";
    case TokenType::KeywordSelect:
        return "SELECT";
    case TokenType::KeywordFrom:
        return "FROM";
    case TokenType::KeywordJoin:
        return "JOIN";
    case TokenType::KeywordInner:
        return "INNER";
    case TokenType::KeywordOn:
        return "ON";
    case TokenType::KeywordInt:
        return "INT";
    case TokenType::KeywordInteger:
        return "INTEGER";
    case TokenType::KeywordText:
        return "TEXT";
    case TokenType::KeywordPrimary:
        return "PRIMARY";
    case TokenType::KeywordKey:
        return "KEY";
    case TokenType::KeywordUnique:
        return "UNIQUE";
    }
    return "?";
}

std::string describe(const Token& t) {
    switch (t.type) {
    case TokenType::End:
        return "end of input";
    case TokenType::String:
        return "string '" + t.text + "'";
    default:
        return "'" + t.text + "'";
    }
}

void Lexer::skipSpaces() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])))
        ++pos_;
}

Token Lexer::makeIdentifierOrKeyword(std::size_t start) {
    while (pos_ < input_.size() &&
           (std::isalnum(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_'))
        ++pos_;
    std::string text{input_.substr(start, pos_ - start)};
    std::string upper;
    upper.reserve(text.size());
    for (char c : text)
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"CREATE", TokenType::KeywordCreate},   {"TABLE", TokenType::KeywordTable},
        {"INSERT", TokenType::KeywordInsert},   {"INTO", TokenType::KeywordInto},
        {"VALUES", TokenType::KeywordValues},   {"SELECT", TokenType::KeywordSelect},
        {"FROM", TokenType::KeywordFrom},       {"JOIN", TokenType::KeywordJoin},
        {"INNER", TokenType::KeywordInner},     {"ON", TokenType::KeywordOn},
        {"INT", TokenType::KeywordInt},         {"INTEGER", TokenType::KeywordInteger},
        {"TEXT", TokenType::KeywordText},       {"PRIMARY", TokenType::KeywordPrimary},
        {"KEY", TokenType::KeywordKey},         {"UNIQUE", TokenType::KeywordUnique},
    };
    auto it = keywords.find(upper);
    if (it != keywords.end()) {
        Token tok{it->second, std::move(upper), start};
        tok.spelling = std::move(text);
        return tok;
    }
    return Token{TokenType::Identifier, std::move(text), start};
}

Token Lexer::makeNumber(std::size_t start) {
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])))
        ++pos_;
    const std::string_view sv = input_.substr(start, pos_ - start);

    Token tok{TokenType::Integer, std::string{sv}, start};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tok.number);
    if (res.ec != std::errc{} || res.ptr != sv.data() + sv.size())
        throw LexError(start, "out-of-range integer " + std::string{sv});
    return tok;
}

// opening quote already consumed; '' stands for a single quote
Token Lexer::makeString(std::size_t start) {
    std::string out;
    while (pos_ < input_.size()) {
        char c = input_[pos_++];
        if (c != '\'') {
            out.push_back(c);
            continue;
        }
        if (pos_ < input_.size() && input_[pos_] == '\'') {
            out.push_back('\'');
            ++pos_;
            continue;
        }
        // text is stored and saved as UTF-8
        if (!isValidUtf8(out))
            throw LexError(start, "invalid UTF-8 in string literal");
        return Token{TokenType::String, std::move(out), start};
    }
    throw LexError(start, "unterminated string literal");
}

Token Lexer::next() {
    skipSpaces();
    if (pos_ >= input_.size())
        return Token{TokenType::End, "", pos_};

    const std::size_t start = pos_;
    const char c = input_[pos_++];

    switch (c) {
    case '(':
        return Token{TokenType::LParen, "(", start};
    case ')':
        return Token{TokenType::RParen, ")", start};
    case ',':
        return Token{TokenType::Comma, ",", start};
    case '*':
        return Token{TokenType::Star, "*", start};
    case '=':
        return Token{TokenType::Equal, "=", start};
    case '.':
        return Token{TokenType::Dot, ".", start};
    case '\'':
        return makeString(start);
    case '-':
        if (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])))
            return makeNumber(start);
        break;
    default:
        break;
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        return makeIdentifierOrKeyword(start);
    if (std::isdigit(static_cast<unsigned char>(c)))
        return makeNumber(start);

    throw LexError(start, std::string{"character '"} + c + "'");
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (true) {
        Token t = next();
        const bool end = t.type == TokenType::End;
        out.push_back(std::move(t));
        if (end)
            break;
    }
    return out;
}

} // namespace tabula
