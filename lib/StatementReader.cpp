#include "tabula/StatementReader.h"

#include <istream>
#include <ostream>
#include <string>

namespace tabula {

namespace {

enum class ScanMode { Code, Quoted, LineComment, BlockComment };

void trimBlanks(std::string& s) {
    constexpr const char* kBlanks = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(kBlanks);
    if (first == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(s.find_last_not_of(kBlanks) + 1);
    s.erase(0, first);
}

} // namespace

StatementReader::StatementReader(std::istream& in) : in_(in), interactive_(&in == &std::cin) {}

void StatementReader::printPrompt(std::ostream& out) const {
    if (interactive_)
        out << "tabula> " << std::flush;
}

std::optional<std::string> StatementReader::cutStatement(bool atEof) {
    for (;;) {
        std::string text;
        ScanMode mode = ScanMode::Code;
        bool terminated = false;

        std::size_t i = 0;
        for (; i < buffer_.size() && !terminated; ++i) {
            const char c = buffer_[i];
            const char ahead = i + 1 < buffer_.size() ? buffer_[i + 1] : '\0';

            switch (mode) {
            case ScanMode::Quoted:
                // a doubled quote closes and immediately reopens the literal
                text.push_back(c);
                if (c == '\'')
                    mode = ScanMode::Code;
                break;
            case ScanMode::LineComment:
                if (c == '\n')
                    terminated = true;
                break;
            case ScanMode::BlockComment:
                if (c == '*' && ahead == '/') {
                    mode = ScanMode::Code;
                    ++i;
                }
                break;
            case ScanMode::Code:
                if (c == ';' || c == '\n') {
                    terminated = true;
                } else if (c == '-' && ahead == '-') {
                    mode = ScanMode::LineComment;
                    ++i;
                } else if (c == '/' && ahead == '*') {
                    mode = ScanMode::BlockComment;
                    ++i;
                } else {
                    if (c == '\'')
                        mode = ScanMode::Quoted;
                    text.push_back(c);
                }
                break;
            }
        }

        if (!terminated && !atEof)
            return std::nullopt;

        buffer_.erase(0, i);
        trimBlanks(text);
        if (!text.empty())
            return text;
        if (!terminated)
            return std::nullopt;
        // blank line, stray ';' or a comment on its own: keep going
    }
}

std::optional<std::string> StatementReader::next() {
    if (auto st = cutStatement(false))
        return st;

    std::string line;
    while (std::getline(in_, line)) {
        buffer_ += line;
        buffer_ += '\n';
        if (auto st = cutStatement(false))
            return st;
    }
    return cutStatement(true);
}

} // namespace tabula
