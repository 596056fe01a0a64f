#ifndef GREP_COMPILER_HPP
#define GREP_COMPILER_HPP

#include "grep/pattern.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace grep {

// Thrown by compile() for any syntax problem; no partial pattern is ever returned.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t offset);

    // byte offset in the pattern text where the problem was found
    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

enum class TokenType {
    Literal, // any literal character, also \x for an unknown x
    AnyChar, // .
    WordChar, // \w
    Digit, // \d
    CharClass, // [abc]
    NegCharClass, // [^abc]
    Caret, // ^, an anchor only at the start of a sequence
    EndAnchor, // $ as the last character of the pattern
    StarQuantifier, // zero or more
    PlusQuantifier, // one or more
    QuestionQuantifier, // zero or one
    RepeatCount, // {m}, {m,}, {m,n}
    LeftParen,
    RightParen,
    Alternation, // |
    BackRef // \1 .. \9
};

struct Token {
    TokenType type;
    std::string data; // for Literal, CharClass and NegCharClass
    std::size_t pos = 0; // offset of the token in the pattern text
    std::size_t min = 0; // RepeatCount lower bound, BackRef group number
    std::optional<std::size_t> max; // RepeatCount upper bound, empty = unbounded
};

std::vector<Token> tokenize(const std::string& pattern);

// Compile pattern text into a Pattern tree. Throws ParseError.
Pattern compile(const std::string& pattern);

} // namespace grep

#endif // GREP_COMPILER_HPP
