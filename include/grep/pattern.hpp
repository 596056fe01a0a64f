#ifndef GREP_PATTERN_HPP
#define GREP_PATTERN_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace grep {

enum class PatternType {
    Literal, // one exact character
    AnyChar, // .
    WordChar, // \w match [A-Za-z0-9_]
    CharClass, // [abc], [^abc], \d
    StartAnchor, // ^
    EndAnchor, // $
    Sequence, // children matched one after the other
    Alternation, // a|b, first branch that matches wins
    Repeat, // *, +, ?, {m,n} applied to children[0]
    CaptureGroup, // (...) around children[0]
    Backreference // \1 .. \9
};

// One node of a compiled pattern. Which fields are meaningful depends on type:
//   Literal       ch
//   CharClass     members, negated
//   Repeat        min, max (empty = unbounded), children[0] is the body
//   CaptureGroup  group, children[0] is the body
//   Backreference group
//   Sequence / Alternation  children
// A node owns its children. Nothing mutates a Pattern once the compiler returned it.
struct Pattern {
    PatternType type = PatternType::Sequence;
    char ch = '\0';
    std::string members;
    bool negated = false;
    std::size_t min = 0;
    std::optional<std::size_t> max;
    std::size_t group = 0; // 1-based group number for CaptureGroup and Backreference
    std::vector<Pattern> children;

    static Pattern literal(char c);
    static Pattern any_char();
    static Pattern word_char();
    static Pattern char_class(std::string members, bool negated);
    static Pattern digit();
    static Pattern start_anchor();
    static Pattern end_anchor();
    static Pattern sequence(std::vector<Pattern> items);
    static Pattern alternation(std::vector<Pattern> branches);
    static Pattern repeat(std::size_t min, std::optional<std::size_t> max, Pattern body);
    static Pattern capture_group(std::size_t group, Pattern body);
    static Pattern backreference(std::size_t group);

    const Pattern& body() const { return children.front(); }
};

bool operator==(const Pattern& a, const Pattern& b);
bool operator!=(const Pattern& a, const Pattern& b);

// e.g. Repeat{min: 2, max: 3, Literal('a')}
std::ostream& operator<<(std::ostream& os, const Pattern& p);
std::string to_string(const Pattern& p);

const char* type_name(PatternType type);

// highest group number declared anywhere in the tree, 0 when there is none
std::size_t capture_count(const Pattern& p);

} // namespace grep

#endif // GREP_PATTERN_HPP
