#include "grep/pattern.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace grep {

Pattern Pattern::literal(char c){
    Pattern p;
    p.type = PatternType::Literal;
    p.ch = c;
    return p;
}

Pattern Pattern::any_char(){
    Pattern p;
    p.type = PatternType::AnyChar;
    return p;
}

Pattern Pattern::word_char(){
    Pattern p;
    p.type = PatternType::WordChar;
    return p;
}

Pattern Pattern::char_class(std::string members, bool negated){
    Pattern p;
    p.type = PatternType::CharClass;
    p.members = std::move(members);
    p.negated = negated;
    return p;
}

Pattern Pattern::digit(){
    return char_class("0123456789", false);
}

Pattern Pattern::start_anchor(){
    Pattern p;
    p.type = PatternType::StartAnchor;
    return p;
}

Pattern Pattern::end_anchor(){
    Pattern p;
    p.type = PatternType::EndAnchor;
    return p;
}

Pattern Pattern::sequence(std::vector<Pattern> items){
    Pattern p;
    p.type = PatternType::Sequence;
    p.children = std::move(items);
    return p;
}

Pattern Pattern::alternation(std::vector<Pattern> branches){
    Pattern p;
    p.type = PatternType::Alternation;
    p.children = std::move(branches);
    return p;
}

Pattern Pattern::repeat(std::size_t min, std::optional<std::size_t> max, Pattern body){
    Pattern p;
    p.type = PatternType::Repeat;
    p.min = min;
    p.max = max;
    p.children.push_back(std::move(body));
    return p;
}

Pattern Pattern::capture_group(std::size_t group, Pattern body){
    Pattern p;
    p.type = PatternType::CaptureGroup;
    p.group = group;
    p.children.push_back(std::move(body));
    return p;
}

Pattern Pattern::backreference(std::size_t group){
    Pattern p;
    p.type = PatternType::Backreference;
    p.group = group;
    return p;
}

// only the fields the node type uses take part in the comparison
bool operator==(const Pattern& a, const Pattern& b){
    if (a.type != b.type) return false;
    switch (a.type){
        case PatternType::Literal:
            return a.ch == b.ch;
        case PatternType::CharClass:
            return a.negated == b.negated && a.members == b.members;
        case PatternType::Repeat:
            return a.min == b.min && a.max == b.max && a.children == b.children;
        case PatternType::CaptureGroup:
            return a.group == b.group && a.children == b.children;
        case PatternType::Backreference:
            return a.group == b.group;
        case PatternType::Sequence:
        case PatternType::Alternation:
            return a.children == b.children;
        case PatternType::AnyChar:
        case PatternType::WordChar:
        case PatternType::StartAnchor:
        case PatternType::EndAnchor:
            return true;
    }
    return false;
}

bool operator!=(const Pattern& a, const Pattern& b){
    return !(a == b);
}

const char* type_name(PatternType type){
    switch (type){
        case PatternType::Literal: return "Literal";
        case PatternType::AnyChar: return "AnyChar";
        case PatternType::WordChar: return "WordChar";
        case PatternType::CharClass: return "CharClass";
        case PatternType::StartAnchor: return "StartAnchor";
        case PatternType::EndAnchor: return "EndAnchor";
        case PatternType::Sequence: return "Sequence";
        case PatternType::Alternation: return "Alternation";
        case PatternType::Repeat: return "Repeat";
        case PatternType::CaptureGroup: return "CaptureGroup";
        case PatternType::Backreference: return "Backreference";
    }
    return "?";
}

static void print_children(std::ostream& os, const std::vector<Pattern>& children){
    for (std::size_t k = 0; k < children.size(); ++k){
        if (k > 0) os << ", ";
        os << children[k];
    }
}

std::ostream& operator<<(std::ostream& os, const Pattern& p){
    os << type_name(p.type);
    switch (p.type){
        case PatternType::Literal:
            os << "('" << p.ch << "')";
            break;
        case PatternType::CharClass:
            os << "{members: \"" << p.members << "\", negated: " << (p.negated ? "true" : "false") << "}";
            break;
        case PatternType::Repeat:
            os << "{min: " << p.min << ", max: ";
            if (p.max) os << *p.max; else os << "none";
            os << ", " << p.body() << "}";
            break;
        case PatternType::CaptureGroup:
            os << "{group: " << p.group << ", " << p.body() << "}";
            break;
        case PatternType::Backreference:
            os << "(" << p.group << ")";
            break;
        case PatternType::Sequence:
        case PatternType::Alternation:
            os << "[";
            print_children(os, p.children);
            os << "]";
            break;
        default:
            break;
    }
    return os;
}

std::string to_string(const Pattern& p){
    std::ostringstream out;
    out << p;
    return out.str();
}

std::size_t capture_count(const Pattern& p){
    std::size_t n = p.type == PatternType::CaptureGroup ? p.group : 0;
    for (const Pattern& child : p.children){
        n = std::max(n, capture_count(child));
    }
    return n;
}

} // namespace grep
