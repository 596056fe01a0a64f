#include "grep/matcher.hpp"
#include "grep/debug.hpp"

#include <cctype>

namespace grep {

CaptureState::CaptureState(std::size_t group_count) : slots_(group_count) {}

void CaptureState::set(std::size_t group, Span span){
    if (group == 0 || group > slots_.size()) return;
    trail_.emplace_back(group - 1, slots_[group - 1]);
    slots_[group - 1] = span;
}

const Span* CaptureState::get(std::size_t group) const {
    if (group == 0 || group > slots_.size() || !slots_[group - 1]) return nullptr;
    return &*slots_[group - 1];
}

void CaptureState::rollback(std::size_t mark){
    while (trail_.size() > mark){
        auto& undo = trail_.back();
        slots_[undo.first] = undo.second;
        trail_.pop_back();
    }
}

std::size_t CaptureState::filled() const {
    std::size_t n = 0;
    for (const auto& slot : slots_) if (slot) ++n;
    return n;
}

static inline bool is_word_char(unsigned char ch){
    return std::isalnum(ch) || ch == '_';
}

static inline bool in_class(char ch, const std::string& set){
    return set.find(ch) != std::string::npos;
}

// single character nodes
static bool match_atom(const Pattern& node, char ch){
    switch (node.type){
        case PatternType::Literal:
            return ch == node.ch;
        case PatternType::AnyChar:
            return true;
        case PatternType::WordChar:
            return is_word_char(static_cast<unsigned char>(ch));
        case PatternType::CharClass:
            return in_class(ch, node.members) != node.negated;
        default:
            return false;
    }
}

static std::optional<std::size_t> consume_sequence(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures){
    std::size_t mark = captures.checkpoint();
    std::size_t cur = pos;
    for (const Pattern& child : node.children){
        auto next = consume(child, input, cur, captures);
        if (!next){
            captures.rollback(mark);
            return std::nullopt;
        }
        cur = *next;
    }
    return cur;
}

// first branch that matches wins, even when a later one would consume more
static std::optional<std::size_t> consume_alternation(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures){
    std::size_t mark = captures.checkpoint();
    for (const Pattern& branch : node.children){
        auto next = consume(branch, input, pos, captures);
        if (next) return next;
        captures.rollback(mark);
    }
    return std::nullopt;
}

// Greedy and possessive: takes as many repetitions as the body allows and never
// gives one back to let a later sibling match.
static std::optional<std::size_t> consume_repeat(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures){
    std::size_t mark = captures.checkpoint();
    std::size_t count = 0;
    std::size_t cur = pos;
    while (!node.max || count < *node.max){
        auto next = consume(node.body(), input, cur, captures);
        if (!next) break;
        ++count;
        if (*next == cur){
            // an empty repetition can be repeated any number of times at the same spot
            if (count < node.min) count = node.min;
            break;
        }
        cur = *next;
    }
    if (count < node.min){
        captures.rollback(mark);
        return std::nullopt;
    }
    return cur;
}

static std::optional<std::size_t> consume_backreference(const Pattern& node, std::string_view input, std::size_t pos, const CaptureState& captures){
    const Span* span = captures.get(node.group);
    GREP_DBG_PRINT("Matching BackRef \\" << node.group << " ; has=" << (span != nullptr));
    if (!span) return std::nullopt;

    std::string_view text = input.substr(span->begin, span->size());
    GREP_DBG_PRINT("BackRef text = \"" << text << "\" at input pos " << pos);
    if (input.size() - pos < text.size()) return std::nullopt;
    if (input.compare(pos, text.size(), text) != 0) return std::nullopt;
    return pos + text.size();
}

std::optional<std::size_t> consume(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures){
    switch (node.type){
        case PatternType::Literal:
        case PatternType::AnyChar:
        case PatternType::WordChar:
        case PatternType::CharClass:
            if (pos >= input.size() || !match_atom(node, input[pos])) return std::nullopt;
            return pos + 1;
        case PatternType::StartAnchor:
            if (pos != 0) return std::nullopt;
            return pos;
        case PatternType::EndAnchor:
            if (pos != input.size()) return std::nullopt;
            return pos;
        case PatternType::Sequence:
            return consume_sequence(node, input, pos, captures);
        case PatternType::Alternation:
            return consume_alternation(node, input, pos, captures);
        case PatternType::Repeat:
            return consume_repeat(node, input, pos, captures);
        case PatternType::CaptureGroup: {
            // the body cleans up after itself when it fails, so there is nothing to undo here
            auto next = consume(node.body(), input, pos, captures);
            if (next) captures.set(node.group, Span{pos, *next});
            return next;
        }
        case PatternType::Backreference:
            return consume_backreference(node, input, pos, captures);
    }
    return std::nullopt;
}

bool matches_here(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures){
    return consume(node, input, pos, captures).has_value();
}

static bool starts_with_anchor(const Pattern& p){
    if (p.type == PatternType::StartAnchor) return true;
    return p.type == PatternType::Sequence && !p.children.empty()
        && p.children.front().type == PatternType::StartAnchor;
}

static bool ends_with_anchor(const Pattern& p){
    if (p.type == PatternType::EndAnchor) return true;
    return p.type == PatternType::Sequence && !p.children.empty()
        && p.children.back().type == PatternType::EndAnchor;
}

std::optional<Match> find_match(const Pattern& pattern, std::string_view input){
    std::size_t groups = capture_count(pattern);
    std::size_t last = starts_with_anchor(pattern) ? 0 : input.size();
    bool must_reach_end = ends_with_anchor(pattern);

    for (std::size_t start = 0; start <= last; ++start){
        GREP_DBG_PRINT("Trying match at offset " << start);
        CaptureState captures(groups);
        auto end = consume(pattern, input, start, captures);
        if (!end) continue;
        if (must_reach_end && *end != input.size()) continue;

        Match m;
        m.span = Span{start, *end};
        m.groups.resize(groups);
        for (std::size_t g = 1; g <= groups; ++g){
            if (const Span* span = captures.get(g)){
                m.groups[g - 1] = std::string(input.substr(span->begin, span->size()));
            }
        }
        GREP_DBG_PRINT("Matched [" << start << ", " << *end << ")");
        return m;
    }
    return std::nullopt;
}

bool is_match(const Pattern& pattern, std::string_view input){
    return find_match(pattern, input).has_value();
}

std::vector<std::string_view> split_lines(std::string_view text){
    std::vector<std::string_view> lines;
    std::size_t begin = 0;
    while (begin < text.size()){
        std::size_t nl = text.find('\n', begin);
        if (nl == std::string_view::npos) nl = text.size();
        lines.push_back(text.substr(begin, nl - begin));
        begin = nl + 1;
    }
    return lines;
}

bool matches_any_line(const Pattern& pattern, std::string_view text){
    for (std::string_view line : split_lines(text)){
        if (is_match(pattern, line)) return true;
    }
    return false;
}

} // namespace grep
