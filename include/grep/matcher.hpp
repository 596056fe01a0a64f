#ifndef GREP_MATCHER_HPP
#define GREP_MATCHER_HPP

#include "grep/pattern.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grep {

// half-open byte range [begin, end) of the subject string
struct Span {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - begin; }
};

// Captures of one match attempt: a slot per group plus an undo trail.
// Every write goes through the trail, so rolling back to a checkpoint puts each
// slot back to what it held when the checkpoint was taken.
class CaptureState {
public:
    explicit CaptureState(std::size_t group_count);

    void set(std::size_t group, Span span);
    // nullptr when the group is unknown or has not matched yet
    const Span* get(std::size_t group) const;

    std::size_t checkpoint() const { return trail_.size(); }
    void rollback(std::size_t mark);

    std::size_t group_count() const { return slots_.size(); }
    // number of groups currently holding a capture
    std::size_t filled() const;

private:
    std::vector<std::optional<Span>> slots_; // index = group number - 1
    std::vector<std::pair<std::size_t, std::optional<Span>>> trail_; // (slot, previous value)
};

struct Match {
    Span span; // the part of the subject the whole pattern consumed
    std::vector<std::optional<std::string>> groups; // group n at index n-1, empty if it never matched
};

// Try node at pos. On success returns the position after the (greedy) extent it consumed,
// zero-width nodes return pos itself. On failure returns nullopt and leaves captures
// exactly as they were before the call.
std::optional<std::size_t> consume(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures);

bool matches_here(const Pattern& node, std::string_view input, std::size_t pos, CaptureState& captures);

// First (leftmost) match of pattern anywhere in input.
std::optional<Match> find_match(const Pattern& pattern, std::string_view input);

bool is_match(const Pattern& pattern, std::string_view input);

// '\n' separated lines of text, views into text; an empty text has no lines
std::vector<std::string_view> split_lines(std::string_view text);

// true when any line of text (as split_lines cuts it) matches
bool matches_any_line(const Pattern& pattern, std::string_view text);

} // namespace grep

#endif // GREP_MATCHER_HPP
