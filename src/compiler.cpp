#include "grep/compiler.hpp"
#include "grep/debug.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace grep {

ParseError::ParseError(const std::string& message, std::size_t offset)
    : std::runtime_error(message + " at offset " + std::to_string(offset)), offset_(offset) {}

static inline bool is_digit(char c){
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// reads a run of decimal digits starting at i, advancing i past them
static std::optional<std::size_t> read_number(const std::string& pattern, std::size_t& i){
    std::size_t start = i;
    std::size_t value = 0;
    while (i < pattern.size() && is_digit(pattern[i])){
        std::size_t d = static_cast<std::size_t>(pattern[i] - '0');
        if (value > (SIZE_MAX - d) / 10){
            throw ParseError("malformed repeat count, number too large", start);
        }
        value = value * 10 + d;
        ++i;
    }
    if (i == start) return std::nullopt;
    return value;
}

// {m}, {m,} or {m,n}; i points at '{' and is left on the closing '}'
static Token tokenize_repeat_count(const std::string& pattern, std::size_t& i){
    std::size_t open = i;
    std::size_t n = pattern.size();
    ++i;
    if (pattern.find('}', i) == std::string::npos){
        throw ParseError("unterminated '{'", open);
    }

    Token tok{TokenType::RepeatCount, "", open};
    auto min = read_number(pattern, i);
    if (!min) throw ParseError("malformed repeat count, expected a number after '{'", i);
    tok.min = *min;
    tok.max = *min;

    if (i < n && pattern[i] == ','){
        ++i;
        tok.max = read_number(pattern, i); // nothing after the comma means unbounded
    }
    if (i >= n || pattern[i] != '}'){
        throw ParseError("malformed repeat count, expected '}'", i);
    }
    if (tok.max && *tok.max < tok.min){
        throw ParseError("malformed repeat count, upper bound below lower bound", open);
    }
    return tok;
}

std::vector<Token> tokenize(const std::string& pattern){
    std::vector<Token> toks;
    std::size_t i = 0, n = pattern.size();
    while (i < n){
        char c = pattern[i];
        GREP_DBG_PRINT("Tokenize pattern: " << c);

        if (c == '\\'){
            if (i + 1 >= n) throw ParseError("unterminated escape", i);
            char next = pattern[i + 1];
            if (next == 'd'){
                toks.push_back({TokenType::Digit, "", i});
            } else if (next == 'w'){
                toks.push_back({TokenType::WordChar, "", i});
            } else if (next >= '1' && next <= '9'){
                Token tok{TokenType::BackRef, "", i};
                tok.min = static_cast<std::size_t>(next - '0');
                toks.push_back(tok);
                GREP_DBG_PRINT("Created BackRef token: \\" << tok.min);
            } else {
                toks.push_back({TokenType::Literal, std::string(1, next), i});
            }
            i += 2;
        }
        else if (c == '['){
            std::size_t j = i + 1;
            bool is_negative = false;
            if (j < n && pattern[j] == '^') {is_negative = true; j++;}

            std::string cls;
            bool closed = false;
            for (; j < n; ++j) {
                if (pattern[j] == ']') {closed = true; break;}
                cls.push_back(pattern[j]);
            }
            if (!closed) throw ParseError("unterminated character class", i);
            toks.push_back({is_negative ? TokenType::NegCharClass : TokenType::CharClass, cls, i});
            i = j + 1;
        }
        else if (c == '{'){
            toks.push_back(tokenize_repeat_count(pattern, i));
            i += 1;
        }
        else if (c == '^'){
            toks.push_back({TokenType::Caret, "", i});
            i += 1;
        }
        else if (c == '$'){
            // only a '$' with nothing after it is an anchor
            if (i + 1 == n){
                GREP_DBG_PRINT("Token for End Anchor created");
                toks.push_back({TokenType::EndAnchor, "", i});
            } else {
                toks.push_back({TokenType::Literal, "$", i});
            }
            i += 1;
        }
        else if (c == '*'){
            toks.push_back({TokenType::StarQuantifier, "", i});
            i += 1;
        }
        else if (c == '+'){
            toks.push_back({TokenType::PlusQuantifier, "", i});
            i += 1;
        }
        else if (c == '?'){
            toks.push_back({TokenType::QuestionQuantifier, "", i});
            i += 1;
        }
        else if (c == '.'){
            toks.push_back({TokenType::AnyChar, "", i});
            i += 1;
        }
        else if (c == '('){
            toks.push_back({TokenType::LeftParen, "", i});
            i += 1;
        }
        else if (c == ')'){
            toks.push_back({TokenType::RightParen, "", i});
            i += 1;
        }
        else if (c == '|'){
            toks.push_back({TokenType::Alternation, "", i});
            i += 1;
        }
        else {
            toks.push_back({TokenType::Literal, std::string(1, c), i});
            i += 1;
        }
    }
    return toks;
}

struct ParseCtx {
    const std::vector<Token>& toks;
    std::size_t j = 0; // next token to read
    std::size_t next_gid = 1; // number handed to the next '(' we meet
};

static Pattern make_sequence(std::vector<Pattern> items){
    if (items.size() == 1) return std::move(items.front());
    return Pattern::sequence(std::move(items));
}

// close a level: the pending sequence becomes the last branch
static Pattern finish_level(std::vector<Pattern>& alternatives, std::vector<Pattern>& current, bool saw_bar){
    if (!current.empty() || saw_bar){
        alternatives.push_back(make_sequence(std::move(current)));
    }
    if (alternatives.empty()) return Pattern::sequence({});
    if (alternatives.size() == 1) return std::move(alternatives.front());
    return Pattern::alternation(std::move(alternatives));
}

static void apply_quantifier(std::vector<Pattern>& current, const Token& tok, std::size_t min, std::optional<std::size_t> max){
    if (current.empty()){
        throw ParseError("invalid quantifier, nothing to repeat", tok.pos);
    }
    Pattern body = std::move(current.back());
    current.pop_back();
    current.push_back(Pattern::repeat(min, max, std::move(body)));
}

// Parses until the matching ')' (when open_paren is set) or the end of the tokens.
static Pattern parse_level(ParseCtx& ctx, std::optional<std::size_t> open_paren){
    std::vector<Pattern> alternatives;
    std::vector<Pattern> current;
    bool saw_bar = false;

    while (ctx.j < ctx.toks.size()){
        const Token& tok = ctx.toks[ctx.j++];
        switch (tok.type){
            case TokenType::Literal:
                current.push_back(Pattern::literal(tok.data[0]));
                break;
            case TokenType::AnyChar:
                current.push_back(Pattern::any_char());
                break;
            case TokenType::WordChar:
                current.push_back(Pattern::word_char());
                break;
            case TokenType::Digit:
                current.push_back(Pattern::digit());
                break;
            case TokenType::CharClass:
                current.push_back(Pattern::char_class(tok.data, false));
                break;
            case TokenType::NegCharClass:
                current.push_back(Pattern::char_class(tok.data, true));
                break;
            case TokenType::Caret:
                if (current.empty()) current.push_back(Pattern::start_anchor());
                else current.push_back(Pattern::literal('^'));
                break;
            case TokenType::EndAnchor:
                current.push_back(Pattern::end_anchor());
                break;
            case TokenType::StarQuantifier:
                apply_quantifier(current, tok, 0, std::nullopt);
                break;
            case TokenType::PlusQuantifier:
                apply_quantifier(current, tok, 1, std::nullopt);
                break;
            case TokenType::QuestionQuantifier:
                apply_quantifier(current, tok, 0, 1);
                break;
            case TokenType::RepeatCount:
                apply_quantifier(current, tok, tok.min, tok.max);
                break;
            case TokenType::BackRef:
                current.push_back(Pattern::backreference(tok.min));
                break;
            case TokenType::LeftParen: {
                // numbered on the way in, so outer groups get lower numbers than inner ones
                std::size_t gid = ctx.next_gid++;
                Pattern body = parse_level(ctx, tok.pos);
                current.push_back(Pattern::capture_group(gid, std::move(body)));
                break;
            }
            case TokenType::RightParen:
                if (!open_paren) throw ParseError("unmatched ')'", tok.pos);
                return finish_level(alternatives, current, saw_bar);
            case TokenType::Alternation:
                alternatives.push_back(make_sequence(std::move(current)));
                current.clear();
                saw_bar = true;
                break;
        }
    }

    if (open_paren) throw ParseError("unterminated group, missing ')'", *open_paren);
    return finish_level(alternatives, current, saw_bar);
}

Pattern compile(const std::string& pattern){
    GREP_DBG_PRINT("Compiling pattern: " << pattern);
    auto toks = tokenize(pattern);
    if (toks.empty()) throw ParseError("empty pattern", 0);

    ParseCtx ctx{toks};
    Pattern root = parse_level(ctx, std::nullopt);
    GREP_DBG_PRINT("Compiled: " << root);
    return root;
}

} // namespace grep
