#include <lolite/css/parser/tokenizer.h>
#include <cctype>
#include <cstdlib>

namespace lolite::css {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit &&
           is_integer == other.is_integer;
}

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input) {}

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

char CSSTokenizer::peek(size_t offset) const {
    return pos_ + offset < input_.size() ? input_[pos_ + offset] : '\0';
}

char CSSTokenizer::peek() const {
    return peek(0);
}

char CSSTokenizer::consume() {
    return at_end() ? '\0' : input_[pos_++];
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) --pos_;
}

CSSToken CSSTokenizer::make(CSSToken::Type type, std::string value, size_t start) const {
    CSSToken token{type, std::move(value)};
    token.position = start;
    return token;
}

// ---------------------------------------------------------------------------
// Lookahead predicates
// ---------------------------------------------------------------------------

bool CSSTokenizer::is_name_start_char(char c) const {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool CSSTokenizer::is_name_char(char c) const {
    return is_name_start_char(c) || is_digit(c) || c == '-';
}

bool CSSTokenizer::starts_identifier() const {
    switch (peek()) {
        case '-':
            return is_name_start_char(peek(1)) || peek(1) == '-' || peek(1) == '\\';
        case '\\':
            return peek(1) != '\n' && peek(1) != '\0';
        default:
            return is_name_start_char(peek());
    }
}

bool CSSTokenizer::starts_number() const {
    size_t i = (peek() == '+' || peek() == '-') ? 1 : 0;
    if (is_digit(peek(i))) return true;
    return peek(i) == '.' && is_digit(peek(i + 1));
}

// ---------------------------------------------------------------------------
// Sub-consumers
// ---------------------------------------------------------------------------

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && is_space(peek())) ++pos_;
}

// Expects the opening "/*" to be consumed. False if EOF came first.
bool CSSTokenizer::consume_comment() {
    size_t close = input_.find("*/", pos_);
    if (close == std::string_view::npos) {
        pos_ = input_.size();
        return false;
    }
    pos_ = close + 2;
    return true;
}

// Expects the backslash to be consumed. Hex escapes above ASCII become '?'.
void CSSTokenizer::consume_escape(std::string& out) {
    if (at_end()) return;
    if (!is_hex(peek())) {
        out += consume();
        return;
    }

    size_t start = pos_;
    while (pos_ - start < 6 && is_hex(peek())) ++pos_;
    unsigned long code =
        std::strtoul(std::string(input_.substr(start, pos_ - start)).c_str(), nullptr, 16);
    if (peek() == ' ' || peek() == '\t' || peek() == '\n') ++pos_;
    out += (code > 0 && code <= 0x7F) ? static_cast<char>(code) : '?';
}

std::string CSSTokenizer::consume_name() {
    std::string name;
    while (!at_end()) {
        if (is_name_char(peek())) {
            name += consume();
        } else if (peek() == '\\') {
            ++pos_;
            consume_escape(name);
        } else {
            break;
        }
    }
    return name;
}

double CSSTokenizer::consume_number_value() {
    size_t start = pos_;
    auto skip_digits = [this]() {
        while (is_digit(peek())) ++pos_;
    };

    if (peek() == '+' || peek() == '-') ++pos_;
    skip_digits();
    if (peek() == '.' && is_digit(peek(1))) {
        ++pos_;
        skip_digits();
    }
    if (peek() == 'e' || peek() == 'E') {
        size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
        if (is_digit(peek(1 + sign))) {
            pos_ += 1 + sign;
            skip_digits();
        }
    }
    return std::strtod(std::string(input_.substr(start, pos_ - start)).c_str(), nullptr);
}

// Expects the opening quote to be consumed. A raw newline ends the string
// without consuming it; only EOF marks it unterminated.
CSSToken CSSTokenizer::consume_string(char quote) {
    CSSToken token{CSSToken::String, ""};
    while (!at_end()) {
        char c = consume();
        if (c == quote) {
            return token;
        }
        if (c == '\n') {
            reconsume();
            return token;
        }
        if (c != '\\') {
            token.value += c;
        } else if (peek() == '\n') {
            ++pos_;  // line continuation
        } else if (!at_end()) {
            token.value += consume();
        }
    }
    token.unterminated = true;
    return token;
}

CSSToken CSSTokenizer::consume_numeric() {
    size_t start = pos_;
    double value = consume_number_value();
    std::string text(input_.substr(start, pos_ - start));

    CSSToken token{CSSToken::Number, text};
    token.numeric_value = value;
    token.is_integer = text.find_first_of(".eE") == std::string::npos;

    if (starts_identifier()) {
        token.type = CSSToken::Dimension;
        token.unit = consume_name();
        token.value += token.unit;
    } else if (peek() == '%') {
        ++pos_;
        token.type = CSSToken::Percentage;
        token.value += '%';
    }
    return token;
}

CSSToken CSSTokenizer::consume_ident_like() {
    std::string name = consume_name();
    if (peek() == '(') {
        ++pos_;
        return CSSToken{CSSToken::Function, std::move(name)};
    }
    return CSSToken{CSSToken::Ident, std::move(name)};
}

// Expects the '#' to be consumed.
CSSToken CSSTokenizer::consume_hash() {
    if (is_name_char(peek()) || peek() == '\\') {
        return CSSToken{CSSToken::Hash, consume_name()};
    }
    return CSSToken{CSSToken::Delim, "#"};
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

CSSToken CSSTokenizer::next_token() {
    size_t start = pos_;
    CSSToken token = next_token_impl(start);
    token.position = start;
    return token;
}

CSSToken CSSTokenizer::next_token_impl(size_t start) {
    // A comment reads as whitespace, so "a/**/b" stays two tokens.
    if (peek() == '/' && peek(1) == '*') {
        pos_ += 2;
        bool closed = consume_comment();
        consume_whitespace();
        CSSToken token = make(CSSToken::Whitespace, " ", start);
        token.unterminated = !closed;
        return token;
    }
    if (at_end()) {
        return make(CSSToken::EndOfFile, "", start);
    }

    char c = peek();
    if (is_space(c)) {
        consume_whitespace();
        return make(CSSToken::Whitespace, " ", start);
    }
    if (input_.compare(pos_, 4, "<!--") == 0) {
        pos_ += 4;
        return make(CSSToken::CDO, "<!--", start);
    }
    if (input_.compare(pos_, 3, "-->") == 0) {
        pos_ += 3;
        return make(CSSToken::CDC, "-->", start);
    }
    if (starts_number()) {
        return consume_numeric();
    }
    if (starts_identifier()) {
        return consume_ident_like();
    }

    ++pos_;
    switch (c) {
        case '"':
        case '\'':
            return consume_string(c);
        case '#':
            return consume_hash();
        case '@':
            if (starts_identifier()) {
                return make(CSSToken::AtKeyword, consume_name(), start);
            }
            return make(CSSToken::Delim, "@", start);
        case '(': return make(CSSToken::LeftParen, "(", start);
        case ')': return make(CSSToken::RightParen, ")", start);
        case '[': return make(CSSToken::LeftBracket, "[", start);
        case ']': return make(CSSToken::RightBracket, "]", start);
        case '{': return make(CSSToken::LeftBrace, "{", start);
        case '}': return make(CSSToken::RightBrace, "}", start);
        case ',': return make(CSSToken::Comma, ",", start);
        case ':': return make(CSSToken::Colon, ":", start);
        case ';': return make(CSSToken::Semicolon, ";", start);
        default:
            return make(CSSToken::Delim, std::string(1, c), start);
    }
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;
    do {
        tokens.push_back(tokenizer.next_token());
    } while (tokens.back().type != CSSToken::EndOfFile);
    return tokens;
}

} // namespace lolite::css
