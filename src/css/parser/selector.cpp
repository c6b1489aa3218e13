#include <lolite/css/parser/selector.h>
#include <lolite/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace lolite::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_structural_pseudo(const std::string& name) {
    return name == "root" || name == "first-child" || name == "last-child" ||
           name == "only-child" || name == "empty";
}

bool is_nth_pseudo(const std::string& name) {
    return name == "nth-child" || name == "nth-last-child";
}

std::string strip_spaces(std::string_view text) {
    std::string out;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

bool parse_int(std::string_view text, int& out) {
    if (text.empty()) return false;
    if (text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

// ---------------------------------------------------------------------------
// Specificity
// ---------------------------------------------------------------------------

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    return c < other.c;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity compute_specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (auto& part : selector.parts) {
        for (auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Id:
                    spec.a++;
                    break;
                case SimpleSelectorType::Class:
                case SimpleSelectorType::Attribute:
                case SimpleSelectorType::PseudoClass:
                    spec.b++;
                    break;
                case SimpleSelectorType::Type:
                    spec.c++;
                    break;
                case SimpleSelectorType::Universal:
                    break;
            }
        }
    }
    return spec;
}

// ---------------------------------------------------------------------------
// an+b
// ---------------------------------------------------------------------------

bool NthExpression::matches(int index) const {
    if (a == 0) {
        return index == b;
    }
    // index = a*n + b for some n >= 0
    int diff = index - b;
    if (diff % a != 0) return false;
    return diff / a >= 0;
}

std::optional<NthExpression> parse_nth_expression(std::string_view text) {
    std::string s = strip_spaces(text);
    if (s.empty()) return std::nullopt;
    if (s == "odd") return NthExpression{2, 1};
    if (s == "even") return NthExpression{2, 0};

    NthExpression expr;
    auto n_pos = s.find('n');
    if (n_pos == std::string::npos) {
        if (!parse_int(s, expr.b)) return std::nullopt;
        return expr;
    }

    std::string a_part = s.substr(0, n_pos);
    std::string b_part = s.substr(n_pos + 1);
    if (a_part.empty() || a_part == "+") {
        expr.a = 1;
    } else if (a_part == "-") {
        expr.a = -1;
    } else if (!parse_int(a_part, expr.a)) {
        return std::nullopt;
    }

    if (!b_part.empty()) {
        if (b_part.front() != '+' && b_part.front() != '-') return std::nullopt;
        if (!parse_int(b_part, expr.b)) return std::nullopt;
    }
    return expr;
}

// ---------------------------------------------------------------------------
// Selector Parser
// ---------------------------------------------------------------------------

// Parses selectors from a token stream, recording the first error.
class SelectorParser {
public:
    explicit SelectorParser(std::vector<CSSToken> tokens)
        : tokens_(std::move(tokens)), pos_(0) {}

    std::optional<SelectorList> parse();
    const std::string& error() const { return error_; }

private:
    std::vector<CSSToken> tokens_;
    size_t pos_;
    std::string error_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    bool fail(std::string message);

    bool parse_complex_selector(ComplexSelector& out);
    bool parse_compound_selector(CompoundSelector& out);
    bool parse_attribute_selector(SimpleSelector& out);
    bool parse_pseudo_class(SimpleSelector& out);
    std::optional<Combinator> try_parse_combinator();
};

const CSSToken& SelectorParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static CSSToken eof{CSSToken::EndOfFile, "", 0, "", false};
    return eof;
}

bool SelectorParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void SelectorParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void SelectorParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
    }
}

bool SelectorParser::fail(std::string message) {
    if (error_.empty()) {
        error_ = std::move(message);
    }
    return false;
}

std::optional<SelectorList> SelectorParser::parse() {
    SelectorList list;
    skip_whitespace();

    if (at_end()) {
        fail("empty selector");
        return std::nullopt;
    }

    while (true) {
        ComplexSelector complex;
        if (!parse_complex_selector(complex)) {
            return std::nullopt;
        }
        list.selectors.push_back(std::move(complex));

        skip_whitespace();
        if (at_end()) break;
        if (current().type != CSSToken::Comma) {
            fail("unexpected '" + current().value + "' in selector");
            return std::nullopt;
        }
        advance(); // skip comma
        skip_whitespace();
        if (at_end()) {
            fail("trailing comma in selector list");
            return std::nullopt;
        }
    }

    return list;
}

bool SelectorParser::parse_complex_selector(ComplexSelector& result) {
    skip_whitespace();
    ComplexSelector::Part first_part;
    if (!parse_compound_selector(first_part.compound)) {
        return false;
    }
    result.parts.push_back(std::move(first_part));

    while (!at_end()) {
        auto maybe_comb = try_parse_combinator();
        if (!maybe_comb.has_value()) {
            break;
        }

        skip_whitespace();
        if (at_end() || current().type == CSSToken::Comma) {
            return fail("combinator without a following selector");
        }

        ComplexSelector::Part part;
        if (!parse_compound_selector(part.compound)) {
            return false;
        }
        part.combinator = maybe_comb;
        result.parts.push_back(std::move(part));
    }

    return true;
}

std::optional<Combinator> SelectorParser::try_parse_combinator() {
    size_t saved = pos_;

    bool had_whitespace = false;
    if (!at_end() && current().type == CSSToken::Whitespace) {
        had_whitespace = true;
        skip_whitespace();
    }

    if (at_end() || current().type == CSSToken::Comma) {
        pos_ = saved;
        return std::nullopt;
    }

    if (current().type == CSSToken::Delim) {
        if (current().value == ">") {
            advance();
            skip_whitespace();
            return Combinator::Child;
        }
        if (current().value == "+") {
            advance();
            skip_whitespace();
            return Combinator::NextSibling;
        }
        if (current().value == "~") {
            advance();
            skip_whitespace();
            return Combinator::SubsequentSibling;
        }
    }

    if (had_whitespace) {
        return Combinator::Descendant;
    }

    pos_ = saved;
    return std::nullopt;
}

bool SelectorParser::parse_compound_selector(CompoundSelector& compound) {
    while (!at_end()) {
        auto& tok = current();

        if (tok.type == CSSToken::Ident) {
            if (!compound.simple_selectors.empty()) {
                return fail("type selector must come first in '" + tok.value + "'");
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Type;
            ss.value = ascii_lower(tok.value);
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Delim && tok.value == "*") {
            if (!compound.simple_selectors.empty()) {
                return fail("universal selector must come first");
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Universal;
            ss.value = "*";
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        // .name
        if (tok.type == CSSToken::Delim && tok.value == ".") {
            advance();
            if (at_end() || current().type != CSSToken::Ident) {
                return fail("expected class name after '.'");
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Class;
            ss.value = current().value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        // #name
        if (tok.type == CSSToken::Hash) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Id;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::LeftBracket) {
            SimpleSelector ss;
            if (!parse_attribute_selector(ss)) {
                return false;
            }
            compound.simple_selectors.push_back(std::move(ss));
            continue;
        }

        if (tok.type == CSSToken::Colon) {
            SimpleSelector ss;
            if (!parse_pseudo_class(ss)) {
                return false;
            }
            compound.simple_selectors.push_back(std::move(ss));
            continue;
        }

        break;
    }

    if (compound.simple_selectors.empty()) {
        if (at_end()) {
            return fail("expected selector");
        }
        return fail("unexpected '" + current().value + "' in selector");
    }
    return true;
}

bool SelectorParser::parse_pseudo_class(SimpleSelector& ss) {
    advance(); // skip ':'
    if (!at_end() && current().type == CSSToken::Colon) {
        advance();
        std::string name = at_end() ? std::string() : current().value;
        return fail("pseudo-element '::" + name + "' is not supported");
    }
    if (at_end()) {
        return fail("expected pseudo-class name after ':'");
    }

    ss.type = SimpleSelectorType::PseudoClass;
    ss.value = ascii_lower(current().value);

    if (current().type == CSSToken::Ident) {
        if (!is_structural_pseudo(ss.value)) {
            return fail("unsupported pseudo-class ':" + ss.value + "'");
        }
        advance();
        return true;
    }

    if (current().type != CSSToken::Function || !is_nth_pseudo(ss.value)) {
        return fail("unsupported pseudo-class ':" + ss.value + "'");
    }
    advance();

    std::string args;
    while (!at_end() && current().type != CSSToken::RightParen) {
        args += current().value;
        advance();
    }
    if (at_end()) {
        return fail("unterminated ':" + ss.value + "('");
    }
    advance(); // skip ')'

    auto nth = parse_nth_expression(args);
    if (!nth) {
        return fail("invalid argument '" + args + "' for ':" + ss.value + "'");
    }
    ss.argument = args;
    ss.nth = *nth;
    return true;
}

bool SelectorParser::parse_attribute_selector(SimpleSelector& ss) {
    ss.type = SimpleSelectorType::Attribute;

    advance(); // skip '['
    skip_whitespace();

    if (at_end() || current().type != CSSToken::Ident) {
        return fail("expected attribute name after '['");
    }
    ss.attr_name = current().value;
    advance();
    skip_whitespace();

    if (!at_end() && current().type == CSSToken::RightBracket) {
        ss.attr_match = AttributeMatch::Exists;
        advance();
        return true;
    }

    if (at_end() || current().type != CSSToken::Delim) {
        return fail("expected attribute operator");
    }

    std::string op = current().value;
    if (op == "=") {
        ss.attr_match = AttributeMatch::Exact;
        advance();
    } else if (op == "~" || op == "|" || op == "^" || op == "$" || op == "*") {
        advance();
        if (at_end() || current().type != CSSToken::Delim || current().value != "=") {
            return fail("expected '=' after '" + op + "'");
        }
        advance();
        if (op == "~") ss.attr_match = AttributeMatch::Includes;
        else if (op == "|") ss.attr_match = AttributeMatch::DashMatch;
        else if (op == "^") ss.attr_match = AttributeMatch::Prefix;
        else if (op == "$") ss.attr_match = AttributeMatch::Suffix;
        else ss.attr_match = AttributeMatch::Substring;
    } else {
        return fail("unknown attribute operator '" + op + "'");
    }

    skip_whitespace();
    if (at_end() || (current().type != CSSToken::String &&
                     current().type != CSSToken::Ident &&
                     current().type != CSSToken::Number)) {
        return fail("expected attribute value");
    }
    ss.attr_value = current().value;
    advance();
    skip_whitespace();

    if (at_end() || current().type != CSSToken::RightBracket) {
        return fail("expected ']' to close attribute selector");
    }
    advance();
    return true;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::optional<SelectorList> parse_selector_list(std::string_view input,
                                                std::string* error) {
    auto tokens = CSSTokenizer::tokenize_all(input);
    SelectorParser parser(std::move(tokens));
    auto list = parser.parse();
    if (!list && error != nullptr) {
        *error = parser.error();
    }
    return list;
}

std::string to_string(const ComplexSelector& selector) {
    std::string out;
    for (const auto& part : selector.parts) {
        if (part.combinator) {
            switch (*part.combinator) {
                case Combinator::Descendant:        out += " "; break;
                case Combinator::Child:             out += " > "; break;
                case Combinator::NextSibling:       out += " + "; break;
                case Combinator::SubsequentSibling: out += " ~ "; break;
            }
        }
        for (const auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Type:
                case SimpleSelectorType::Universal:
                    out += ss.value;
                    break;
                case SimpleSelectorType::Class:
                    out += "." + ss.value;
                    break;
                case SimpleSelectorType::Id:
                    out += "#" + ss.value;
                    break;
                case SimpleSelectorType::PseudoClass:
                    out += ":" + ss.value;
                    if (!ss.argument.empty()) {
                        out += "(" + ss.argument + ")";
                    }
                    break;
                case SimpleSelectorType::Attribute: {
                    out += "[" + ss.attr_name;
                    switch (ss.attr_match) {
                        case AttributeMatch::Exists:    break;
                        case AttributeMatch::Exact:     out += "="; break;
                        case AttributeMatch::Includes:  out += "~="; break;
                        case AttributeMatch::DashMatch: out += "|="; break;
                        case AttributeMatch::Prefix:    out += "^="; break;
                        case AttributeMatch::Suffix:    out += "$="; break;
                        case AttributeMatch::Substring: out += "*="; break;
                    }
                    if (ss.attr_match != AttributeMatch::Exists) {
                        out += "\"" + ss.attr_value + "\"";
                    }
                    out += "]";
                    break;
                }
            }
        }
    }
    return out;
}

} // namespace lolite::css
