#include <lolite/css/parser/stylesheet.h>
#include <algorithm>
#include <cctype>

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

} // namespace

// ---------------------------------------------------------------------------
// Internal stylesheet parser
// ---------------------------------------------------------------------------

class StyleSheetParser {
public:
    StyleSheetParser(std::string_view source, std::vector<CSSToken> tokens)
        : source_(source), tokens_(std::move(tokens)), pos_(0) {}

    StyleSheet parse();

private:
    std::string_view source_;
    std::vector<CSSToken> tokens_;
    size_t pos_;
    std::vector<ParseIssue> issues_;

    const CSSToken& current() const;
    bool at(CSSToken::Type type) const { return current().type == type; }
    bool at_end() const;
    void advance();
    void skip_whitespace();
    void report(size_t position, std::string message);

    std::optional<ParseIssue> find_unrecoverable() const;

    // Top-level parsing
    void parse_at_rule(StyleSheet& sheet);
    void parse_style_rule(StyleSheet& sheet);

    // Declarations
    void parse_block_contents(std::vector<Declaration>& out);
    std::optional<Declaration> parse_declaration();
    std::vector<ComponentValue> parse_component_values_until(CSSToken::Type stop1,
                                                              CSSToken::Type stop2);
    ComponentValue consume_component_value();
    ComponentValue consume_function();
    ComponentValue consume_simple_block(CSSToken::Type close, const char* open_text);

    // Utilities
    void skip_block();
    void skip_declaration();
};

// tokenize_all() always ends with EndOfFile, which current() never passes.
const CSSToken& StyleSheetParser::current() const {
    return tokens_[std::min(pos_, tokens_.size() - 1)];
}

bool StyleSheetParser::at_end() const {
    return at(CSSToken::EndOfFile);
}

void StyleSheetParser::advance() {
    if (!at_end()) ++pos_;
}

void StyleSheetParser::skip_whitespace() {
    while (at(CSSToken::Whitespace)) advance();
}

void StyleSheetParser::report(size_t position, std::string message) {
    issues_.push_back(locate_issue(source_, position, std::move(message)));
}

void StyleSheetParser::skip_block() {
    // Assumes we're at '{'
    if (at(CSSToken::LeftBrace)) {
        advance();
    }
    int depth = 1;
    while (!at_end() && depth > 0) {
        if (at(CSSToken::LeftBrace)) depth++;
        else if (at(CSSToken::RightBrace)) depth--;
        advance();
    }
}

// Skips to the end of the current declaration: past the next ';' at this
// nesting level, or up to (not past) the '}' closing the enclosing block.
void StyleSheetParser::skip_declaration() {
    while (!at_end()) {
        if (at(CSSToken::Semicolon)) {
            advance();
            return;
        }
        if (at(CSSToken::RightBrace)) {
            return;
        }
        if (at(CSSToken::LeftBrace)) {
            skip_block();
            continue;
        }
        advance();
    }
}

// An unterminated comment, string or '{' block makes the whole input
// unusable. Reported at the opening position.
std::optional<ParseIssue> StyleSheetParser::find_unrecoverable() const {
    std::vector<size_t> open_blocks;
    for (const auto& tok : tokens_) {
        if (tok.unterminated) {
            const char* what = tok.type == CSSToken::String ? "unterminated string"
                                                            : "unterminated comment";
            return locate_issue(source_, tok.position, what);
        }
        if (tok.type == CSSToken::LeftBrace) {
            open_blocks.push_back(tok.position);
        } else if (tok.type == CSSToken::RightBrace && !open_blocks.empty()) {
            open_blocks.pop_back();
        }
    }
    if (!open_blocks.empty()) {
        return locate_issue(source_, open_blocks.front(), "unterminated block");
    }
    return std::nullopt;
}

StyleSheet StyleSheetParser::parse() {
    StyleSheet sheet;

    if (auto fatal = find_unrecoverable()) {
        sheet.fatal = std::move(fatal);
        return sheet;
    }

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;

        // HTML comment markers are ignored at the top level
        if (at(CSSToken::CDO) || at(CSSToken::CDC)) {
            advance();
            continue;
        }

        if (at(CSSToken::AtKeyword)) {
            parse_at_rule(sheet);
        } else if (at(CSSToken::RightBrace)) {
            report(current().position, "unexpected '}'");
            advance();
        } else if (at(CSSToken::Semicolon)) {
            advance(); // stray semicolon
        } else {
            parse_style_rule(sheet);
        }
    }

    sheet.issues = std::move(issues_);
    return sheet;
}

// At-rules carry no styling in this engine. They are skipped as a whole,
// up to their ';' or past their block.
void StyleSheetParser::parse_at_rule(StyleSheet& sheet) {
    IgnoredAtRule ignored;
    ignored.name = ascii_lower(current().value);
    ignored.position = current().position;
    advance(); // skip at-keyword

    while (!at_end()) {
        if (at(CSSToken::Semicolon)) {
            advance();
            break;
        }
        if (at(CSSToken::LeftBrace)) {
            skip_block();
            break;
        }
        advance();
    }
    sheet.ignored_at_rules.push_back(std::move(ignored));
}

void StyleSheetParser::parse_style_rule(StyleSheet& sheet) {
    StyleRule rule;
    rule.position = current().position;

    // Consume selector text until '{'
    std::string sel_text;
    while (!at_end() && !at(CSSToken::LeftBrace)) {
        if (at(CSSToken::Whitespace)) {
            if (!sel_text.empty() && sel_text.back() != ' ') {
                sel_text += " ";
            }
        } else if (at(CSSToken::Hash)) {
            // Preserve '#' prefix for ID selectors (tokenizer strips it)
            sel_text += "#" + current().value;
        } else if (at(CSSToken::Function)) {
            sel_text += current().value + "(";
        } else if (at(CSSToken::String)) {
            sel_text += "\"" + current().value + "\"";
        } else {
            sel_text += current().value;
        }
        advance();
    }

    while (!sel_text.empty() && sel_text.back() == ' ') {
        sel_text.pop_back();
    }

    if (at_end()) {
        report(rule.position, "selector '" + sel_text + "' has no declaration block");
        return;
    }

    advance(); // skip '{'
    parse_block_contents(rule.declarations);
    if (at(CSSToken::RightBrace)) {
        advance();
    }

    std::string error;
    auto selectors = parse_selector_list(sel_text, &error);
    if (!selectors) {
        report(rule.position, "invalid selector '" + sel_text + "': " + error);
        return;
    }

    rule.selector_text = sel_text;
    rule.selectors = std::move(*selectors);
    sheet.rules.push_back(std::move(rule));
}

// Reads declarations up to (not past) the '}' closing the block.
void StyleSheetParser::parse_block_contents(std::vector<Declaration>& out) {
    while (!at_end() && !at(CSSToken::RightBrace)) {
        skip_whitespace();
        if (at_end() || at(CSSToken::RightBrace)) break;
        if (at(CSSToken::Semicolon)) {
            advance();
            continue;
        }
        auto decl = parse_declaration();
        if (decl) {
            out.push_back(std::move(*decl));
        }
    }
}

std::optional<Declaration> StyleSheetParser::parse_declaration() {
    Declaration decl;
    skip_whitespace();
    decl.position = current().position;

    if (at_end() || !at(CSSToken::Ident)) {
        report(decl.position, "expected property name, found '" + current().value + "'");
        skip_declaration();
        return std::nullopt;
    }
    decl.property = ascii_lower(current().value);
    advance();
    skip_whitespace();

    if (at_end() || !at(CSSToken::Colon)) {
        report(decl.position, "expected ':' after '" + decl.property + "'");
        skip_declaration();
        return std::nullopt;
    }
    advance();

    decl.values = parse_component_values_until(CSSToken::Semicolon,
                                                CSSToken::RightBrace);
    if (at(CSSToken::Semicolon)) {
        advance();
    }

    // Trailing "! important"
    size_t n = decl.values.size();
    if (n >= 2 && decl.values[n - 2].type == ComponentValue::Token &&
        decl.values[n - 2].value == "!" &&
        ascii_lower(decl.values[n - 1].value) == "important") {
        decl.important = true;
        decl.values.resize(n - 2);
    }

    if (decl.values.empty()) {
        report(decl.position, "empty value for '" + decl.property + "'");
        return std::nullopt;
    }
    return decl;
}

std::vector<ComponentValue> StyleSheetParser::parse_component_values_until(
    CSSToken::Type stop1, CSSToken::Type stop2) {
    std::vector<ComponentValue> values;

    while (!at_end() && !at(stop1) && !at(stop2)) {
        if (at(CSSToken::Whitespace)) {
            advance();
            continue;
        }
        values.push_back(consume_component_value());
    }

    return values;
}

ComponentValue StyleSheetParser::consume_simple_block(CSSToken::Type close,
                                                      const char* open_text) {
    ComponentValue cv;
    cv.type = ComponentValue::Block;
    cv.value = open_text;
    advance(); // skip opener
    while (!at_end() && !at(close)) {
        if (at(CSSToken::Whitespace)) {
            advance();
            continue;
        }
        cv.children.push_back(consume_component_value());
    }
    if (!at_end()) advance(); // skip closer
    return cv;
}

ComponentValue StyleSheetParser::consume_component_value() {
    if (at(CSSToken::Function)) {
        return consume_function();
    }
    if (at(CSSToken::LeftParen)) {
        return consume_simple_block(CSSToken::RightParen, "(");
    }
    if (at(CSSToken::LeftBracket)) {
        return consume_simple_block(CSSToken::RightBracket, "[");
    }
    if (at(CSSToken::LeftBrace)) {
        return consume_simple_block(CSSToken::RightBrace, "{");
    }

    ComponentValue cv;
    cv.type = ComponentValue::Token;
    auto& tok = current();
    cv.token_type = tok.type;

    // Preserve '#' prefix for hash tokens so color parsing works
    if (tok.type == CSSToken::Hash) {
        cv.value = "#" + tok.value;
    } else {
        cv.value = tok.value;
    }

    if (tok.type == CSSToken::Number || tok.type == CSSToken::Percentage ||
        tok.type == CSSToken::Dimension) {
        cv.numeric_value = tok.numeric_value;
        cv.unit = tok.unit;
    }

    advance();
    return cv;
}

ComponentValue StyleSheetParser::consume_function() {
    ComponentValue cv;
    cv.type = ComponentValue::Function;
    cv.value = ascii_lower(current().value);
    advance(); // skip function token (name + '(')

    while (!at_end() && !at(CSSToken::RightParen)) {
        if (at(CSSToken::Whitespace)) {
            advance();
            continue;
        }
        if (at(CSSToken::Comma)) {
            ComponentValue comma;
            comma.type = ComponentValue::Token;
            comma.token_type = CSSToken::Comma;
            comma.value = ",";
            cv.children.push_back(std::move(comma));
            advance();
            continue;
        }
        cv.children.push_back(consume_component_value());
    }

    if (at(CSSToken::RightParen)) {
        advance();
    }

    return cv;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string component_value_to_string(const ComponentValue& cv) {
    switch (cv.type) {
        case ComponentValue::Token:
            if (cv.token_type == CSSToken::String) {
                return "\"" + cv.value + "\"";
            }
            return cv.value;
        case ComponentValue::Function: {
            std::string out = cv.value + "(";
            for (size_t i = 0; i < cv.children.size(); ++i) {
                const auto& child = cv.children[i];
                if (child.type == ComponentValue::Token && child.value == ",") {
                    out += ", ";
                    continue;
                }
                if (i > 0 && !(cv.children[i - 1].type == ComponentValue::Token &&
                               cv.children[i - 1].value == ",")) {
                    out += " ";
                }
                out += component_value_to_string(child);
            }
            return out + ")";
        }
        case ComponentValue::Block: {
            std::string close = cv.value == "(" ? ")" : cv.value == "[" ? "]" : "}";
            return cv.value + component_values_to_string(cv.children) + close;
        }
    }
    return {};
}

std::string component_values_to_string(const std::vector<ComponentValue>& values) {
    std::string out;
    for (const auto& cv : values) {
        std::string part = component_value_to_string(cv);
        // No space before a comma or after a "/" separator
        if (!out.empty() && part != "," && out.back() != '/' && part != "/") {
            out += " ";
        }
        out += part;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ParseIssue locate_issue(std::string_view source, size_t position, std::string message) {
    ParseIssue issue;
    issue.position = position;
    issue.message = std::move(message);
    for (size_t i = 0; i < position && i < source.size(); ++i) {
        if (source[i] == '\n') {
            ++issue.line;
            issue.column = 1;
        } else {
            ++issue.column;
        }
    }
    return issue;
}

StyleSheet parse_stylesheet(std::string_view css) {
    auto tokens = CSSTokenizer::tokenize_all(css);
    StyleSheetParser parser(css, std::move(tokens));
    return parser.parse();
}

} // namespace lolite::css
