#include "template.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>

namespace opr {
namespace render {
namespace tmpl {

namespace {

// Characters Handlebars does not allow in an unbracketed identifier
constexpr const char *kInvalidIdentifierChars = "!\"#%&'()*+,./;<=>@[\\]^`{|}~";

enum class SegmentKind { TEXT, COMMENT, OUTPUT, BLOCK_OPEN, BLOCK_CLOSE, INVERTED_OPEN, ELSE };

struct Segment {
    SegmentKind kind = SegmentKind::TEXT;
    SourcePosition position;
    std::string text;  // TEXT: literal text; tags: content after the sigil, trimmed
    bool escape = true;
    bool strip_left = false;
    bool strip_right = false;
};

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string fail_at(const SourcePosition &position, const std::string &reason) {
    return position.to_string() + ": " + reason;
}

// Tracks line/column while the scanner moves forward through the text
class PositionTracker {
public:
    explicit PositionTracker(const std::string &text) : text_(text) {}

    SourcePosition at(size_t offset) {
        for (; offset_ < offset && offset_ < text_.size(); ++offset_) {
            if (text_[offset_] == '\n') {
                ++position_.line;
                position_.column = 1;
            } else {
                ++position_.column;
            }
        }
        return position_;
    }

private:
    const std::string &text_;
    size_t offset_ = 0;
    SourcePosition position_;
};

/**
 * Finds the end of a tag starting the search at from. The tag closes with
 * <prefix>}} or <prefix>~}}. Sets inner_end to the start of prefix and
 * tag_end just past the closing braces.
 */
bool find_close(const std::string &text, size_t from, const std::string &prefix, size_t &inner_end, size_t &tag_end,
                bool &strip_right) {
    for (size_t q = from; q < text.size(); ++q) {
        if (text.compare(q, prefix.size(), prefix) != 0) continue;
        size_t after = q + prefix.size();
        if (text.compare(after, 2, "}}") == 0) {
            inner_end = q;
            tag_end = after + 2;
            strip_right = false;
            return true;
        }
        if (after < text.size() && text[after] == '~' && text.compare(after + 1, 2, "}}") == 0) {
            inner_end = q;
            tag_end = after + 3;
            strip_right = true;
            return true;
        }
    }
    return false;
}

bool scan(const std::string &text, std::vector<Segment> &segments, std::string &error) {
    PositionTracker tracker(text);
    size_t i = 0;
    while (i < text.size()) {
        size_t open = text.find("{{", i);
        if (open == std::string::npos) {
            segments.push_back({SegmentKind::TEXT, tracker.at(i), text.substr(i)});
            break;
        }
        if (open > i) {
            segments.push_back({SegmentKind::TEXT, tracker.at(i), text.substr(i, open - i)});
        }

        Segment tag;
        tag.position = tracker.at(open);
        size_t p = open + 2;
        if (p < text.size() && text[p] == '~') {
            tag.strip_left = true;
            ++p;
        }

        size_t inner_end = 0;
        size_t tag_end = 0;
        bool found = false;
        std::string inner;

        if (p < text.size() && text[p] == '{') {
            found = find_close(text, p + 1, "}", inner_end, tag_end, tag.strip_right);
            if (found) {
                tag.kind = SegmentKind::OUTPUT;
                tag.escape = false;
                inner = text.substr(p + 1, inner_end - p - 1);
            }
        } else if (text.compare(p, 3, "!--") == 0) {
            found = find_close(text, p + 3, "--", inner_end, tag_end, tag.strip_right);
            tag.kind = SegmentKind::COMMENT;
        } else if (p < text.size() && text[p] == '!') {
            found = find_close(text, p + 1, "", inner_end, tag_end, tag.strip_right);
            tag.kind = SegmentKind::COMMENT;
        } else {
            found = find_close(text, p, "", inner_end, tag_end, tag.strip_right);
            if (found) {
                inner = trim(text.substr(p, inner_end - p));
                if (inner.empty()) {
                    error = fail_at(tag.position, "empty tag");
                    return false;
                }
                char sigil = inner[0];
                std::string rest = trim(inner.substr(1));
                if (sigil == '#') {
                    tag.kind = SegmentKind::BLOCK_OPEN;
                    inner = rest;
                } else if (sigil == '/') {
                    tag.kind = SegmentKind::BLOCK_CLOSE;
                    inner = rest;
                } else if (sigil == '^') {
                    tag.kind = rest.empty() ? SegmentKind::ELSE : SegmentKind::INVERTED_OPEN;
                    inner = rest;
                } else if (sigil == '&') {
                    tag.kind = SegmentKind::OUTPUT;
                    tag.escape = false;
                    inner = rest;
                } else if (sigil == '>') {
                    error = fail_at(tag.position, "partials are not supported");
                    return false;
                } else if (inner == "else") {
                    tag.kind = SegmentKind::ELSE;
                    inner.clear();
                } else if (inner.compare(0, 5, "else ") == 0) {
                    error = fail_at(tag.position, "chained '{{else ...}}' is not supported; nest the block instead");
                    return false;
                } else {
                    tag.kind = SegmentKind::OUTPUT;
                }
            }
        }

        if (!found) {
            error = fail_at(tag.position, "unclosed tag");
            return false;
        }

        tag.text = trim(inner);
        if (tag.kind != SegmentKind::COMMENT && tag.kind != SegmentKind::ELSE && tag.text.empty()) {
            error = fail_at(tag.position, "tag has no content");
            return false;
        }
        segments.push_back(std::move(tag));
        i = tag_end;
    }
    return true;
}

// Applies {{~ and ~}} to the neighbouring text segments
void apply_whitespace_control(std::vector<Segment> &segments) {
    for (size_t i = 0; i < segments.size(); ++i) {
        const Segment &tag = segments[i];
        if (tag.kind == SegmentKind::TEXT) continue;
        if (tag.strip_left && i > 0 && segments[i - 1].kind == SegmentKind::TEXT) {
            std::string &text = segments[i - 1].text;
            size_t end = text.size();
            while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
            text.erase(end);
        }
        if (tag.strip_right && i + 1 < segments.size() && segments[i + 1].kind == SegmentKind::TEXT) {
            std::string &text = segments[i + 1].text;
            size_t begin = 0;
            while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
            text.erase(0, begin);
        }
    }
}

// Splits tag content into whitespace-separated tokens, keeping quoted
// strings and [bracketed] segments intact
bool tokenize(const std::string &content, const SourcePosition &position, std::vector<std::string> &tokens,
              std::string &error) {
    size_t i = 0;
    while (i < content.size()) {
        if (std::isspace(static_cast<unsigned char>(content[i]))) {
            ++i;
            continue;
        }
        std::string token;
        if (content[i] == '"' || content[i] == '\'') {
            char quote = content[i];
            size_t close = content.find(quote, i + 1);
            if (close == std::string::npos) {
                error = fail_at(position, "unterminated string literal");
                return false;
            }
            token = content.substr(i, close - i + 1);
            i = close + 1;
        } else {
            while (i < content.size() && !std::isspace(static_cast<unsigned char>(content[i]))) {
                if (content[i] == '[') {
                    size_t close = content.find(']', i);
                    if (close == std::string::npos) {
                        error = fail_at(position, "unterminated '[' segment");
                        return false;
                    }
                    token += content.substr(i, close - i + 1);
                    i = close + 1;
                } else {
                    token.push_back(content[i++]);
                }
            }
        }
        tokens.push_back(token);
    }
    return true;
}

bool is_number(const std::string &token) {
    size_t i = 0;
    if (i < token.size() && token[i] == '-') ++i;
    size_t digits = 0;
    while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) {
        ++i;
        ++digits;
    }
    if (digits == 0) return false;
    if (i < token.size() && token[i] == '.') {
        ++i;
        size_t fraction = 0;
        while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) {
            ++i;
            ++fraction;
        }
        if (fraction == 0) return false;
    }
    return i == token.size();
}

bool valid_identifier(const std::string &segment) {
    if (segment.empty()) return false;
    for (char c : segment) {
        if (std::strchr(kInvalidIdentifierChars, c) != nullptr || std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool parse_path(const std::string &token, const SourcePosition &position, PathExpression &out, std::string &error) {
    PathExpression path;
    path.original = token;
    std::string rest = token;

    if (!rest.empty() && rest[0] == '@') {
        size_t end = rest.find_first_of("./", 1);
        path.data_variable = rest.substr(1, end == std::string::npos ? std::string::npos : end - 1);
        if (!valid_identifier(path.data_variable)) {
            error = fail_at(position, "invalid data variable '" + token + "'");
            return false;
        }
        rest = end == std::string::npos ? std::string() : rest.substr(end + 1);
        if (end != std::string::npos && rest.empty()) {
            error = fail_at(position, "invalid path '" + token + "'");
            return false;
        }
    } else {
        while (rest.compare(0, 3, "../") == 0) {
            ++path.parent_depth;
            rest = rest.substr(3);
        }
        if (rest == "this" || rest == "." || (rest.empty() && path.parent_depth > 0) || rest == "..") {
            if (rest == "..") ++path.parent_depth;
            rest.clear();
        } else if (rest.compare(0, 5, "this.") == 0 || rest.compare(0, 5, "this/") == 0) {
            rest = rest.substr(5);
        } else if (rest.compare(0, 2, "./") == 0) {
            rest = rest.substr(2);
        }
        if (rest.empty() && token.size() > 0 && (token.back() == '.' || token.back() == '/') && token != "." &&
            path.parent_depth == 0) {
            error = fail_at(position, "invalid path '" + token + "'");
            return false;
        }
    }

    size_t i = 0;
    while (i < rest.size()) {
        std::string segment;
        if (rest[i] == '[') {
            size_t close = rest.find(']', i);
            if (close == std::string::npos) {
                error = fail_at(position, "unterminated '[' in path '" + token + "'");
                return false;
            }
            segment = rest.substr(i + 1, close - i - 1);
            i = close + 1;
        } else {
            size_t end = rest.find_first_of("./", i);
            segment = rest.substr(i, end == std::string::npos ? std::string::npos : end - i);
            if (!valid_identifier(segment)) {
                error = fail_at(position, "invalid path '" + token + "'");
                return false;
            }
            i = end == std::string::npos ? rest.size() : end;
        }
        path.segments.push_back(segment);
        if (i < rest.size()) {
            if (rest[i] != '.' && rest[i] != '/') {
                error = fail_at(position, "invalid path '" + token + "'");
                return false;
            }
            ++i;
            if (i == rest.size()) {
                error = fail_at(position, "invalid path '" + token + "'");
                return false;
            }
        }
    }

    out = std::move(path);
    return true;
}

bool parse_expression(const std::string &token, const SourcePosition &position, Expression &out,
                      std::string &error) {
    Expression expression;
    if (token.size() >= 2 && (token[0] == '"' || token[0] == '\'') && token.back() == token[0]) {
        expression.literal = token.substr(1, token.size() - 2);
    } else if (is_number(token)) {
        if (token.find('.') != std::string::npos) {
            expression.literal = std::strtod(token.c_str(), nullptr);
        } else {
            expression.literal = static_cast<int64_t>(std::strtoll(token.c_str(), nullptr, 10));
        }
    } else if (token == "true" || token == "false") {
        expression.literal = token == "true";
    } else if (token == "null" || token == "undefined") {
        expression.literal = nullptr;
    } else {
        expression.kind = Expression::Kind::PATH;
        if (!parse_path(token, position, expression.path, error)) {
            return false;
        }
    }
    out = std::move(expression);
    return true;
}

bool is_block_helper(const std::string &name) {
    return name == kHelperIf || name == kHelperUnless || name == kHelperEach || name == kHelperWith;
}

bool parse_arguments(const std::vector<std::string> &tokens, size_t first, const SourcePosition &position,
                     std::vector<Expression> &out, std::string &error) {
    for (size_t i = first; i < tokens.size(); ++i) {
        Expression expression;
        if (!parse_expression(tokens[i], position, expression, error)) {
            return false;
        }
        out.push_back(std::move(expression));
    }
    return true;
}

bool build_output(const Segment &segment, Node &node, std::string &error) {
    std::vector<std::string> tokens;
    if (!tokenize(segment.text, segment.position, tokens, error)) {
        return false;
    }
    node.kind = NodeKind::OUTPUT;
    node.position = segment.position;
    node.escape = segment.escape;

    const std::string &head = tokens[0];
    if (is_block_helper(head)) {
        error = fail_at(segment.position, "'" + head + "' is a block helper; use {{#" + head + " ...}}");
        return false;
    }
    if (head == kHelperGet) {
        node.helper = head;
        if (tokens.size() != 2) {
            error = fail_at(segment.position, "the 'get' helper takes exactly one argument (a route)");
            return false;
        }
        return parse_arguments(tokens, 1, segment.position, node.arguments, error);
    }
    if (tokens.size() > 1) {
        error = fail_at(segment.position, "unknown helper '" + head + "'");
        return false;
    }
    return parse_arguments(tokens, 0, segment.position, node.arguments, error);
}

struct OpenBlock {
    Node node;
    std::string close_name;
    bool in_inverse = false;
};

}  // namespace

bool compile_template(const std::string &text, Template &out, std::string &error) {
    std::vector<Segment> segments;
    if (!scan(text, segments, error)) {
        return false;
    }
    apply_whitespace_control(segments);

    std::vector<Node> root;
    std::vector<OpenBlock> stack;
    auto target = [&]() -> std::vector<Node> & {
        if (stack.empty()) return root;
        return stack.back().in_inverse ? stack.back().node.inverse : stack.back().node.body;
    };

    for (const auto &segment : segments) {
        switch (segment.kind) {
            case SegmentKind::TEXT: {
                if (segment.text.empty()) break;
                Node node;
                node.kind = NodeKind::TEXT;
                node.position = segment.position;
                node.text = segment.text;
                target().push_back(std::move(node));
                break;
            }
            case SegmentKind::COMMENT:
                break;
            case SegmentKind::OUTPUT: {
                Node node;
                if (!build_output(segment, node, error)) {
                    return false;
                }
                target().push_back(std::move(node));
                break;
            }
            case SegmentKind::BLOCK_OPEN:
            case SegmentKind::INVERTED_OPEN: {
                std::vector<std::string> tokens;
                if (!tokenize(segment.text, segment.position, tokens, error)) {
                    return false;
                }
                OpenBlock block;
                block.node.kind = NodeKind::BLOCK;
                block.node.position = segment.position;
                if (segment.kind == SegmentKind::INVERTED_OPEN) {
                    if (tokens.size() != 1) {
                        error = fail_at(segment.position, "inverted sections take a single value");
                        return false;
                    }
                    block.node.helper = kInvertedSection;
                    block.close_name = tokens[0];
                    if (!parse_arguments(tokens, 0, segment.position, block.node.arguments, error)) {
                        return false;
                    }
                } else {
                    const std::string &name = tokens[0];
                    if (!is_block_helper(name)) {
                        error = fail_at(segment.position, "unknown block helper '" + name + "'");
                        return false;
                    }
                    if (tokens.size() != 2) {
                        error = fail_at(segment.position, "the '" + name + "' helper takes exactly one argument");
                        return false;
                    }
                    block.node.helper = name;
                    block.close_name = name;
                    if (!parse_arguments(tokens, 1, segment.position, block.node.arguments, error)) {
                        return false;
                    }
                }
                stack.push_back(std::move(block));
                break;
            }
            case SegmentKind::ELSE: {
                if (stack.empty()) {
                    error = fail_at(segment.position, "'else' outside of a block");
                    return false;
                }
                if (stack.back().in_inverse) {
                    error = fail_at(segment.position, "block already has an 'else' section");
                    return false;
                }
                stack.back().in_inverse = true;
                break;
            }
            case SegmentKind::BLOCK_CLOSE: {
                if (stack.empty()) {
                    error = fail_at(segment.position, "'{{/" + segment.text + "}}' does not close any block");
                    return false;
                }
                if (segment.text != stack.back().close_name) {
                    error = fail_at(segment.position, "'{{/" + segment.text + "}}' does not match '" +
                                                          stack.back().close_name + "' opened at " +
                                                          stack.back().node.position.to_string());
                    return false;
                }
                Node node = std::move(stack.back().node);
                stack.pop_back();
                target().push_back(std::move(node));
                break;
            }
        }
    }

    if (!stack.empty()) {
        error = fail_at(stack.back().node.position, "unclosed block '" + stack.back().close_name + "'");
        return false;
    }

    out.nodes = std::move(root);
    return true;
}

}  // namespace tmpl
}  // namespace render
}  // namespace opr
