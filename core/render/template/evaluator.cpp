#include "evaluator.hpp"

#include <deque>
#include <string>

namespace opr {
namespace render {
namespace tmpl {

namespace {

// A context frame pushed by #each and #with
struct Frame {
    const nlohmann::json *value = nullptr;
    nlohmann::json data = nlohmann::json::object();  // @index, @key, @first, @last
};

class Evaluator {
public:
    Evaluator(const nlohmann::json &root, const GetHandler &get) : root_(root), get_(get) {
        frames_.push_back(Frame{&root_});
    }

    bool render(const std::vector<Node> &nodes, std::string &out) {
        for (const auto &node : nodes) {
            bool ok = true;
            switch (node.kind) {
                case NodeKind::TEXT:
                    out += node.text;
                    break;
                case NodeKind::OUTPUT:
                    ok = render_output(node, out);
                    break;
                case NodeKind::BLOCK:
                    ok = render_block(node, out);
                    break;
            }
            if (!ok) return false;
        }
        return true;
    }

    const content::Failure &failure() const { return failure_; }

private:
    bool fail(const SourcePosition &position, const std::string &reason) {
        failure_ = content::Failure(content::ErrorKind::TEMPLATE_ERROR, position.to_string() + ": " + reason);
        return false;
    }

    // Sets value to nullptr when the path does not exist. Fails only for
    // paths that can never resolve (climbing above the root).
    bool lookup(const PathExpression &path, const SourcePosition &position, const nlohmann::json *&value) {
        value = nullptr;
        if (path.parent_depth >= frames_.size()) {
            return fail(position, "'" + path.original + "' refers above the root context");
        }
        const size_t frame_index = frames_.size() - 1 - path.parent_depth;

        const nlohmann::json *current = nullptr;
        if (path.data_variable.empty()) {
            current = frames_[frame_index].value;
        } else if (path.data_variable == "root") {
            current = &root_;
        } else {
            for (size_t i = frame_index + 1; i-- > 0;) {
                auto it = frames_[i].data.find(path.data_variable);
                if (it != frames_[i].data.end()) {
                    current = &*it;
                    break;
                }
            }
            if (current == nullptr) return true;
        }

        for (const auto &segment : path.segments) {
            if (current->is_object()) {
                auto it = current->find(segment);
                if (it == current->end()) return true;
                current = &*it;
            } else if (current->is_array()) {
                size_t index = 0;
                if (segment.empty() || segment.size() > 9 ||
                    segment.find_first_not_of("0123456789") != std::string::npos) {
                    return true;
                }
                index = std::stoul(segment);
                if (index >= current->size()) return true;
                current = &(*current)[index];
            } else {
                return true;
            }
        }
        value = current;
        return true;
    }

    // Evaluates an argument that has to exist
    bool require(const Expression &expression, const SourcePosition &position, const nlohmann::json *&value) {
        if (expression.kind == Expression::Kind::LITERAL) {
            value = &expression.literal;
            return true;
        }
        if (!lookup(expression.path, position, value)) return false;
        if (value == nullptr) {
            return fail(position, "'" + expression.path.original + "' not found");
        }
        return true;
    }

    // Evaluates a condition; missing paths count as false
    bool condition(const Expression &expression, const SourcePosition &position, bool &truthy) {
        if (expression.kind == Expression::Kind::LITERAL) {
            truthy = is_truthy(expression.literal);
            return true;
        }
        const nlohmann::json *value = nullptr;
        if (!lookup(expression.path, position, value)) return false;
        truthy = value != nullptr && is_truthy(*value);
        return true;
    }

    bool render_output(const Node &node, std::string &out) {
        const nlohmann::json *value = nullptr;
        if (!require(node.arguments.front(), node.position, value)) return false;

        if (node.helper == kHelperGet) {
            std::string fetched;
            if (!get_(*value, node.position, fetched, failure_)) return false;
            out += fetched;
            return true;
        }

        std::string text;
        switch (value->type()) {
            case nlohmann::json::value_t::string:
                text = value->get<std::string>();
                break;
            case nlohmann::json::value_t::null:
                break;
            case nlohmann::json::value_t::boolean:
                text = value->get<bool>() ? "true" : "false";
                break;
            case nlohmann::json::value_t::object:
            case nlohmann::json::value_t::array:
                return fail(node.position, "'" + node.arguments.front().path.original +
                                               "' is an object or array and cannot be printed");
            default:
                text = value->dump();
                break;
        }
        out += node.escape ? escape_html(text) : text;
        return true;
    }

    bool render_block(const Node &node, std::string &out) {
        const Expression &argument = node.arguments.front();

        if (node.helper == kHelperIf || node.helper == kHelperUnless || node.helper == kInvertedSection) {
            bool truthy = false;
            if (!condition(argument, node.position, truthy)) return false;
            bool take_body = node.helper == kHelperIf ? truthy : !truthy;
            return render(take_body ? node.body : node.inverse, out);
        }

        const nlohmann::json *value = nullptr;
        if (!require(argument, node.position, value)) return false;

        if (node.helper == kHelperWith) {
            if (!is_truthy(*value)) return render(node.inverse, out);
            frames_.push_back(Frame{value});
            bool ok = render(node.body, out);
            frames_.pop_back();
            return ok;
        }

        // each
        if (!(value->is_array() || value->is_object()) || value->empty()) {
            return render(node.inverse, out);
        }
        const size_t count = value->size();
        size_t index = 0;
        for (auto it = value->begin(); it != value->end(); ++it, ++index) {
            Frame frame{&*it};
            frame.data["index"] = index;
            frame.data["first"] = index == 0;
            frame.data["last"] = index + 1 == count;
            if (value->is_object()) {
                frame.data["key"] = it.key();
            }
            frames_.push_back(std::move(frame));
            bool ok = render(node.body, out);
            frames_.pop_back();
            if (!ok) return false;
        }
        return true;
    }

    const nlohmann::json &root_;
    const GetHandler &get_;
    // deque keeps references to outer frames' data valid while inner frames are pushed
    std::deque<Frame> frames_;
    content::Failure failure_;
};

}  // namespace

std::string escape_html(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#x27;";
                break;
            case '`':
                out += "&#x60;";
                break;
            case '=':
                out += "&#x3D;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

bool is_truthy(const nlohmann::json &value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string &>().empty();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::array:
            return !value.empty();
        default:
            return true;
    }
}

bool evaluate_template(const Template &compiled, const nlohmann::json &root, const GetHandler &get,
                       std::string &out, content::Failure &failure) {
    Evaluator evaluator(root, get);
    std::string rendered;
    if (!evaluator.render(compiled.nodes, rendered)) {
        failure = evaluator.failure();
        return false;
    }
    out = std::move(rendered);
    return true;
}

}  // namespace tmpl
}  // namespace render
}  // namespace opr
