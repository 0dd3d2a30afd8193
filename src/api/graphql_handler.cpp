#include "api/graphql_handler.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <mutex>
#include <string_view>

namespace polystore {

namespace {

/**
 * Recursive-descent reader over one GraphQL document. Every parse_*
 * method returns false after recording the first error.
 */
class DocumentReader {
public:
    DocumentReader(std::string_view text, const JsonValue& variables, uint32_t max_depth)
        : sv_(text), variables_(variables), max_depth_(max_depth) {}

    bool parse_operation(GraphQLOperation& op) {
        skip_ignored();
        if (peek() != '{') {
            const auto keyword = read_name();
            if (keyword == "query") op.type = GraphQLOperationType::QUERY;
            else if (keyword == "mutation") op.type = GraphQLOperationType::MUTATION;
            else if (keyword == "subscription") op.type = GraphQLOperationType::SUBSCRIPTION;
            else return fail(std::format("expected operation type, got '{}'", keyword));

            skip_ignored();
            if (is_name_start(peek())) op.name = read_name();
            skip_ignored();
            // Variable definitions are accepted and ignored; values come from `variables`
            if (peek() == '(' && !skip_balanced('(', ')')) return false;
        }

        if (!parse_selection_set(op.fields, 1)) return false;
        skip_ignored();
        if (pos_ < sv_.size()) return fail("only one operation per document is supported");
        return true;
    }

    [[nodiscard]] const std::string& error() const { return error_; }

private:
    bool fail(std::string message) {
        if (error_.empty()) error_ = std::format("{} at offset {}", message, pos_);
        return false;
    }

    [[nodiscard]] char peek() const { return pos_ < sv_.size() ? sv_[pos_] : '\0'; }

    static bool is_name_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_name_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // Whitespace, commas and # comments are insignificant
    void skip_ignored() {
        while (pos_ < sv_.size()) {
            const char c = sv_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
                ++pos_;
            } else if (c == '#') {
                while (pos_ < sv_.size() && sv_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    std::string read_name() {
        const size_t start = pos_;
        if (!is_name_start(peek())) return {};
        while (pos_ < sv_.size() && is_name_char(sv_[pos_])) ++pos_;
        return std::string(sv_.substr(start, pos_ - start));
    }

    bool expect(char c) {
        skip_ignored();
        if (peek() != c) return fail(std::format("expected '{}'", c));
        ++pos_;
        return true;
    }

    bool skip_balanced(char open, char close) {
        int depth = 0;
        bool in_str = false;
        for (; pos_ < sv_.size(); ++pos_) {
            const char c = sv_[pos_];
            if (c == '"' && (pos_ == 0 || sv_[pos_ - 1] != '\\')) in_str = !in_str;
            if (in_str) continue;
            if (c == open) ++depth;
            if (c == close && --depth == 0) {
                ++pos_;
                return true;
            }
        }
        return fail(std::format("unbalanced '{}'", open));
    }

    bool parse_selection_set(std::vector<GraphQLField>& out, uint32_t depth) {
        if (depth > max_depth_) {
            return fail(std::format("selection depth exceeds {}", max_depth_));
        }
        if (!expect('{')) return false;
        skip_ignored();
        while (peek() != '}') {
            if (pos_ >= sv_.size()) return fail("unterminated selection set");
            GraphQLField field;
            if (!parse_field(field, depth)) return false;
            out.push_back(std::move(field));
            skip_ignored();
        }
        ++pos_;
        if (out.empty()) return fail("empty selection set");
        return true;
    }

    bool parse_field(GraphQLField& field, uint32_t depth) {
        field.name = read_name();
        if (field.name.empty()) return fail("expected field name");
        skip_ignored();
        if (peek() == ':') {
            ++pos_;
            skip_ignored();
            field.alias = std::move(field.name);
            field.name = read_name();
            if (field.name.empty()) return fail("expected field name after alias");
            skip_ignored();
        }
        if (peek() == '(') {
            ++pos_;
            skip_ignored();
            while (peek() != ')') {
                if (pos_ >= sv_.size()) return fail("unterminated argument list");
                const auto key = read_name();
                if (key.empty()) return fail("expected argument name");
                if (!expect(':')) return false;
                JsonValue value;
                if (!parse_value(value, 1)) return false;
                field.arguments.set(key, std::move(value));
                skip_ignored();
            }
            ++pos_;
            skip_ignored();
        }
        if (peek() == '{') {
            return parse_selection_set(field.sub_fields, depth + 1);
        }
        return true;
    }

    // Object and list literals nest no deeper than selections do
    bool parse_value(JsonValue& out, uint32_t depth) {
        skip_ignored();
        const char c = peek();

        if ((c == '{' || c == '[') && depth > max_depth_) {
            return fail(std::format("argument value nesting exceeds {}", max_depth_));
        }

        if (c == '"') return parse_string(out);

        if (c == '$') {
            ++pos_;
            const auto name = read_name();
            if (name.empty()) return fail("expected variable name");
            out = variables_[name];
            return true;
        }

        if (c == '{') {
            ++pos_;
            out = JsonValue::object();
            skip_ignored();
            while (peek() != '}') {
                if (pos_ >= sv_.size()) return fail("unterminated object value");
                const auto key = read_name();
                if (key.empty()) return fail("expected object field name");
                if (!expect(':')) return false;
                JsonValue value;
                if (!parse_value(value, depth + 1)) return false;
                out.set(key, std::move(value));
                skip_ignored();
            }
            ++pos_;
            return true;
        }

        if (c == '[') {
            ++pos_;
            out = JsonValue::array();
            skip_ignored();
            while (peek() != ']') {
                if (pos_ >= sv_.size()) return fail("unterminated list value");
                JsonValue value;
                if (!parse_value(value, depth + 1)) return false;
                out.push_back(std::move(value));
                skip_ignored();
            }
            ++pos_;
            return true;
        }

        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            const size_t start = pos_;
            ++pos_;
            while (pos_ < sv_.size() &&
                   (std::isdigit(static_cast<unsigned char>(sv_[pos_])) || sv_[pos_] == '.' ||
                    sv_[pos_] == 'e' || sv_[pos_] == 'E' || sv_[pos_] == '+' || sv_[pos_] == '-')) {
                ++pos_;
            }
            const auto number = utils::try_parse_double(sv_.substr(start, pos_ - start));
            if (!number) return fail("malformed number");
            out = JsonValue(*number);
            return true;
        }

        const auto word = read_name();
        if (word.empty()) return fail("expected value");
        if (word == "true") out = JsonValue(true);
        else if (word == "false") out = JsonValue(false);
        else if (word == "null") out = JsonValue(nullptr);
        else out = JsonValue(word);           // enum value
        return true;
    }

    bool parse_string(JsonValue& out) {
        ++pos_;   // opening quote
        std::string text;
        while (pos_ < sv_.size() && sv_[pos_] != '"') {
            char c = sv_[pos_++];
            if (c == '\\' && pos_ < sv_.size()) {
                const char esc = sv_[pos_++];
                switch (esc) {
                    case 'n': c = '\n'; break;
                    case 't': c = '\t'; break;
                    case 'r': c = '\r'; break;
                    default: c = esc; break;
                }
            }
            text.push_back(c);
        }
        if (pos_ >= sv_.size()) return fail("unterminated string");
        ++pos_;   // closing quote
        out = JsonValue(std::move(text));
        return true;
    }

    std::string_view sv_;
    const JsonValue& variables_;
    const uint32_t max_depth_;
    size_t pos_ = 0;
    std::string error_;
};

JsonValue graphql_error(ErrorCategory category, const std::string& message, const std::string& path) {
    JsonValue error = JsonValue::object();
    error.set("message", message);
    if (!path.empty()) {
        JsonValue segments = JsonValue::array();
        segments.push_back(path);
        error.set("path", std::move(segments));
    }
    error.set("extensions", JsonValue::wrap("category", error_category_to_string(category)));
    return error;
}

} // namespace

GraphQLHandler::GraphQLHandler(ChangeNotifier& notifier, const GraphQLConfig& config)
    : notifier_(notifier), config_(config) {}

void GraphQLHandler::add_query(const std::string& field, GraphQLResolver resolver) {
    std::unique_lock lock(mutex_);
    queries_[field] = std::move(resolver);
}

void GraphQLHandler::add_mutation(const std::string& field, GraphQLResolver resolver) {
    std::unique_lock lock(mutex_);
    mutations_[field] = std::move(resolver);
}

void GraphQLHandler::add_subscription(const std::string& field, std::string channel) {
    std::unique_lock lock(mutex_);
    subscriptions_[field] = std::move(channel);
}

void GraphQLHandler::add_sdl(std::string sdl) {
    std::unique_lock lock(mutex_);
    sdl_.push_back(std::move(sdl));
}

Result<GraphQLOperation> GraphQLHandler::parse(const std::string& document,
                                               const JsonValue& variables) const {
    GraphQLOperation op;
    DocumentReader reader(document, variables, config_.max_query_depth);
    if (!reader.parse_operation(op)) {
        return Result<GraphQLOperation>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Failed to parse GraphQL document: {}", reader.error()));
    }
    return Result<GraphQLOperation>::ok(std::move(op));
}

JsonValue GraphQLHandler::project(const JsonValue& value, const std::vector<GraphQLField>& selection) {
    if (selection.empty() || value.is_null()) return value;

    if (value.is_array()) {
        JsonValue out = JsonValue::array();
        for (const auto& element : value.elements()) out.push_back(project(element, selection));
        return out;
    }
    if (!value.is_object()) return value;

    JsonValue out = JsonValue::object();
    for (const auto& field : selection) {
        out.set(field.response_key(), project(value[field.name], field.sub_fields));
    }
    return out;
}

JsonValue GraphQLHandler::error_response(ErrorCategory category, const std::string& message) {
    JsonValue errors = JsonValue::array();
    errors.push_back(graphql_error(category, message, ""));
    return JsonValue::wrap("errors", std::move(errors));
}

JsonValue GraphQLHandler::execute(const std::string& document, const JsonValue& variables) const {
    const auto parsed = parse(document, variables);
    if (parsed.is_error()) {
        return error_response(parsed.error_category(), parsed.error_message());
    }
    const auto& op = parsed.value();

    if (op.type == GraphQLOperationType::SUBSCRIPTION) {
        return error_response(ErrorCategory::UNSUPPORTED_OPERATION,
            "subscriptions are served over the realtime transport");
    }
    if (op.type == GraphQLOperationType::MUTATION && !config_.mutations_enabled) {
        return error_response(ErrorCategory::UNSUPPORTED_OPERATION, "mutations are disabled");
    }

    JsonValue data = JsonValue::object();
    JsonValue errors = JsonValue::array();
    size_t resolved = 0;

    for (const auto& field : op.fields) {
        GraphQLResolver resolver;
        {
            std::shared_lock lock(mutex_);
            const auto& table = op.type == GraphQLOperationType::MUTATION ? mutations_ : queries_;
            const auto it = table.find(field.name);
            if (it != table.end()) resolver = it->second;
        }

        if (!resolver) {
            errors.push_back(graphql_error(ErrorCategory::VALIDATION_ERROR,
                std::format("Cannot query field '{}'", field.name), field.response_key()));
            data.set(field.response_key(), nullptr);
            continue;
        }

        const auto result = resolver(field.arguments);
        if (result.is_error()) {
            errors.push_back(graphql_error(result.error_category(), result.error_message(),
                field.response_key()));
            data.set(field.response_key(), nullptr);
            continue;
        }
        data.set(field.response_key(), project(result.value(), field.sub_fields));
        ++resolved;
    }

    if (resolved == 0 && !errors.empty()) {
        return JsonValue::wrap("errors", std::move(errors));
    }
    JsonValue response = JsonValue::wrap("data", std::move(data));
    if (!errors.empty()) response.set("errors", std::move(errors));
    return response;
}

Result<std::shared_ptr<Subscription>> GraphQLHandler::subscribe(const std::string& document,
                                                                const JsonValue& variables) const {
    using R = Result<std::shared_ptr<Subscription>>;

    const auto parsed = parse(document, variables);
    if (parsed.is_error()) return R::propagate(parsed);
    const auto& op = parsed.value();

    if (op.type != GraphQLOperationType::SUBSCRIPTION) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "document is not a subscription");
    }
    if (op.fields.size() != 1) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            "a subscription must select exactly one root field");
    }

    const auto channel = channel_for(op.fields.front().name);
    if (channel.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Cannot subscribe to field '{}'", op.fields.front().name));
    }
    return notifier_.subscribe(channel);
}

std::string GraphQLHandler::channel_for(const std::string& field) const {
    std::shared_lock lock(mutex_);
    const auto it = subscriptions_.find(field);
    return it == subscriptions_.end() ? std::string{} : it->second;
}

std::string GraphQLHandler::sdl() const {
    std::shared_lock lock(mutex_);
    // Root types the generated entities extend
    return "scalar JSON\n\ntype Query\n\ntype Mutation\n\ntype Subscription\n\n" +
           utils::join(sdl_, "\n");
}

} // namespace polystore
