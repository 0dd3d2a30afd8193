#include "db/document/document_pipeline.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace polystore {

namespace {

int type_rank(const JsonValue& v) {
    if (v.is_null()) return 0;
    if (v.is_number()) return 1;
    if (v.is_string()) return 2;
    if (v.is_object()) return 3;
    if (v.is_array()) return 4;
    return 5;
}

JsonValue resolve(const JsonValue& doc, const JsonValue& expr) {
    if (expr.is_string()) {
        const auto s = expr.get<std::string>();
        if (s.starts_with('$')) return DocumentPipeline::lookup(doc, std::string_view(s).substr(1));
    }
    return expr;
}

Result<std::vector<OrderClause>> parse_sort(const JsonValue& spec) {
    using R = Result<std::vector<OrderClause>>;
    std::vector<OrderClause> order;

    auto add = [&](const std::string& field, const JsonValue& dir) -> Status {
        if (!dir.is_number()) {
            return Status::error(ErrorCategory::VALIDATION_ERROR,
                std::format("$sort direction for '{}' must be 1 or -1", field));
        }
        order.push_back({field, dir.get<double>() < 0});
        return Status::ok();
    };

    // Array form [{"a":1},{"b":-1}] keeps the caller's key priority
    if (spec.is_array()) {
        for (const auto& elem : spec.elements()) {
            for (const auto& [field, dir] : elem.items()) {
                const auto st = add(field, dir);
                if (st.is_error()) return R::propagate(st);
            }
        }
    } else {
        for (const auto& [field, dir] : spec.items()) {
            const auto st = add(field, dir);
            if (st.is_error()) return R::propagate(st);
        }
    }
    if (order.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "$sort needs at least one field");
    }
    return R::ok(std::move(order));
}

Result<size_t> non_negative(const JsonValue& v, std::string_view stage) {
    if (!v.is_number_integer() || v.get<double>() < 0) {
        return Result<size_t>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("{} expects a non-negative integer", stage));
    }
    return Result<size_t>::ok(v.get<size_t>());
}

} // namespace

JsonValue DocumentPipeline::lookup(const JsonValue& doc, std::string_view path) {
    JsonValue current = doc;
    size_t start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        const auto part = path.substr(start, dot == std::string_view::npos ? path.npos : dot - start);
        if (!current.is_object() || !current.contains(part)) return {};
        current = current[part];
        if (dot == std::string_view::npos) return current;
        start = dot + 1;
    }
}

bool DocumentPipeline::matches(const JsonValue& doc, const JsonValue& filter) {
    for (const auto& [key, expected] : filter.items()) {
        const auto actual = lookup(doc, key);
        if (expected.is_null()) {
            if (!actual.is_null()) return false;
        } else if (!(actual == expected)) {
            return false;
        }
    }
    return true;
}

int DocumentPipeline::compare(const JsonValue& a, const JsonValue& b) {
    const int ra = type_rank(a);
    const int rb = type_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    if (a.is_number()) {
        const double x = a.get<double>();
        const double y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_boolean()) {
        return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
    }
    if (a.is_null()) return 0;

    const auto x = a.is_string() ? a.get<std::string>() : a.dump();
    const auto y = b.is_string() ? b.get<std::string>() : b.dump();
    return x.compare(y) < 0 ? -1 : (x == y ? 0 : 1);
}

void DocumentPipeline::sort(std::vector<JsonValue>& docs, const std::vector<OrderClause>& order) {
    if (order.empty()) return;
    std::stable_sort(docs.begin(), docs.end(), [&](const JsonValue& a, const JsonValue& b) {
        for (const auto& o : order) {
            const int c = compare(lookup(a, o.column), lookup(b, o.column));
            if (c != 0) return o.descending ? c > 0 : c < 0;
        }
        return false;
    });
}

JsonValue DocumentPipeline::project(const JsonValue& doc, const std::vector<std::string>& fields) {
    if (fields.empty()) return doc;
    JsonValue out = JsonValue::object();
    for (const auto& field : fields) {
        if (doc.contains(field)) out.set(field, doc[field]);
    }
    return out;
}

std::vector<JsonValue> DocumentPipeline::apply_options(std::vector<JsonValue> docs,
                                                       const DocumentOptions& options) {
    sort(docs, options.sort);

    const size_t skip = options.skip ? static_cast<size_t>(std::max<int64_t>(*options.skip, 0)) : 0;
    if (skip >= docs.size()) {
        docs.clear();
    } else if (skip > 0) {
        docs.erase(docs.begin(), docs.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    if (options.limit && docs.size() > static_cast<size_t>(std::max<int64_t>(*options.limit, 0))) {
        docs.resize(static_cast<size_t>(std::max<int64_t>(*options.limit, 0)));
    }

    if (!options.projection.empty()) {
        for (auto& doc : docs) doc = project(doc, options.projection);
    }
    return docs;
}

JsonValue DocumentPipeline::leading_match(const JsonValue& pipeline) {
    const auto first = pipeline[size_t{0}];
    if (first.is_object() && first.size() == 1 && first.contains("$match")) {
        return first["$match"];
    }
    return JsonValue::object();
}

Result<std::vector<JsonValue>> DocumentPipeline::run(std::vector<JsonValue> docs,
                                                     const JsonValue& pipeline) {
    using R = Result<std::vector<JsonValue>>;
    if (!pipeline.is_array()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "aggregate pipeline must be an array of stages");
    }

    for (const auto& stage : pipeline.elements()) {
        if (!stage.is_object() || stage.size() != 1) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                "each pipeline stage must be an object with exactly one operator");
        }
        const auto [op, spec] = *stage.items().begin();

        if (op == "$match") {
            std::vector<JsonValue> kept;
            for (auto& doc : docs) {
                if (matches(doc, spec)) kept.push_back(std::move(doc));
            }
            docs = std::move(kept);
        } else if (op == "$sort") {
            auto order = parse_sort(spec);
            if (order.is_error()) return R::propagate(order);
            sort(docs, order.value());
        } else if (op == "$skip") {
            auto n = non_negative(spec, op);
            if (n.is_error()) return R::propagate(n);
            docs.erase(docs.begin(), docs.begin() +
                static_cast<std::ptrdiff_t>(std::min(n.value(), docs.size())));
        } else if (op == "$limit") {
            auto n = non_negative(spec, op);
            if (n.is_error()) return R::propagate(n);
            if (docs.size() > n.value()) docs.resize(n.value());
        } else if (op == "$project") {
            auto projected = project_stage(docs, spec);
            if (projected.is_error()) return projected;
            docs = std::move(projected.value());
        } else if (op == "$group") {
            auto grouped = group(docs, spec);
            if (grouped.is_error()) return grouped;
            docs = std::move(grouped.value());
        } else if (op == "$count") {
            if (!spec.is_string() || spec.get<std::string>().empty()) {
                return R::error(ErrorCategory::VALIDATION_ERROR, "$count expects a field name");
            }
            const auto n = docs.size();
            docs.clear();
            docs.push_back(JsonValue::wrap(spec.get<std::string>(), JsonValue(n)));
        } else {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("unsupported pipeline stage '{}'", op));
        }
    }
    return R::ok(std::move(docs));
}

Result<std::vector<JsonValue>> DocumentPipeline::project_stage(const std::vector<JsonValue>& docs,
                                                               const JsonValue& spec) {
    using R = Result<std::vector<JsonValue>>;
    if (!spec.is_object() || spec.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "$project expects a non-empty object");
    }

    bool including = false;
    for (const auto& [field, rule] : spec.items()) {
        if (rule.is_string() || (rule.is_number() && rule.get<double>() != 0) ||
            (rule.is_boolean() && rule.get<bool>())) {
            including = true;
        }
    }

    std::vector<JsonValue> out;
    out.reserve(docs.size());
    for (const auto& doc : docs) {
        if (!including) {
            JsonValue kept = doc;
            for (const auto& [field, rule] : spec.items()) kept.erase(field);
            out.push_back(std::move(kept));
            continue;
        }
        JsonValue kept = JsonValue::object();
        // id survives unless excluded explicitly
        if (doc.contains("id") && !spec.contains("id")) kept.set("id", doc["id"]);
        for (const auto& [field, rule] : spec.items()) {
            if (rule.is_string()) {
                kept.set(field, resolve(doc, rule));
            } else if ((rule.is_number() && rule.get<double>() != 0) ||
                       (rule.is_boolean() && rule.get<bool>())) {
                const auto v = lookup(doc, field);
                if (doc.contains(field) || !v.is_null()) kept.set(field, v);
            }
        }
        out.push_back(std::move(kept));
    }
    return R::ok(std::move(out));
}

Result<std::vector<JsonValue>> DocumentPipeline::group(const std::vector<JsonValue>& docs,
                                                       const JsonValue& spec) {
    using R = Result<std::vector<JsonValue>>;
    if (!spec.is_object() || !spec.contains("_id")) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "$group requires an _id expression");
    }

    enum class AccKind { SUM, COUNT, AVG, MIN, MAX };
    struct AccSpec {
        std::string output;
        AccKind kind;
        JsonValue operand;
    };
    std::vector<AccSpec> accumulators;
    for (const auto& [output, expr] : spec.items()) {
        if (output == "_id") continue;
        if (!expr.is_object() || expr.size() != 1) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("$group field '{}' needs exactly one accumulator", output));
        }
        const auto [acc, operand] = *expr.items().begin();
        AccKind kind;
        if (acc == "$sum") kind = AccKind::SUM;
        else if (acc == "$count") kind = AccKind::COUNT;
        else if (acc == "$avg") kind = AccKind::AVG;
        else if (acc == "$min") kind = AccKind::MIN;
        else if (acc == "$max") kind = AccKind::MAX;
        else {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("unsupported accumulator '{}'", acc));
        }
        accumulators.push_back({output, kind, operand});
    }

    struct AccState {
        double sum = 0;
        size_t numeric = 0;
        size_t count = 0;
        JsonValue extreme;
        bool has_extreme = false;
    };
    struct Bucket {
        JsonValue key;
        std::vector<AccState> states;
    };

    const auto id_expr = spec["_id"];
    std::vector<Bucket> buckets;
    std::unordered_map<std::string, size_t> index;

    for (const auto& doc : docs) {
        JsonValue key;
        if (id_expr.is_object()) {
            key = JsonValue::object();
            for (const auto& [k, e] : id_expr.items()) key.set(k, resolve(doc, e));
        } else {
            key = resolve(doc, id_expr);
        }

        const auto key_text = key.dump();
        auto it = index.find(key_text);
        if (it == index.end()) {
            it = index.emplace(key_text, buckets.size()).first;
            buckets.push_back({key, std::vector<AccState>(accumulators.size())});
        }
        auto& bucket = buckets[it->second];

        for (size_t i = 0; i < accumulators.size(); ++i) {
            const auto& acc = accumulators[i];
            auto& state = bucket.states[i];
            ++state.count;
            const auto v = resolve(doc, acc.operand);
            switch (acc.kind) {
                case AccKind::SUM:
                case AccKind::AVG:
                    if (v.is_number()) {
                        state.sum += v.get<double>();
                        ++state.numeric;
                    }
                    break;
                case AccKind::MIN:
                case AccKind::MAX:
                    if (v.is_null()) break;
                    if (!state.has_extreme ||
                        (acc.kind == AccKind::MIN ? compare(v, state.extreme) < 0
                                                  : compare(v, state.extreme) > 0)) {
                        state.extreme = v;
                        state.has_extreme = true;
                    }
                    break;
                case AccKind::COUNT:
                    break;
            }
        }
    }

    std::vector<JsonValue> out;
    out.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        JsonValue row = JsonValue::object();
        row.set("_id", bucket.key);
        for (size_t i = 0; i < accumulators.size(); ++i) {
            const auto& state = bucket.states[i];
            switch (accumulators[i].kind) {
                case AccKind::SUM:
                    row.set(accumulators[i].output, JsonValue(state.sum));
                    break;
                case AccKind::COUNT:
                    row.set(accumulators[i].output, JsonValue(state.count));
                    break;
                case AccKind::AVG:
                    row.set(accumulators[i].output, state.numeric > 0
                        ? JsonValue(state.sum / static_cast<double>(state.numeric)) : JsonValue{});
                    break;
                case AccKind::MIN:
                case AccKind::MAX:
                    row.set(accumulators[i].output, state.extreme);
                    break;
            }
        }
        out.push_back(std::move(row));
    }
    return R::ok(std::move(out));
}

} // namespace polystore
