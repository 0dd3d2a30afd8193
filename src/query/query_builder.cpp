#include "query/query_builder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace polystore {

namespace {

/// Merge an object into a predicate list, replacing repeated keys in place
Status merge_predicates(PredicateList& list, const JsonValue& predicates, std::string_view clause) {
    if (!predicates.is_object()) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("{} expects an object of column/value pairs", clause));
    }
    for (const auto& [key, value] : predicates.items()) {
        if (key.empty()) {
            return Status::error(ErrorCategory::VALIDATION_ERROR,
                std::format("{} keys must be non-empty", clause));
        }
        const auto it = std::find_if(list.begin(), list.end(),
            [&](const auto& p) { return p.first == key; });
        if (it != list.end()) {
            it->second = value;
        } else {
            list.emplace_back(key, value);
        }
    }
    return Status::ok();
}

} // namespace

QueryBuilder::QueryBuilder(std::shared_ptr<IExecutor> executor, std::shared_ptr<QueryCache> cache)
    : executor_(std::move(executor)), cache_(std::move(cache)) {}

QueryBuilder QueryBuilder::unavailable(std::string reason) {
    QueryBuilder b;
    b.unavailable_reason_ = std::move(reason);
    return b;
}

QueryBuilder QueryBuilder::with_error(ErrorCategory category, std::string message) const {
    QueryBuilder b = *this;
    if (!b.desc_.error) {
        b.desc_.error = std::make_pair(category, std::move(message));
    }
    return b;
}

// ============================================================================
// Reads
// ============================================================================

QueryBuilder QueryBuilder::select(std::vector<std::string> columns) const {
    QueryBuilder b = *this;
    b.desc_.kind = OperationKind::SELECT;
    std::erase(columns, std::string("*"));
    b.desc_.columns = std::move(columns);
    return b;
}

QueryBuilder QueryBuilder::from(std::string table) const {
    QueryBuilder b = *this;
    b.desc_.collection = std::move(table);
    return b;
}

QueryBuilder QueryBuilder::join(std::string table, std::string left, std::string right) const {
    QueryBuilder b = *this;
    b.desc_.joins.push_back({JoinType::INNER, std::move(table), std::move(left), std::move(right)});
    return b;
}

QueryBuilder QueryBuilder::left_join(std::string table, std::string left, std::string right) const {
    QueryBuilder b = *this;
    b.desc_.joins.push_back({JoinType::LEFT, std::move(table), std::move(left), std::move(right)});
    return b;
}

QueryBuilder QueryBuilder::order_by(std::string column, std::string direction) const {
    const auto dir = utils::to_lower(direction);
    if (dir != "asc" && dir != "desc") {
        return with_error(ErrorCategory::VALIDATION_ERROR,
            std::format("order direction must be ASC or DESC, got '{}'", direction));
    }
    QueryBuilder b = *this;
    b.desc_.order.push_back({std::move(column), dir == "desc"});
    return b;
}

QueryBuilder QueryBuilder::group_by(std::vector<std::string> columns) const {
    QueryBuilder b = *this;
    for (auto& c : columns) b.desc_.group_by.push_back(std::move(c));
    return b;
}

QueryBuilder QueryBuilder::having(const JsonValue& predicates) const {
    QueryBuilder b = *this;
    const auto st = merge_predicates(b.desc_.having, predicates, "having");
    if (st.is_error()) return with_error(st.error_category(), st.error_message());
    return b;
}

QueryBuilder QueryBuilder::limit(int64_t n) const {
    if (n < 0) return with_error(ErrorCategory::VALIDATION_ERROR, "limit must be >= 0");
    QueryBuilder b = *this;
    b.desc_.limit = n;
    return b;
}

QueryBuilder QueryBuilder::offset(int64_t n) const {
    if (n < 0) return with_error(ErrorCategory::VALIDATION_ERROR, "offset must be >= 0");
    QueryBuilder b = *this;
    b.desc_.offset = n;
    return b;
}

QueryBuilder QueryBuilder::aggregate(JsonValue pipeline) const {
    QueryBuilder b = *this;
    b.desc_.kind = OperationKind::SELECT;
    b.desc_.pipeline = std::move(pipeline);
    return b;
}

// ============================================================================
// Predicates
// ============================================================================

QueryBuilder QueryBuilder::where(const JsonValue& predicates) const {
    QueryBuilder b = *this;
    const auto st = merge_predicates(b.desc_.predicates, predicates, "where");
    if (st.is_error()) return with_error(st.error_category(), st.error_message());
    return b;
}

QueryBuilder QueryBuilder::where(std::string key, JsonValue value) const {
    return where(JsonValue::wrap(key, std::move(value)));
}

// ============================================================================
// Writes
// ============================================================================

QueryBuilder QueryBuilder::insert(JsonValue data) const {
    QueryBuilder b = *this;
    b.desc_.kind = OperationKind::INSERT;
    b.desc_.data = std::move(data);
    return b;
}

QueryBuilder QueryBuilder::into(std::string table) const {
    return from(std::move(table));
}

QueryBuilder QueryBuilder::insert_into(std::string table, JsonValue data) const {
    return insert(std::move(data)).into(std::move(table));
}

QueryBuilder QueryBuilder::update(JsonValue data) const {
    QueryBuilder b = *this;
    b.desc_.kind = OperationKind::UPDATE;
    b.desc_.data = std::move(data);
    return b;
}

QueryBuilder QueryBuilder::table(std::string name) const {
    return from(std::move(name));
}

QueryBuilder QueryBuilder::remove() const {
    QueryBuilder b = *this;
    b.desc_.kind = OperationKind::DELETE;
    return b;
}

QueryBuilder QueryBuilder::returning(std::vector<std::string> columns) const {
    QueryBuilder b = *this;
    b.desc_.returning = columns.empty() ? std::vector<std::string>{"*"} : std::move(columns);
    return b;
}

// ============================================================================
// Modifiers / execution
// ============================================================================

QueryBuilder QueryBuilder::first() const {
    QueryBuilder b = *this;
    b.desc_.single = true;
    return b;
}

QueryBuilder QueryBuilder::cached(bool enabled) const {
    QueryBuilder b = *this;
    b.desc_.cache = enabled;
    return b;
}

Result<QueryOutput> QueryBuilder::execute() const {
    using R = Result<QueryOutput>;

    if (desc_.error) {
        return R::error(desc_.error->first, desc_.error->second);
    }
    if (desc_.kind == OperationKind::NONE) {
        return R::error(ErrorCategory::UNSUPPORTED_OPERATION,
            "operation kind must be set before execution");
    }
    if (!executor_) {
        return R::error(ErrorCategory::NO_CONNECTION,
            unavailable_reason_.empty() ? std::string("no provider bound to this query")
                                        : unavailable_reason_);
    }

    const bool use_cache = desc_.cache && desc_.kind == OperationKind::SELECT &&
                           cache_ && cache_->is_enabled();
    if (use_cache) {
        if (auto hit = cache_->get(executor_->name(), desc_)) {
            return R::ok(std::move(*hit));
        }
    }

    auto result = executor_->execute(desc_);
    if (result.is_ok() && use_cache) {
        cache_->put(executor_->name(), desc_, result.value());
    }
    return result;
}

std::future<Result<QueryOutput>> QueryBuilder::execute_async() const {
    return std::async(std::launch::async, [self = *this] { return self.execute(); });
}

} // namespace polystore
