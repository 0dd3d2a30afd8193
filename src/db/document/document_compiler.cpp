#include "db/document/document_compiler.hpp"
#include "query/sql_compiler.hpp"

#include <format>

namespace polystore {

namespace {

Result<DocumentOperation> unsupported(std::string message) {
    return Result<DocumentOperation>::error(ErrorCategory::UNSUPPORTED_OPERATION, std::move(message));
}

Result<DocumentOperation> invalid(std::string message) {
    return Result<DocumentOperation>::error(ErrorCategory::VALIDATION_ERROR, std::move(message));
}

} // namespace

Result<DocumentOperation> DocumentCompiler::compile(const QueryDescriptor& desc) {
    if (desc.error) {
        return Result<DocumentOperation>::error(desc.error->first, desc.error->second);
    }
    if (desc.kind == OperationKind::NONE) {
        return unsupported("operation kind must be set before execution");
    }
    if (!SqlCompiler::is_valid_identifier(desc.collection) ||
        desc.collection.find('.') != std::string::npos) {
        return invalid(std::format("invalid collection name '{}'", desc.collection));
    }
    if (!desc.joins.empty()) {
        return unsupported("joins are not supported by document providers");
    }
    if (!desc.group_by.empty() || !desc.having.empty()) {
        return unsupported("group by / having are not supported by document providers; "
                           "use an aggregate pipeline");
    }

    DocumentOperation op;
    op.collection = desc.collection;

    for (const auto& [key, value] : desc.predicates) {
        if (!SqlCompiler::is_valid_identifier(key)) {
            return invalid(std::format("invalid predicate field '{}'", key));
        }
        op.query.set(key, value);
    }

    switch (desc.kind) {
        case OperationKind::SELECT: {
            for (const auto& col : desc.columns) {
                if (col == "*") continue;
                if (!SqlCompiler::is_valid_identifier(col)) {
                    return unsupported(std::format(
                        "column expression '{}' is not supported by document providers", col));
                }
                op.options.projection.push_back(col);
            }
            for (const auto& o : desc.order) {
                if (!SqlCompiler::is_valid_identifier(o.column)) {
                    return invalid(std::format("invalid sort field '{}'", o.column));
                }
            }
            op.options.sort = desc.order;
            if (desc.limit && *desc.limit < 0) return invalid("limit must be >= 0");
            if (desc.offset && *desc.offset < 0) return invalid("offset must be >= 0");
            op.options.limit = desc.limit;
            op.options.skip = desc.offset;

            if (!desc.pipeline.is_null()) {
                if (!desc.pipeline.is_array()) {
                    return invalid("aggregate pipeline must be an array of stages");
                }
                op.action = DocumentAction::AGGREGATE;
                op.pipeline = desc.pipeline;
            } else if (desc.single) {
                op.action = DocumentAction::FIND_ONE;
                op.options.limit = 1;
            } else {
                op.action = DocumentAction::FIND;
            }
            break;
        }

        case OperationKind::INSERT: {
            if (desc.data.is_array()) {
                if (desc.data.empty()) return invalid("insert requires a non-empty payload");
                for (const auto& doc : desc.data.elements()) {
                    if (!doc.is_object() || doc.empty()) {
                        return invalid("every inserted document must be a non-empty object");
                    }
                }
                op.action = DocumentAction::INSERT_MANY;
            } else if (desc.data.is_object() && !desc.data.empty()) {
                op.action = DocumentAction::INSERT_ONE;
            } else {
                return invalid("insert requires a non-empty payload");
            }
            op.data = desc.data;
            break;
        }

        case OperationKind::UPDATE: {
            if (!desc.data.is_object() || desc.data.empty()) {
                return invalid("update requires a non-empty payload");
            }
            if (desc.predicates.empty()) {
                return invalid("update requires a where clause");
            }
            op.action = desc.single ? DocumentAction::UPDATE_ONE : DocumentAction::UPDATE_MANY;
            op.data = desc.data;
            break;
        }

        case OperationKind::DELETE: {
            if (desc.predicates.empty()) {
                return invalid("delete requires a where clause");
            }
            op.action = desc.single ? DocumentAction::DELETE_ONE : DocumentAction::DELETE_MANY;
            break;
        }

        default:
            return unsupported("operation kind must be set before execution");
    }

    return Result<DocumentOperation>::ok(std::move(op));
}

} // namespace polystore
