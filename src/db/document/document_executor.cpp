#include "db/document/document_executor.hpp"
#include "core/utils.hpp"
#include "db/document/document_compiler.hpp"
#include "db/document/document_pipeline.hpp"

#include <format>

namespace polystore {

DocumentExecutor::DocumentExecutor(std::string name, ProviderKind kind,
                                   std::shared_ptr<IDocumentDriver> driver)
    : name_(std::move(name)), kind_(kind), driver_(std::move(driver)) {}

Status DocumentExecutor::wrap(const Status& st, std::string_view operation) const {
    if (st.error_category() == ErrorCategory::DRIVER_ERROR ||
        st.error_category() == ErrorCategory::VALIDATION_ERROR) {
        return wrap_driver_failure(name_, operation, st.error_message(),
            st.error_category() == ErrorCategory::VALIDATION_ERROR);
    }
    return st;
}

Result<QueryOutput> DocumentExecutor::execute(const QueryDescriptor& desc) {
    using R = Result<QueryOutput>;
    utils::Timer timer;

    auto op = DocumentCompiler::compile(desc);
    if (op.is_error()) return R::propagate(op);

    if (closed_.load()) {
        return R::error(ErrorCategory::NO_CONNECTION, std::format("provider '{}' is closed", name_));
    }

    const auto action = document_action_to_string(op.value().action);
    utils::log::debug(std::format("[{}] {} {}", name_, action, op.value().collection));

    auto result = driver_->run(op.value());
    if (result.is_error()) {
        return R::propagate(wrap(Status::propagate(result), action));
    }

    QueryOutput out;
    out.single = desc.single;
    out.affected_rows = result.value().affected;

    const bool read = desc.kind == OperationKind::SELECT;
    if (read || !desc.returning.empty()) {
        std::vector<std::string> projection;
        if (!read) {
            for (const auto& col : desc.returning) {
                if (col != "*") projection.push_back(col);
            }
        }
        for (auto& doc : result.value().documents) {
            out.rows.push_back(projection.empty() ? std::move(doc)
                                                  : DocumentPipeline::project(doc, projection));
        }
    }
    if (desc.single && out.rows.size() > 1) {
        out.rows.resize(1);
    }
    out.execution_time = timer.elapsed_us();
    return R::ok(std::move(out));
}

Result<SchemaApplyResult> DocumentExecutor::ensure_schema(const SchemaDescriptor& schema) {
    using R = Result<SchemaApplyResult>;
    if (closed_.load()) {
        return R::error(ErrorCategory::NO_CONNECTION, std::format("provider '{}' is closed", name_));
    }
    const auto st = driver_->ensure_collection(schema.name);
    if (st.is_error()) return R::propagate(wrap(st, "create_schema"));

    SchemaApplyResult result;
    result.table = schema.name;
    result.created = true;
    return R::ok(std::move(result));
}

Status DocumentExecutor::ping() {
    if (closed_.load()) {
        return Status::error(ErrorCategory::NO_CONNECTION, std::format("provider '{}' is closed", name_));
    }
    const auto st = driver_->ping();
    if (st.is_error()) {
        return Status::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}' ({}) ping failed: {}", name_, driver_->driver_name(),
                st.error_message()));
    }
    return Status::ok();
}

Status DocumentExecutor::close() {
    if (closed_.exchange(true)) return Status::ok();
    driver_->close();
    utils::log::info(std::format("Provider '{}' closed", name_));
    return Status::ok();
}

} // namespace polystore
