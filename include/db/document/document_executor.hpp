#pragma once

#include "db/document/idocument_driver.hpp"
#include "db/iexecutor.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace polystore {

/**
 * @brief Executor for the document family
 *
 * Compiles descriptors with DocumentCompiler and hands them to the
 * configured driver. Written documents are returned as rows only when the
 * descriptor asked for them via returning().
 */
class DocumentExecutor : public IExecutor {
public:
    DocumentExecutor(std::string name, ProviderKind kind, std::shared_ptr<IDocumentDriver> driver);

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return kind_; }

    Result<QueryOutput> execute(const QueryDescriptor& desc) override;
    Result<SchemaApplyResult> ensure_schema(const SchemaDescriptor& schema) override;
    Status ping() override;
    Status close() override;

    [[nodiscard]] IDocumentDriver& driver() { return *driver_; }

private:
    /// Adds provider context to DRIVER_ERROR messages
    Status wrap(const Status& st, std::string_view operation) const;

    std::string name_;
    ProviderKind kind_;
    std::shared_ptr<IDocumentDriver> driver_;
    std::atomic<bool> closed_{false};
};

} // namespace polystore
