#pragma once

#include "core/error.hpp"
#include "db/document/document_operation.hpp"

#include <string>

namespace polystore {

/**
 * @brief Storage driver behind a document-family provider
 *
 * The wide-column, managed-document and graph-document kinds share this
 * seam with the plain document kind; configuration picks the driver.
 * Error messages are raw driver text; the executor adds provider context.
 */
class IDocumentDriver {
public:
    virtual ~IDocumentDriver() = default;

    [[nodiscard]] virtual std::string driver_name() const = 0;

    [[nodiscard]] virtual Status ping() = 0;

    /// Idempotent: existing collections are left untouched
    [[nodiscard]] virtual Status ensure_collection(const std::string& collection) = 0;

    [[nodiscard]] virtual Result<DocumentResult> run(const DocumentOperation& op) = 0;

    virtual void close() = 0;
};

} // namespace polystore
