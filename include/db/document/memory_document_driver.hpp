#pragma once

#include "db/document/idocument_driver.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace polystore {

/**
 * @brief Process-local document store
 *
 * Collections are vectors of JSON objects in insertion order, guarded by a
 * single mutex. Inserted documents without an "id" get a generated uuid.
 * Used for development, tests and embedded deployments.
 */
class MemoryDocumentDriver : public IDocumentDriver {
public:
    MemoryDocumentDriver() = default;

    std::string driver_name() const override { return "memory"; }

    Status ping() override;
    Status ensure_collection(const std::string& collection) override;
    Result<DocumentResult> run(const DocumentOperation& op) override;
    void close() override;

    [[nodiscard]] size_t collection_size(const std::string& collection) const;

private:
    Result<DocumentResult> run_locked(const DocumentOperation& op);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<JsonValue>> collections_;
    std::atomic<bool> closed_{false};
};

} // namespace polystore
