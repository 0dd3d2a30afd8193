#include "db/document/memory_document_driver.hpp"
#include "core/utils.hpp"
#include "db/document/document_pipeline.hpp"

#include <format>
#include <unordered_set>

namespace polystore {

Status MemoryDocumentDriver::ping() {
    if (closed_.load()) {
        return Status::error(ErrorCategory::CONNECTION_ERROR, "memory driver is closed");
    }
    return Status::ok();
}

Status MemoryDocumentDriver::ensure_collection(const std::string& collection) {
    if (closed_.load()) {
        return Status::error(ErrorCategory::NO_CONNECTION, "memory driver is closed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    collections_.try_emplace(collection);
    return Status::ok();
}

void MemoryDocumentDriver::close() {
    closed_.store(true);
}

size_t MemoryDocumentDriver::collection_size(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = collections_.find(collection);
    return it == collections_.end() ? 0 : it->second.size();
}

Result<DocumentResult> MemoryDocumentDriver::run(const DocumentOperation& op) {
    if (closed_.load()) {
        return Result<DocumentResult>::error(ErrorCategory::NO_CONNECTION, "memory driver is closed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return run_locked(op);
}

Result<DocumentResult> MemoryDocumentDriver::run_locked(const DocumentOperation& op) {
    using R = Result<DocumentResult>;
    auto& docs = collections_[op.collection];
    DocumentResult result;

    switch (op.action) {
        case DocumentAction::FIND:
        case DocumentAction::FIND_ONE: {
            std::vector<JsonValue> matched;
            for (const auto& doc : docs) {
                if (DocumentPipeline::matches(doc, op.query)) matched.push_back(doc);
            }
            result.documents = DocumentPipeline::apply_options(std::move(matched), op.options);
            result.affected = result.documents.size();
            break;
        }

        case DocumentAction::AGGREGATE: {
            auto out = DocumentPipeline::run(docs, op.pipeline);
            if (out.is_error()) return R::propagate(out);
            result.documents = DocumentPipeline::apply_options(std::move(out.value()), op.options);
            result.affected = result.documents.size();
            break;
        }

        case DocumentAction::INSERT_ONE:
        case DocumentAction::INSERT_MANY: {
            std::vector<JsonValue> incoming = op.data.is_array()
                ? op.data.elements() : std::vector<JsonValue>{op.data};

            std::unordered_set<std::string> ids;
            for (const auto& doc : docs) ids.insert(doc["id"].to_text());
            for (auto& doc : incoming) {
                if (!doc.contains("id") || doc["id"].is_null()) {
                    doc.set("id", utils::generate_uuid());
                }
                if (!ids.insert(doc["id"].to_text()).second) {
                    return R::error(ErrorCategory::VALIDATION_ERROR,
                        std::format("duplicate id '{}' in collection '{}'",
                            doc["id"].to_text(), op.collection));
                }
            }
            for (const auto& doc : incoming) docs.push_back(doc);
            result.affected = incoming.size();
            result.documents = std::move(incoming);
            break;
        }

        case DocumentAction::UPDATE_ONE:
        case DocumentAction::UPDATE_MANY: {
            for (auto& doc : docs) {
                if (!DocumentPipeline::matches(doc, op.query)) continue;
                doc.merge(op.data);
                result.documents.push_back(doc);
                if (op.action == DocumentAction::UPDATE_ONE) break;
            }
            result.affected = result.documents.size();
            break;
        }

        case DocumentAction::DELETE_ONE:
        case DocumentAction::DELETE_MANY: {
            std::vector<JsonValue> kept;
            kept.reserve(docs.size());
            for (auto& doc : docs) {
                const bool remove = DocumentPipeline::matches(doc, op.query) &&
                    (op.action == DocumentAction::DELETE_MANY || result.documents.empty());
                if (remove) {
                    result.documents.push_back(std::move(doc));
                } else {
                    kept.push_back(std::move(doc));
                }
            }
            docs = std::move(kept);
            result.affected = result.documents.size();
            break;
        }
    }

    return R::ok(std::move(result));
}

} // namespace polystore
