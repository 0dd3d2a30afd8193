#pragma once

#include "core/error.hpp"
#include "db/document/document_operation.hpp"
#include "query/query_descriptor.hpp"

namespace polystore {

/**
 * @brief Maps a QueryDescriptor onto a document operation
 *
 * select -> find / findOne (single) / aggregate (pipeline set),
 * insert -> insertOne / insertMany (array payload),
 * update -> updateOne / updateMany, delete -> deleteOne / deleteMany.
 * Joins, GROUP BY and HAVING have no document rendition and are
 * rejected with UNSUPPORTED_OPERATION.
 */
class DocumentCompiler {
public:
    [[nodiscard]] static Result<DocumentOperation> compile(const QueryDescriptor& desc);
};

} // namespace polystore
