#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace polystore {

/**
 * @brief PostgreSQL OID to GenericColumnType mapping for result decoding
 */
class PgTypeMap {
public:
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /// Lowercase PostgreSQL type name for an OID, empty if unknown
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    [[nodiscard]] static ColumnTypeInfo oid_type_info(uint32_t oid);
};

} // namespace polystore
