#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace polystore {

/**
 * @brief MySQL field type to GenericColumnType mapping for result decoding
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @brief Build ColumnTypeInfo from result metadata
     *
     * TINYINT(1) is reported as BOOLEAN, which is how MySQL stores the
     * BOOLEAN column type.
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace polystore
