#include "db/mysql/mysql_type_map.hpp"

namespace polystore {

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return GenericColumnType::BLOB;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    ColumnTypeInfo info;
    info.vendor_type_id = static_cast<uint32_t>(field.type);
    info.vendor_type_name = field.name ? field.name : "";
    info.generic_type = (field.type == MYSQL_TYPE_TINY && field.length == 1)
        ? GenericColumnType::BOOLEAN
        : field_type_to_generic(field.type);
    // Text and blob share a field type; the binary charset (63) marks real blobs
    if (info.generic_type == GenericColumnType::BLOB && field.charsetnr != 63) {
        info.generic_type = GenericColumnType::TEXT;
    }
    return info;
}

} // namespace polystore
