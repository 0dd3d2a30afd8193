#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>
#include <utility>

namespace polystore {

namespace {

struct PgTypeEntry {
    GenericColumnType generic;
    const char* name;
};

const std::unordered_map<uint32_t, PgTypeEntry>& pg_types() {
    static const std::unordered_map<uint32_t, PgTypeEntry> TYPES = {
        {16,   {GenericColumnType::BOOLEAN, "boolean"}},
        {17,   {GenericColumnType::BLOB, "bytea"}},
        {20,   {GenericColumnType::BIGINT, "bigint"}},
        {21,   {GenericColumnType::SMALLINT, "smallint"}},
        {23,   {GenericColumnType::INTEGER, "integer"}},
        {25,   {GenericColumnType::TEXT, "text"}},
        {26,   {GenericColumnType::INTEGER, "oid"}},
        {114,  {GenericColumnType::JSON, "json"}},
        {142,  {GenericColumnType::XML, "xml"}},
        {700,  {GenericColumnType::REAL, "real"}},
        {701,  {GenericColumnType::DOUBLE_PRECISION, "double precision"}},
        {790,  {GenericColumnType::MONEY, "money"}},
        {829,  {GenericColumnType::MACADDR, "macaddr"}},
        {869,  {GenericColumnType::INET, "inet"}},
        {650,  {GenericColumnType::INET, "cidr"}},
        {1042, {GenericColumnType::CHAR, "character"}},
        {1043, {GenericColumnType::VARCHAR, "character varying"}},
        {1082, {GenericColumnType::DATE, "date"}},
        {1083, {GenericColumnType::TIME, "time"}},
        {1114, {GenericColumnType::TIMESTAMP, "timestamp"}},
        {1184, {GenericColumnType::TIMESTAMP_TZ, "timestamptz"}},
        {1186, {GenericColumnType::INTERVAL, "interval"}},
        {1266, {GenericColumnType::TIME, "timetz"}},
        {1700, {GenericColumnType::NUMERIC, "numeric"}},
        {2950, {GenericColumnType::UUID, "uuid"}},
        {3802, {GenericColumnType::JSONB, "jsonb"}},
        // Arrays arrive in PostgreSQL's text form, not JSON
        {1007, {GenericColumnType::ARRAY, "integer[]"}},
        {1009, {GenericColumnType::ARRAY, "text[]"}},
        {2277, {GenericColumnType::ARRAY, "anyarray"}},
    };
    return TYPES;
}

} // namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& types = pg_types();
    const auto it = types.find(oid);
    return it != types.end() ? it->second.generic : GenericColumnType::UNKNOWN;
}

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    const auto& types = pg_types();
    const auto it = types.find(oid);
    return it != types.end() ? it->second.name : std::string{};
}

ColumnTypeInfo PgTypeMap::oid_type_info(uint32_t oid) {
    return ColumnTypeInfo(oid_to_generic_type(oid), oid, oid_to_type_name(oid));
}

} // namespace polystore
