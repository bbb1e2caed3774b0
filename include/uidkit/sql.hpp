#pragma once

#include <uidkit/result.hpp>
#include <uidkit/uuid.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

struct sqlite3_stmt;

namespace uidkit {

// A value as a relational driver hands it over: NULL, INTEGER, REAL,
// TEXT or BLOB.
using DbValue = std::variant<std::monostate, int64_t, double,
                             std::string, std::vector<uint8_t>>;

// "null", "integer", "real", "text" or "blob(<n> bytes)"
std::string db_type_name(const DbValue& v);

// nil -> NULL, otherwise the 16 packed bytes for a BINARY(16)/BLOB column.
Result<DbValue> to_db_value(const Uuid& u);

// NULL -> nil, a 16-byte blob -> its canonical form. Everything else is
// UnsupportedType.
Status scan(const DbValue& src, Uuid& out);

// SQLite statement helpers built on to_db_value/scan. Indexes follow the
// SQLite conventions (bind from 1, column from 0).
Status bind_uuid(sqlite3_stmt* stmt, int index, const Uuid& u);
Status column_uuid(sqlite3_stmt* stmt, int col, Uuid& out);

} // namespace uidkit
