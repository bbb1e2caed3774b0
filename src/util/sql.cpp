#include <uidkit/sql.hpp>
#include <sqlite3.h>
#include <algorithm>

namespace uidkit {

std::string db_type_name(const DbValue& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "integer";
        case 2: return "real";
        case 3: return "text";
        case 4:
            return "blob(" + std::to_string(std::get<4>(v).size()) + " bytes)";
    }
    return "unknown";
}

Result<DbValue> to_db_value(const Uuid& u) {
    if (u.is_nil()) {
        return Result<DbValue>::ok(DbValue{});
    }

    auto b = codec::decode_canonical(u.to_string());
    if (b.is_err()) {
        return UidError{UidError::InvalidFormat,
            "uuid: incorrect UUID format " + u.to_string(),
            b.error().hint};
    }
    const UuidBytes& packed = b.value();
    return Result<DbValue>::ok(
        DbValue{std::vector<uint8_t>(packed.begin(), packed.end())});
}

Status scan(const DbValue& src, Uuid& out) {
    if (std::holds_alternative<std::monostate>(src)) {
        out = Uuid();
        return ok_status();
    }

    if (auto blob = std::get_if<std::vector<uint8_t>>(&src)) {
        if (blob->size() == UUID_SIZE) {
            UuidBytes b{};
            std::copy(blob->begin(), blob->end(), b.begin());
            auto r = Uuid::from_string(codec::encode(b));
            UIDKIT_TRY(r);
            out = std::move(r).value();
            return ok_status();
        }
    }

    return UidError{UidError::UnsupportedType,
        "uuid: cannot convert " + db_type_name(src) + " to UUID",
        "expected NULL or a 16-byte blob"};
}

static UidError sqlite_error(sqlite3_stmt* stmt, const std::string& what, int rc) {
    sqlite3* db = sqlite3_db_handle(stmt);
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return UidError{UidError::Database, what + ": " + detail};
}

Status bind_uuid(sqlite3_stmt* stmt, int index, const Uuid& u) {
    auto v = to_db_value(u);
    UIDKIT_TRY(v);

    int rc;
    if (auto blob = std::get_if<std::vector<uint8_t>>(&v.value())) {
        rc = sqlite3_bind_blob(stmt, index, blob->data(),
                               static_cast<int>(blob->size()), SQLITE_TRANSIENT);
    } else {
        rc = sqlite3_bind_null(stmt, index);
    }
    if (rc != SQLITE_OK) {
        return sqlite_error(stmt, "SQLite bind failed", rc);
    }
    return ok_status();
}

static DbValue read_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return DbValue{static_cast<int64_t>(sqlite3_column_int64(stmt, col))};
        case SQLITE_FLOAT:
            return DbValue{sqlite3_column_double(stmt, col)};
        case SQLITE_TEXT: {
            auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int n = sqlite3_column_bytes(stmt, col);
            return DbValue{std::string(text ? text : "", static_cast<size_t>(n))};
        }
        case SQLITE_BLOB: {
            auto data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            int n = sqlite3_column_bytes(stmt, col);
            if (!data) return DbValue{std::vector<uint8_t>{}};
            return DbValue{std::vector<uint8_t>(data, data + n)};
        }
        default:
            return DbValue{};
    }
}

Status column_uuid(sqlite3_stmt* stmt, int col, Uuid& out) {
    return scan(read_column(stmt, col), out);
}

} // namespace uidkit
