#include <nadeef/store/sqlite.hpp>

#include <fmt/format.h>

namespace nadeef::store {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

auto extract_column(sqlite3_stmt* stmt, int index) -> Value {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text != nullptr ? text : "", static_cast<std::size_t>(size));
        }
        case SQLITE_NULL:
        default:
            return Value{};
    }
}

}  // namespace

auto SqliteConnection::open(const StoreConfig& config)
    -> std::expected<std::unique_ptr<SqliteConnection>, std::string> {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(config.path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return std::unexpected(
            fmt::format("cannot open store {} at {}: {}", config.name, config.path, error));
    }
    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));
    return std::unique_ptr<SqliteConnection>(new SqliteConnection(db));
}

SqliteConnection::~SqliteConnection() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

auto SqliteConnection::execute(const std::string& sql) -> std::expected<void, std::string> {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return std::unexpected(fmt::format("execution failed: {} (SQL: {})", error, sql));
    }
    return {};
}

auto SqliteConnection::query(const std::string& sql) -> std::expected<ResultSet, std::string> {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(
            fmt::format("failed to prepare statement: {} (SQL: {})", sqlite3_errmsg(db_), sql));
    }
    Statement stmt(raw);

    ResultSet result;
    int count = sqlite3_column_count(stmt.get());
    result.columns.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.columns.emplace_back(name != nullptr ? name : "");
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        std::vector<Value> row;
        row.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            row.push_back(extract_column(stmt.get(), i));
        }
        result.rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(
            fmt::format("query failed: {} (SQL: {})", sqlite3_errmsg(db_), sql));
    }
    return result;
}

auto SqliteConnectionFactory::connect(const StoreConfig& config)
    -> std::expected<std::unique_ptr<Connection>, std::string> {
    auto connection = SqliteConnection::open(config);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    return std::unique_ptr<Connection>(std::move(*connection));
}

}  // namespace nadeef::store
