#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace tl::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

constexpr char const *kSettingsSchemaSql =
    "CREATE TABLE IF NOT EXISTS settings ("
    "key TEXT PRIMARY KEY,"
    "value TEXT NOT NULL);";

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            TL_LOG_WARN("failed to create state directory {}: {}",
                        parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        TL_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        TL_LOG_INFO("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    return execute(kSettingsSchemaSql);
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            TL_LOG_ERROR("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        TL_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt =
        prepare_cached("SELECT value FROM settings WHERE key = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto text =
            reinterpret_cast<char const *>(sqlite3_column_text(stmt, 0));
        if (text != nullptr)
        {
            value = std::string(text);
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt = prepare_cached("DELETE FROM settings WHERE key = ?;");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

} // namespace tl::storage
