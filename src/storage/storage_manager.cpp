#include "storage/storage_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, index)));
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

StorageManager::StorageManager(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {
    if (!open()) {
        throw SharingError(ErrorKind::STORAGE, "Failed to open database: " + db_path);
    }
    if (!create_tables()) {
        close();
        throw SharingError(ErrorKind::STORAGE, "Failed to create tables in database: " + db_path);
    }
}

StorageManager::~StorageManager() {
    close();
}

bool StorageManager::open() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc) {
        LOG_ERR("Can't open database: ", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    LOG_DEBUG("Opened database successfully: ", db_path_);
    return true;
}

void StorageManager::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database successfully.");
    }
}

bool StorageManager::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERR("SQL error: ", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool StorageManager::create_tables() {
    std::string create_shares_sql = R"(
        CREATE TABLE IF NOT EXISTS persistent_shares (
            share_id TEXT PRIMARY KEY NOT NULL,
            export_id TEXT NOT NULL,
            instance_name TEXT NOT NULL,
            package_path TEXT NOT NULL,
            provider TEXT NOT NULL,
            password_hash TEXT,
            password_salt TEXT,
            file_size INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            expires_at INTEGER
        );
    )";
    return execute_sql(create_shares_sql);
}

bool StorageManager::save_share(const PersistedShare& share) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = R"(
        INSERT OR REPLACE INTO persistent_shares
            (share_id, export_id, instance_name, package_path, provider, password_hash,
             password_salt, file_size, created_at, expires_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, share.share_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, share.export_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, share.instance_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, share.package_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, provider_key(share.provider), -1, SQLITE_STATIC);
    bind_optional_text(stmt, 6, share.password_hash);
    bind_optional_text(stmt, 7, share.password_salt);
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(share.file_size));
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(share.created_at));
    if (share.expires_at) {
        sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(*share.expires_at));
    } else {
        sqlite3_bind_null(stmt, 10);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to save share: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

PersistedShare StorageManager::read_row(sqlite3_stmt* stmt) {
    PersistedShare share;
    share.share_id = column_text(stmt, 0);
    share.export_id = column_text(stmt, 1);
    share.instance_name = column_text(stmt, 2);
    share.package_path = column_text(stmt, 3);
    share.provider = provider_from_key(column_text(stmt, 4)).value_or(ShareProvider::BORE);
    share.password_hash = column_optional_text(stmt, 5);
    share.password_salt = column_optional_text(stmt, 6);
    share.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    share.created_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 8));
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        share.expires_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 9));
    }
    return share;
}

std::optional<PersistedShare> StorageManager::get_share(const std::string& share_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT share_id, export_id, instance_name, package_path, provider, password_hash, "
                      "password_salt, file_size, created_at, expires_at FROM persistent_shares WHERE share_id = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, share_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<PersistedShare> share;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        share = read_row(stmt);
    }
    sqlite3_finalize(stmt);
    return share;
}

std::vector<PersistedShare> StorageManager::get_all_shares() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PersistedShare> shares;
    std::string sql = "SELECT share_id, export_id, instance_name, package_path, provider, password_hash, "
                      "password_salt, file_size, created_at, expires_at FROM persistent_shares ORDER BY created_at;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return shares;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        shares.push_back(read_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERR("Error while reading shares: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return shares;
}

bool StorageManager::delete_share(const std::string& share_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "DELETE FROM persistent_shares WHERE share_id = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, share_id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to delete share: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool StorageManager::delete_all_shares() {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute_sql("DELETE FROM persistent_shares;");
}
