#ifndef INSTSHARE_STORAGE_MANAGER_HPP
#define INSTSHARE_STORAGE_MANAGER_HPP

#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "../sharing/types.hpp"

// One row of the persistent_shares table.
struct PersistedShare {
    std::string share_id;
    std::string export_id;
    std::string instance_name;
    std::string package_path;
    ShareProvider provider = ShareProvider::BORE;
    std::optional<std::string> password_hash;
    std::optional<std::string> password_salt;
    uint64_t file_size = 0;
    std::time_t created_at = 0;
    std::optional<std::time_t> expires_at;
};

class StorageManager {
public:
    /**
     * @brief Opens (creating if needed) the database and its tables.
     * @throws SharingError(STORAGE) if the database cannot be opened.
     */
    explicit StorageManager(const std::string& db_path);
    ~StorageManager();

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    bool open();
    void close();
    bool create_tables();

    // Share operations
    bool save_share(const PersistedShare& share);
    std::optional<PersistedShare> get_share(const std::string& share_id);
    std::vector<PersistedShare> get_all_shares();
    bool delete_share(const std::string& share_id);
    bool delete_all_shares();

private:
    std::string db_path_;
    sqlite3* db_;
    std::mutex mutex_;

    // Helper for executing SQL statements
    bool execute_sql(const std::string& sql);
    static PersistedShare read_row(sqlite3_stmt* stmt);
};

#endif // INSTSHARE_STORAGE_MANAGER_HPP
