#include "sqlite_embedding_store.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>

namespace kankodori {

// RAII wrappers for sqlite3 handles
struct DbGuard {
    sqlite3* db = nullptr;
    ~DbGuard() { if (db) sqlite3_close(db); }
};

struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS embeddings ("
    "  id     TEXT PRIMARY KEY,"
    "  vector BLOB NOT NULL"
    ");";

SqliteEmbeddingStore::SqliteEmbeddingStore(std::string path) : path_(std::move(path)) {}

EmbeddingMap SqliteEmbeddingStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    DbGuard g;
    if (sqlite3_open_v2(path_.c_str(), &g.db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string err = g.db ? sqlite3_errmsg(g.db) : "unknown error";
        throw StoreUnavailable("cannot open embedding database " + path_ + ": " + err);
    }

    StmtGuard s;
    if (sqlite3_prepare_v2(g.db, "SELECT id, vector FROM embeddings ORDER BY id;",
                           -1, &s.stmt, nullptr) != SQLITE_OK) {
        throw StoreUnavailable("embedding database has no embeddings table: " + path_ +
                               ": " + sqlite3_errmsg(g.db));
    }

    EmbeddingMap map;
    int rc;
    while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW) {
        const auto* id_text = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 0));
        const void* blob = sqlite3_column_blob(s.stmt, 1);
        int blob_size = sqlite3_column_bytes(s.stmt, 1);
        if (!id_text) continue;

        std::string data;
        if (blob && blob_size > 0) {
            data.assign(static_cast<const char*>(blob), static_cast<size_t>(blob_size));
        }
        Embedding vec = deserialize_vector(data);
        if (vec.empty()) {
            throw StoreUnavailable("corrupt vector for '" + std::string(id_text) + "' in " + path_);
        }
        map.emplace(id_text, std::move(vec));
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable("error reading embedding database " + path_ + ": " +
                               sqlite3_errmsg(g.db));
    }

    validate_dimensions(map, path_);
    return map;
}

bool SqliteEmbeddingStore::put(const std::string& id, const Embedding& vector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (vector.empty()) return false;

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    DbGuard g;
    if (sqlite3_open(path_.c_str(), &g.db) != SQLITE_OK) {
        std::cerr << "[store] Cannot open " << path_ << ": "
                  << (g.db ? sqlite3_errmsg(g.db) : "unknown error") << "\n";
        return false;
    }
    if (sqlite3_exec(g.db, kCreateTable, nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "[store] Cannot create schema in " << path_ << ": "
                  << sqlite3_errmsg(g.db) << "\n";
        return false;
    }

    StmtGuard s;
    const char* sql = "INSERT OR REPLACE INTO embeddings (id, vector) VALUES (?, ?);";
    if (sqlite3_prepare_v2(g.db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) return false;

    std::string blob = serialize_vector(vector);
    sqlite3_bind_text(s.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(s.stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    return sqlite3_step(s.stmt) == SQLITE_DONE;
}

} // namespace kankodori
