/**
 * @file data_store.cpp
 * @brief SQLite 상태 저장소 구현
 */

#include "data_store.h"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace previewd::data {

namespace {

constexpr int kBusyTimeoutMs = 5000;

DbValue columnValue(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
            return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
        }
        default:
            return nullptr;
    }
}

DbRow readRow(sqlite3_stmt* stmt) {
    DbRow row;
    const int columns = sqlite3_column_count(stmt);
    for (int c = 0; c < columns; ++c) {
        row.emplace(sqlite3_column_name(stmt, c), columnValue(stmt, c));
    }
    return row;
}

int bindValue(sqlite3_stmt* stmt, int index, const DbValue& value) {
    return std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else {
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

} // 익명 네임스페이스

int64_t rowInt(const DbRow& row, const std::string& column, int64_t fallback) {
    auto it = row.find(column);
    if (it == row.end()) return fallback;
    if (const auto* v = std::get_if<int64_t>(&it->second)) return *v;
    if (const auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    return fallback;
}

std::string rowText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return "";
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    if (const auto* v = std::get_if<int64_t>(&it->second)) return std::to_string(*v);
    return "";
}

void DataStore::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

DataStore::DataStore() = default;

DataStore::~DataStore() {
    close();
}

// ============================================================
// 연결
// ============================================================

bool DataStore::open(const std::string& db_path) {
    std::lock_guard lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }

    const bool in_memory = db_path == ":memory:";
    if (!in_memory) {
        const auto parent = std::filesystem::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::create_directories(parent, ec) && ec) {
            last_error_ = "디렉토리 생성 실패: " + parent.string() + " (" + ec.message() + ")";
            return false;
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        recordError("open");
        sqlite3_close_v2(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    bool pragmas = execScript("PRAGMA foreign_keys=ON;", "pragma[foreign_keys]");
    if (!in_memory) {
        // 여러 프로세스가 같은 파일을 공유
        pragmas = execScript("PRAGMA journal_mode=WAL;", "pragma[journal_mode]") && pragmas;
        pragmas = execScript("PRAGMA synchronous=NORMAL;", "pragma[synchronous]") && pragmas;
    }
    if (!pragmas) {
        std::cerr << "[DataStore] PRAGMA 설정 실패: " << last_error_ << std::endl;
    }

    std::cout << "[DataStore] 열림: " << db_path << std::endl;
    return true;
}

void DataStore::close() {
    std::lock_guard lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool DataStore::isOpen() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

std::string DataStore::lastError() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

// ============================================================
// 구문 실행
// ============================================================

DataStore::Statement DataStore::prepare(const std::string& sql, const std::vector<DbValue>& params,
                                        const char* context) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
        recordError(std::string("prepare[") + context + "]");
        sqlite3_finalize(raw);
        return nullptr;
    }
    Statement stmt(raw);

    for (size_t i = 0; i < params.size(); ++i) {
        const int index = static_cast<int>(i) + 1;
        if (bindValue(stmt.get(), index, params[i]) != SQLITE_OK) {
            recordError(std::string("bind[") + context + "#" + std::to_string(index) + "]");
            return nullptr;
        }
    }
    return stmt;
}

int DataStore::execute(const std::string& sql, const std::vector<DbValue>& params) {
    std::lock_guard lock(mutex_);
    if (!requireOpen()) return -1;

    Statement stmt = prepare(sql, params, "execute");
    if (!stmt) return -1;

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        recordError("step[execute]");
        return -1;
    }
    return sqlite3_changes(db_);
}

DbResultSet DataStore::query(const std::string& sql, const std::vector<DbValue>& params) {
    std::lock_guard lock(mutex_);
    DbResultSet rows;
    if (!requireOpen()) return rows;

    Statement stmt = prepare(sql, params, "query");
    if (!stmt) return rows;

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(readRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        recordError("step[query]");
    }
    return rows;
}

std::optional<DbValue> DataStore::queryScalar(const std::string& sql, const std::vector<DbValue>& params) {
    std::lock_guard lock(mutex_);
    if (!requireOpen()) return std::nullopt;

    Statement stmt = prepare(sql, params, "scalar");
    if (!stmt) return std::nullopt;

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW && sqlite3_column_count(stmt.get()) > 0) {
        return columnValue(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        recordError("step[scalar]");
    }
    return std::nullopt;
}

int64_t DataStore::lastInsertRowId() const {
    std::lock_guard lock(mutex_);
    return db_ ? sqlite3_last_insert_rowid(db_) : -1;
}

// ============================================================
// 트랜잭션
// ============================================================

bool DataStore::transaction(const std::function<bool()>& func) {
    std::lock_guard lock(mutex_);
    if (!requireOpen()) return false;
    if (!execScript("BEGIN IMMEDIATE", "transaction[begin]")) return false;

    bool committed = false;
    try {
        committed = func() && execScript("COMMIT", "transaction[commit]");
    } catch (const std::exception& e) {
        last_error_ = std::string("트랜잭션 예외: ") + e.what();
    }
    if (committed) return true;

    // 롤백 에러가 원래 실패 원인을 덮지 않도록 보존
    const std::string cause = last_error_;
    if (!execScript("ROLLBACK", "transaction[rollback]")) {
        std::cerr << "[DataStore] 롤백 실패: " << last_error_ << std::endl;
    }
    last_error_ = cause;
    return false;
}

// ============================================================
// 마이그레이션
// ============================================================

void DataStore::registerMigration(const Migration& migration) {
    std::lock_guard lock(mutex_);
    const bool known = std::any_of(migrations_.begin(), migrations_.end(),
                                   [&](const Migration& m) { return m.version == migration.version; });
    if (known) return;

    auto pos = std::upper_bound(migrations_.begin(), migrations_.end(), migration,
                                [](const Migration& a, const Migration& b) { return a.version < b.version; });
    migrations_.insert(pos, migration);
}

int DataStore::runMigrations() {
    std::lock_guard lock(mutex_);
    if (!requireOpen()) return -1;

    if (!execScript("CREATE TABLE IF NOT EXISTS _migrations ("
                    " version INTEGER PRIMARY KEY,"
                    " name TEXT NOT NULL,"
                    " applied_at INTEGER NOT NULL)",
                    "migration[table]")) {
        return -1;
    }

    int applied = 0;
    for (const auto& migration : migrations_) {
        const std::string tag = "v" + std::to_string(migration.version) + " (" + migration.name + ")";

        // 다른 프로세스가 먼저 적용했을 수 있으므로 쓰기 잠금 안에서 다시 확인
        const bool ok = transaction([&]() {
            auto present = queryScalar("SELECT 1 FROM _migrations WHERE version = ?",
                                       {static_cast<int64_t>(migration.version)});
            if (present) return true;

            if (!execScript(migration.up_sql, "migration[" + tag + "]")) return false;
            if (execute("INSERT INTO _migrations (version, name, applied_at) "
                        "VALUES (?, ?, CAST(strftime('%s','now') AS INTEGER) * 1000)",
                        {static_cast<int64_t>(migration.version), migration.name}) != 1) {
                return false;
            }
            ++applied;
            std::cout << "[DataStore] 마이그레이션 적용: " << tag << std::endl;
            return true;
        });

        if (!ok) {
            std::cerr << "[DataStore] 마이그레이션 실패: " << tag << " - " << last_error_ << std::endl;
            return -1;
        }
    }
    return applied;
}

int DataStore::currentSchemaVersion() const {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* raw = nullptr;
    // _migrations 테이블이 없으면 prepare가 실패하고 버전 0
    if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM _migrations", -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return 0;
    }
    Statement stmt(raw);

    if (sqlite3_step(stmt.get()) == SQLITE_ROW && sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return 0;
}

// ============================================================
// 내부
// ============================================================

bool DataStore::execScript(const std::string& sql, const std::string& context) {
    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) == SQLITE_OK) {
        return true;
    }
    last_error_ = context + ": " + (message ? message : sqlite3_errmsg(db_));
    sqlite3_free(message);
    return false;
}

bool DataStore::requireOpen() {
    if (db_) return true;
    last_error_ = "데이터베이스가 열려있지 않습니다";
    return false;
}

void DataStore::recordError(const std::string& context) {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "DB 핸들 없음");
}

} // namespace previewd::data
