#pragma once

/**
 * @file data_store.h
 * @brief SQLite 상태 저장소 래퍼
 *
 * 세션 레코드, 프로비저닝 클레임, 되돌리기 감사 로그가 모두 이 저장소를
 * 공유합니다. 여러 previewd 프로세스가 같은 DB 파일을 열 수 있도록
 * WAL 모드와 busy timeout을 사용합니다.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace previewd::data {

/// 셀 값 (NULL, 정수, 실수, 문자열). BLOB은 다루지 않음
using DbValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

/// 열 이름 → 값
using DbRow = std::unordered_map<std::string, DbValue>;

using DbResultSet = std::vector<DbRow>;

/// 정수 열 (없거나 NULL이면 fallback)
[[nodiscard]] int64_t rowInt(const DbRow& row, const std::string& column, int64_t fallback = 0);

/// 문자열 열 (없거나 NULL이면 빈 문자열)
[[nodiscard]] std::string rowText(const DbRow& row, const std::string& column);

/**
 * @brief 스키마 마이그레이션
 *
 * 여러 컴포넌트가 같은 DataStore에 자기 테이블을 등록합니다.
 * 버전 번호는 저장소 전체에서 고유해야 합니다.
 */
struct Migration {
    int version;            ///< 적용 순서
    std::string name;       ///< 로그용 이름
    std::string up_sql;     ///< 여러 구문 허용
};

/**
 * @brief SQLite 상태 저장소
 *
 * 연결 하나를 재귀 뮤텍스로 보호합니다. 단일 구문은 원자적이며,
 * 읽기 후 쓰기가 필요하면 transaction()으로 묶습니다.
 */
class DataStore {
public:
    DataStore();
    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    /**
     * @brief 데이터베이스 열기 (부모 디렉토리 생성, WAL, 외래 키, busy timeout)
     * @param db_path 파일 경로, ":memory:"면 메모리 DB
     */
    bool open(const std::string& db_path);

    void close();

    [[nodiscard]] bool isOpen() const;

    [[nodiscard]] std::string lastError() const;

    /**
     * @brief 쓰기 구문 실행
     * @param params 순서대로 ?에 바인딩
     * @return 변경된 행 수, 실패 시 -1
     */
    int execute(const std::string& sql, const std::vector<DbValue>& params = {});

    /**
     * @brief 조회
     * @return 실패 시 빈 집합 (lastError() 설정)
     */
    DbResultSet query(const std::string& sql, const std::vector<DbValue>& params = {});

    /**
     * @brief 첫 행 첫 열
     */
    std::optional<DbValue> queryScalar(const std::string& sql, const std::vector<DbValue>& params = {});

    [[nodiscard]] int64_t lastInsertRowId() const;

    /**
     * @brief BEGIN IMMEDIATE 트랜잭션
     *
     * 쓰기 잠금을 먼저 잡으므로 다른 프로세스와 읽기 후 쓰기가 엇갈리지 않습니다.
     * func가 false를 반환하거나 예외를 던지면 롤백합니다.
     *
     * @return 커밋 여부
     */
    bool transaction(const std::function<bool()>& func);

    /**
     * @brief 마이그레이션 등록 (같은 버전은 한 번만)
     */
    void registerMigration(const Migration& migration);

    /**
     * @brief 미적용 마이그레이션 적용
     * @return 이번에 적용한 수, 실패 시 -1
     */
    int runMigrations();

    [[nodiscard]] int currentSchemaVersion() const;

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    /// 준비 + 바인딩. 실패하면 nullptr (잠금 보유 상태에서 호출)
    Statement prepare(const std::string& sql, const std::vector<DbValue>& params, const char* context);

    /// 여러 구문 직접 실행 (잠금 보유 상태에서 호출)
    bool execScript(const std::string& sql, const std::string& context);

    bool requireOpen();
    void recordError(const std::string& context);

    sqlite3* db_{nullptr};
    std::string last_error_;
    mutable std::recursive_mutex mutex_;    ///< 트랜잭션 콜백 안에서 재진입 허용
    std::vector<Migration> migrations_;     ///< 버전 순
};

} // namespace previewd::data
