/**
 * @file provision_claim.cpp
 * @brief 프로비저닝 클레임 구현
 */

#include "provision_claim.h"
#include "data/data_store.h"

#include <openssl/rand.h>

#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace previewd::runtime {

ProvisionClaimStore::ProvisionClaimStore(std::shared_ptr<data::DataStore> store, core::ClockFn clock)
    : store_(std::move(store))
    , clock_(std::move(clock)) {}

bool ProvisionClaimStore::initialize() {
    if (!store_ || !store_->isOpen()) return false;

    data::Migration claims;
    claims.version = 300;
    claims.name = "프로비저닝 클레임";
    claims.up_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS provision_claims (
            project_id   INTEGER NOT NULL,
            session_id   TEXT NOT NULL,
            owner_token  TEXT NOT NULL,
            expires_at   INTEGER NOT NULL,
            PRIMARY KEY (project_id, session_id)
        );
    )SQL";
    store_->registerMigration(claims);
    return store_->runMigrations() >= 0;
}

std::string ProvisionClaimStore::generateToken() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes 실패");
    }
    std::string hex;
    hex.reserve(sizeof(bytes) * 2);
    char buf[3];
    for (unsigned char b : bytes) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        hex += buf;
    }
    return hex;
}

std::optional<std::string> ProvisionClaimStore::tryAcquire(const core::SessionKey& key,
                                                           std::chrono::milliseconds ttl) {
    std::string token;
    try {
        token = generateToken();
    } catch (const std::exception& e) {
        std::cerr << "[ProvisionClaim] 토큰 생성 실패: " << e.what() << std::endl;
        return std::nullopt;
    }

    const int64_t now = clock_();
    // 행이 없거나 만료되었을 때만 기록됨 (단일 구문이라 원자적)
    int changes = store_->execute(
        "INSERT INTO provision_claims (project_id, session_id, owner_token, expires_at) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT (project_id, session_id) DO UPDATE SET "
        "owner_token = excluded.owner_token, expires_at = excluded.expires_at "
        "WHERE provision_claims.expires_at <= ?",
        {key.project_id, key.session_id.str(), token,
         static_cast<int64_t>(now + ttl.count()), now}
    );
    if (changes < 0) {
        std::cerr << "[ProvisionClaim] 획득 실패 (" << key.toString() << "): "
                  << store_->lastError() << std::endl;
        return std::nullopt;
    }
    if (changes == 0) {
        return std::nullopt;
    }
    return token;
}

bool ProvisionClaimStore::refresh(const core::SessionKey& key, const std::string& token,
                                  std::chrono::milliseconds ttl) {
    int changes = store_->execute(
        "UPDATE provision_claims SET expires_at = ? "
        "WHERE project_id = ? AND session_id = ? AND owner_token = ?",
        {static_cast<int64_t>(clock_() + ttl.count()), key.project_id, key.session_id.str(), token}
    );
    return changes == 1;
}

bool ProvisionClaimStore::release(const core::SessionKey& key, const std::string& token) {
    int changes = store_->execute(
        "DELETE FROM provision_claims WHERE project_id = ? AND session_id = ? AND owner_token = ?",
        {key.project_id, key.session_id.str(), token}
    );
    if (changes < 0) {
        std::cerr << "[ProvisionClaim] 해제 실패 (" << key.toString() << "): "
                  << store_->lastError() << std::endl;
    }
    return changes == 1;
}

bool ProvisionClaimStore::isClaimed(const core::SessionKey& key) const {
    auto count = store_->queryScalar(
        "SELECT COUNT(*) FROM provision_claims "
        "WHERE project_id = ? AND session_id = ? AND expires_at > ?",
        {key.project_id, key.session_id.str(), clock_()}
    );
    if (!count) return false;
    const auto* value = std::get_if<int64_t>(&*count);
    return value && *value > 0;
}

} // namespace previewd::runtime
