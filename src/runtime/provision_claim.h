#pragma once

/**
 * @file provision_claim.h
 * @brief 세션별 프로비저닝 클레임 (TTL)
 *
 * 같은 세션에 대한 동시 start()가 컨테이너를 두 번 만들지 않도록
 * 공유 DB에 짧은 수명의 소유 행을 둡니다. 만료된 클레임은
 * 다음 획득 시도가 원자적으로 가져갑니다.
 */

#include "core/activity_tracker.h"
#include "core/session_types.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace previewd::data {
class DataStore;
}

namespace previewd::runtime {

/**
 * @brief 프로비저닝 클레임 저장소
 */
class ProvisionClaimStore {
public:
    explicit ProvisionClaimStore(std::shared_ptr<data::DataStore> store,
                                 core::ClockFn clock = core::nowEpochMs);

    /**
     * @brief 클레임 테이블 마이그레이션 등록 및 적용
     */
    bool initialize();

    /**
     * @brief 클레임 획득 시도
     * @return 획득하면 소유 토큰, 다른 소유자가 유효한 클레임을 가지고 있으면 std::nullopt
     */
    std::optional<std::string> tryAcquire(const core::SessionKey& key, std::chrono::milliseconds ttl);

    /**
     * @brief 클레임 만료 시각 연장
     * @return 아직 소유하고 있으면 true
     */
    bool refresh(const core::SessionKey& key, const std::string& token, std::chrono::milliseconds ttl);

    /**
     * @brief 클레임 해제 (소유자만)
     */
    bool release(const core::SessionKey& key, const std::string& token);

    /**
     * @brief 유효한 클레임이 있는지
     */
    [[nodiscard]] bool isClaimed(const core::SessionKey& key) const;

    /**
     * @brief 128비트 난수 토큰 (16진수)
     */
    [[nodiscard]] static std::string generateToken();

private:
    std::shared_ptr<data::DataStore> store_;
    core::ClockFn clock_;
};

} // namespace previewd::runtime
