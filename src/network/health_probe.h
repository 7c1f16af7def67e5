#pragma once

/**
 * @file health_probe.h
 * @brief 미리보기 인스턴스 준비 상태 확인
 */

#include <chrono>
#include <string>

namespace previewd::network {

/**
 * @brief 프로브 결과
 */
struct ProbeResult {
    bool responding{false};     ///< 응답 수신 여부 (5xx 제외)
    int status_code{0};         ///< HTTP 상태 코드 (응답 없으면 0)
    std::string error_message;  ///< 연결 실패 사유
};

/**
 * @brief 준비 상태 프로브 인터페이스
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    /**
     * @brief 인스턴스 URL 확인 (제한 시간 내)
     * @param base_url 인스턴스 기본 URL
     */
    virtual ProbeResult probe(const std::string& base_url) = 0;
};

/**
 * @brief libcurl 기반 HTTP 프로브
 *
 * base_url + health_path 로 GET 요청을 보냅니다.
 * 4xx 응답도 서버가 떠 있다는 뜻이므로 응답으로 간주하고, 5xx는 미응답으로 봅니다.
 */
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(std::string health_path,
                    std::chrono::milliseconds timeout,
                    std::string host_override = "");

    ProbeResult probe(const std::string& base_url) override;

    /**
     * @brief 프로브 대상 URL 계산 (localhost 대체 호스트 적용)
     */
    [[nodiscard]] std::string probeUrl(const std::string& base_url) const;

private:
    std::string health_path_;
    std::chrono::milliseconds timeout_;
    std::string host_override_;   ///< 컨테이너 안에서 실행될 때 localhost 대신 쓸 호스트
};

} // namespace previewd::network
