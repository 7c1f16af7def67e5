#pragma once

/**
 * @file router_adapter.h
 * @brief 미리보기 트래픽 라우팅 전략 (호스트 포트 매핑 / Traefik 서브도메인)
 */

#include "core/session_types.h"
#include "runtime/container_driver.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace previewd::core {
struct ContainerConfig;
}

namespace previewd::runtime {

/**
 * @brief 컨테이너 실행 전 라우팅 준비 결과
 */
struct RouteInfo {
    std::string url;                                        ///< 클라이언트가 접근할 URL
    std::optional<int> host_port;                           ///< 호스트 포트 (포트 모드)
    std::unordered_map<std::string, std::string> labels;    ///< 라우팅 라벨 (Traefik 모드)
};

/**
 * @brief 라우팅 전략 인터페이스
 */
class RouterAdapter {
public:
    virtual ~RouterAdapter() = default;

    /**
     * @brief 새 컨테이너 실행을 위한 URL/포트/라벨 준비
     * @param key 세션 키
     * @param container_name 결정적 컨테이너 이름 (라우터 식별자로 사용)
     */
    virtual RouteInfo prepareRun(const core::SessionKey& key, const std::string& container_name) = 0;

    /**
     * @brief 기존 컨테이너의 URL 복원
     */
    [[nodiscard]] virtual std::optional<std::string> containerUrl(const ContainerInfo& info) const = 0;

    /**
     * @brief 호스트 포트를 할당하는 전략인지 (포트 충돌 재시도 대상)
     */
    [[nodiscard]] virtual bool allocatesHostPorts() const = 0;
};

/// 포트 선택기 (범위 안의 값 하나). 테스트에서 교체 가능
using PortPicker = std::function<int(int first, int last)>;

/**
 * @brief OpenSSL RAND_bytes 기반 포트 선택
 */
[[nodiscard]] int randomPortInRange(int first, int last);

/**
 * @brief 호스트 포트 매핑 라우터 (로컬 개발용)
 *
 * URL: http://<host_address>:<port>
 */
class HostPortRouter : public RouterAdapter {
public:
    HostPortRouter(std::string host_address, int port_first, int port_last,
                   PortPicker picker = randomPortInRange);

    RouteInfo prepareRun(const core::SessionKey& key, const std::string& container_name) override;
    [[nodiscard]] std::optional<std::string> containerUrl(const ContainerInfo& info) const override;
    [[nodiscard]] bool allocatesHostPorts() const override { return true; }

private:
    std::string host_address_;
    int port_first_;
    int port_last_;
    PortPicker picker_;
};

/**
 * @brief Traefik 서브도메인 라우터
 *
 * URL: https://project-<projectId>-<세션>.<base_domain>
 */
class TraefikRouter : public RouterAdapter {
public:
    TraefikRouter(std::string base_domain, std::string entrypoint, std::string cert_resolver,
                  std::string network, int container_port);

    RouteInfo prepareRun(const core::SessionKey& key, const std::string& container_name) override;
    [[nodiscard]] std::optional<std::string> containerUrl(const ContainerInfo& info) const override;
    [[nodiscard]] bool allocatesHostPorts() const override { return false; }

    /**
     * @brief 세션의 서브도메인 호스트 이름
     *
     * 세션 ID를 DNS 레이블로 정규화합니다 (소문자, 영숫자와 '-').
     * 정규화가 값을 바꾸면 원래 ID의 해시 8자리를 붙여 세션 간 충돌을 막습니다.
     */
    [[nodiscard]] std::string hostnameFor(int64_t project_id, const std::string& session_id) const;

private:
    std::string base_domain_;
    std::string entrypoint_;
    std::string cert_resolver_;
    std::string network_;
    int container_port_;
};

/**
 * @brief 설정에 맞는 라우터 생성
 */
[[nodiscard]] std::unique_ptr<RouterAdapter> createRouterAdapter(const core::ContainerConfig& config);

/// 컨테이너 라벨 키
inline constexpr const char* kLabelProjectId = "previewd.project_id";
inline constexpr const char* kLabelSessionId = "previewd.session_id";
inline constexpr const char* kLabelBranch = "previewd.branch";
inline constexpr const char* kLabelUrl = "previewd.url";
inline constexpr const char* kLabelStartedBy = "previewd.started_by";
inline constexpr const char* kLabelManaged = "previewd.managed";     ///< 값은 항상 "true"

} // namespace previewd::runtime
