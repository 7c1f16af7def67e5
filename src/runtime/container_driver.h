#pragma once

/**
 * @file container_driver.h
 * @brief 컨테이너 런타임 추상화
 *
 * 오케스트레이터는 이 인터페이스만 사용합니다.
 * "실행 중인가"는 항상 런타임 조회 결과에서 얻고, 프로세스 내 캐시를 두지 않습니다.
 */

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace previewd::runtime {

/**
 * @brief 컨테이너 실행 명세
 */
struct ContainerSpec {
    std::string name;                                           ///< 결정적 컨테이너 이름
    std::string image;                                          ///< 이미지
    std::string network;                                        ///< 네트워크 (비어있으면 기본)
    std::vector<std::pair<std::string, std::string>> env;       ///< 환경 변수 (argv에 값 노출 안 함)
    std::unordered_map<std::string, std::string> labels;        ///< 라벨
    std::optional<int> host_port;                               ///< 호스트 포트 매핑
    int container_port{3000};                                   ///< 컨테이너 포트
    std::string bind_source;                                    ///< 마운트할 워크스페이스 경로
    std::string bind_target{"/app"};                            ///< 컨테이너 내 마운트 위치
};

/**
 * @brief 런타임 조회 결과
 */
struct ContainerInfo {
    std::string id;                                             ///< 컨테이너 ID
    std::string name;                                           ///< 컨테이너 이름
    bool running{false};                                        ///< 실행 중 여부
    std::string state;                                          ///< 런타임 상태 문자열 (running, exited, ...)
    std::string created_at;                                     ///< 생성 시각 (런타임 형식)
    std::optional<int> host_port;                               ///< 매핑된 호스트 포트
    std::unordered_map<std::string, std::string> labels;        ///< 라벨
};

/**
 * @brief 드라이버 에러 분류
 */
enum class DriverError {
    None,
    NotFound,           ///< 컨테이너 없음
    NameConflict,       ///< 같은 이름 컨테이너 존재
    PortConflict,       ///< 호스트 포트 사용 중
    ResourceExhausted,  ///< 메모리/디스크/네트워크 풀 고갈
    Unavailable,        ///< 데몬 접근 불가
    Failed              ///< 그 외 실패
};

[[nodiscard]] const char* driverErrorName(DriverError error);

/**
 * @brief 드라이버 연산 결과
 */
struct DriverResult {
    bool success{false};
    std::string container_id;
    DriverError error{DriverError::None};
    std::string message;

    static DriverResult ok(std::string id = {}) {
        DriverResult r;
        r.success = true;
        r.container_id = std::move(id);
        return r;
    }
    static DriverResult fail(DriverError error, std::string message) {
        DriverResult r;
        r.error = error;
        r.message = std::move(message);
        return r;
    }
};

/**
 * @brief 컨테이너 런타임 드라이버 인터페이스
 */
class ContainerDriver {
public:
    virtual ~ContainerDriver() = default;

    /**
     * @brief 런타임 데몬 접근 가능 여부
     */
    virtual bool ping() = 0;

    /**
     * @brief 이름으로 컨테이너 조회
     * @return 없으면 std::nullopt (조회 자체의 실패도 error에 기록)
     */
    virtual std::optional<ContainerInfo> inspect(const std::string& name, DriverError* error = nullptr) = 0;

    /**
     * @brief 라벨로 컨테이너 목록 조회
     */
    virtual std::vector<ContainerInfo> listByLabel(const std::string& key, const std::string& value) = 0;

    /**
     * @brief 이미지가 로컬에 있는지 확인하고 없으면 가져옴
     */
    virtual DriverResult ensureImage(const std::string& image) = 0;

    /**
     * @brief 컨테이너 생성 및 시작 (detached)
     */
    virtual DriverResult run(const ContainerSpec& spec) = 0;

    /**
     * @brief 정상 종료 요청
     */
    virtual DriverResult stop(const std::string& name, std::chrono::seconds grace) = 0;

    /**
     * @brief 강제 삭제 (실행 중이어도 삭제)
     */
    virtual DriverResult remove(const std::string& name) = 0;

    /**
     * @brief 재시작
     */
    virtual DriverResult restart(const std::string& name, std::chrono::seconds grace) = 0;
};

} // namespace previewd::runtime
