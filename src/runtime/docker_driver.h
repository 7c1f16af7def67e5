#pragma once

/**
 * @file docker_driver.h
 * @brief docker CLI 기반 컨테이너 드라이버
 */

#include "runtime/container_driver.h"

#include <chrono>
#include <memory>
#include <string>

namespace previewd::core {
class CommandRunner;
}

namespace previewd::runtime {

/**
 * @brief docker CLI 드라이버
 *
 * 환경 변수 값은 argv에 쓰지 않고 `-e KEY`만 넘긴 뒤
 * docker 프로세스 환경으로 전달합니다 (ps 출력에 비밀이 남지 않음).
 */
class DockerCliDriver : public ContainerDriver {
public:
    DockerCliDriver(std::shared_ptr<core::CommandRunner> runner,
                    std::string docker_binary = "docker",
                    int container_port = 3000,
                    std::chrono::milliseconds command_timeout = std::chrono::seconds(60));

    bool ping() override;
    std::optional<ContainerInfo> inspect(const std::string& name, DriverError* error = nullptr) override;
    std::vector<ContainerInfo> listByLabel(const std::string& key, const std::string& value) override;
    DriverResult ensureImage(const std::string& image) override;
    DriverResult run(const ContainerSpec& spec) override;
    DriverResult stop(const std::string& name, std::chrono::seconds grace) override;
    DriverResult remove(const std::string& name) override;
    DriverResult restart(const std::string& name, std::chrono::seconds grace) override;

    /**
     * @brief docker 에러 출력 분류
     */
    [[nodiscard]] static DriverError classifyError(const std::string& stderr_text);

    /**
     * @brief `docker container inspect` JSON 출력 해석
     * @return 배열이 비었거나 형식이 잘못되면 std::nullopt
     */
    [[nodiscard]] static std::optional<ContainerInfo> parseInspectOutput(const std::string& json,
                                                                         int container_port);

    /**
     * @brief run 명령 argv 생성 (환경 변수 값은 포함하지 않음)
     */
    [[nodiscard]] std::vector<std::string> buildRunArgs(const ContainerSpec& spec) const;

private:
    std::shared_ptr<core::CommandRunner> runner_;
    std::string docker_binary_;
    int container_port_;    ///< 호스트 포트 매핑을 찾을 컨테이너 포트
    std::chrono::milliseconds command_timeout_;
};

} // namespace previewd::runtime
