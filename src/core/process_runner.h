#pragma once

/**
 * @file process_runner.h
 * @brief 하위 프로세스 실행기
 *
 * git, docker 등 외부 도구를 셸 없이 argv 배열로 실행합니다.
 * 표준 출력/에러를 수집하고 제한 시간을 넘기면 프로세스를 종료합니다.
 */

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace previewd::core {

/**
 * @brief 실행 옵션
 */
struct ProcessOptions {
    std::filesystem::path working_dir;                          ///< 작업 디렉토리 (비어있으면 현재)
    std::vector<std::pair<std::string, std::string>> extra_env; ///< 추가 환경 변수
    std::chrono::milliseconds timeout{std::chrono::minutes(5)}; ///< 제한 시간
};

/**
 * @brief 실행 결과
 */
struct ProcessResult {
    bool launched{false};       ///< exec 성공 여부
    int exit_code{-1};          ///< 종료 코드 (시그널 종료 시 -1)
    bool timed_out{false};      ///< 제한 시간 초과로 종료됨
    std::string stdout_text;    ///< 표준 출력
    std::string stderr_text;    ///< 표준 에러
    std::string error_message;  ///< 실행 자체의 실패 사유

    /**
     * @brief 정상 종료(코드 0) 여부
     */
    [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }

    /**
     * @brief 로그용 요약 (stderr 우선)
     */
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief 명령 실행 인터페이스
 *
 * 테스트에서 가짜 구현으로 교체할 수 있도록 추상화합니다.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief 명령 실행 (동기)
     * @param argv 실행 파일과 인수 (argv[0]은 PATH에서 검색)
     * @param options 실행 옵션
     */
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              const ProcessOptions& options = {}) = 0;
};

/**
 * @brief POSIX fork/exec 기반 실행기
 */
class PosixCommandRunner : public CommandRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      const ProcessOptions& options = {}) override;
};

/**
 * @brief 실행 파일이 PATH에 있는지 확인
 */
[[nodiscard]] bool executableOnPath(const std::string& name);

} // namespace previewd::core
