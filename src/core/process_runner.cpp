/**
 * @file process_runner.cpp
 * @brief POSIX 하위 프로세스 실행기 구현
 *
 * fork 이후 자식에서는 async-signal-safe 호출만 사용합니다.
 * 환경 변수 배열은 fork 이전에 부모에서 준비합니다.
 */

#include "process_runner.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unordered_set>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace previewd::core {

namespace {

/**
 * @brief 부모 환경 + 추가 변수로 envp 문자열 목록 구성
 */
std::vector<std::string> buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& extra
) {
    std::unordered_set<std::string> overridden;
    for (const auto& [key, value] : extra) {
        overridden.insert(key);
    }

    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string line(*entry);
        auto eq = line.find('=');
        std::string key = eq == std::string::npos ? line : line.substr(0, eq);
        if (overridden.count(key)) continue;
        env.push_back(std::move(line));
    }
    for (const auto& [key, value] : extra) {
        env.push_back(key + "=" + value);
    }
    return env;
}

/**
 * @brief fd에서 읽을 수 있는 만큼 읽기
 * @return EOF 또는 에러면 false
 */
bool drainFd(int fd, std::string& out) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // 익명 네임스페이스

// ============================================================
// ProcessResult
// ============================================================

std::string ProcessResult::describe() const {
    if (!launched) return error_message;
    if (timed_out) return "제한 시간 초과";

    std::string text = stderr_text.empty() ? stdout_text : stderr_text;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (text.empty()) {
        text = "종료 코드 " + std::to_string(exit_code);
    }
    return text;
}

// ============================================================
// PosixCommandRunner
// ============================================================

ProcessResult PosixCommandRunner::run(const std::vector<std::string>& argv,
                                      const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty()) {
        result.error_message = "빈 명령";
        return result;
    }

    // fork 이전에 argv/envp 준비
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<std::string> env = buildEnvironment(options.extra_env);
    std::vector<char*> c_envp;
    c_envp.reserve(env.size() + 1);
    for (auto& entry : env) {
        c_envp.push_back(entry.data());
    }
    c_envp.push_back(nullptr);

    std::string work_dir = options.working_dir.string();

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe 실패: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe 실패: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string("fork 실패: ") + std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // 자식 프로세스
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (!work_dir.empty() && ::chdir(work_dir.c_str()) != 0) {
            ::_exit(126);
        }

        ::execvpe(c_argv[0], c_argv.data(), c_envp.data());
        ::_exit(127);
    }

    // 부모 프로세스
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
        if (err_open) fds[count++] = pollfd{err_pipe[0], POLLIN, 0};

        int rc = ::poll(fds, count, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_pipe[0]) {
                out_open = drainFd(out_pipe[0], result.stdout_text);
            } else {
                err_open = drainFd(err_pipe[0], result.stderr_text);
            }
        }
    }

    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int status = 0;
    if (result.timed_out) {
        ::kill(pid, SIGKILL);
        std::cerr << "[ProcessRunner] 제한 시간 초과로 종료: " << argv[0] << std::endl;
    }
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }

    int code = decodeWaitStatus(status);
    if (code == 127) {
        result.launched = false;
        result.exit_code = code;
        result.error_message = "실행 파일을 찾을 수 없습니다: " + argv[0];
        return result;
    }

    result.launched = true;
    result.exit_code = code;
    return result;
}

// ============================================================
// PATH 검색
// ============================================================

bool executableOnPath(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::string paths(path_env);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            if (::access(candidate.c_str(), X_OK) == 0) return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace previewd::core
