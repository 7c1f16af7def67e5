/**
 * @file git_client.cpp
 * @brief git CLI 래퍼 구현
 */

#include "git_client.h"

#include <openssl/evp.h>

#include <iostream>

namespace previewd::vcs {

namespace {

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

/// 옵션으로 해석될 수 있는 인수 차단
bool looksLikeOption(const std::string& value) {
    return !value.empty() && value.front() == '-';
}

GitResult rejectArgument(const std::string& what) {
    GitResult result;
    result.error_message = "잘못된 인수: " + what;
    return result;
}

} // 익명 네임스페이스

GitClient::GitClient(std::shared_ptr<core::CommandRunner> runner,
                     std::string git_binary,
                     std::chrono::milliseconds timeout)
    : runner_(std::move(runner))
    , git_binary_(std::move(git_binary))
    , timeout_(timeout) {}

// ============================================================
// 실행
// ============================================================

GitResult GitClient::run(const std::filesystem::path& repo,
                         const std::vector<std::string>& args,
                         const std::string& token) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(git_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    core::ProcessOptions options;
    options.working_dir = repo;
    options.timeout = timeout_;
    options.extra_env = {
        {"GIT_TERMINAL_PROMPT", "0"},
        {"LC_ALL", "C"},
    };
    if (!token.empty()) {
        // 원격 URL을 바꾸지 않고 환경 변수로 인증 헤더 주입
        options.extra_env.emplace_back("GIT_CONFIG_COUNT", "1");
        options.extra_env.emplace_back("GIT_CONFIG_KEY_0", "http.extraHeader");
        options.extra_env.emplace_back("GIT_CONFIG_VALUE_0",
                                       "Authorization: Basic " + basicCredential(token));
    }

    core::ProcessResult proc = runner_->run(argv, options);

    GitResult result;
    result.exit_code = proc.exit_code;
    result.output = trimTrailing(proc.stdout_text);
    result.success = proc.ok();
    if (!result.success) {
        result.error_message = redact(proc.describe());
    }
    return result;
}

// ============================================================
// 조회
// ============================================================

bool GitClient::isRepository(const std::filesystem::path& repo) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(repo, ec)) return false;
    auto result = run(repo, {"rev-parse", "--is-inside-work-tree"});
    return result.success && result.output == "true";
}

std::optional<std::string> GitClient::resolveCommit(const std::filesystem::path& repo,
                                                    const std::string& rev) const {
    if (rev.empty() || looksLikeOption(rev)) return std::nullopt;
    auto result = run(repo, {"rev-parse", "--verify", "--quiet", rev + "^{commit}"});
    if (!result.success || result.output.empty()) return std::nullopt;
    return result.output;
}

std::optional<std::string> GitClient::currentBranch(const std::filesystem::path& repo) const {
    auto result = run(repo, {"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (!result.success || result.output.empty()) return std::nullopt;
    return result.output;
}

bool GitClient::isAncestor(const std::filesystem::path& repo,
                           const std::string& ancestor,
                           const std::string& descendant) const {
    if (looksLikeOption(ancestor) || looksLikeOption(descendant)) return false;
    // 종료 코드 0: 조상, 1: 조상 아님, 그 외: 에러
    auto result = run(repo, {"merge-base", "--is-ancestor", ancestor, descendant});
    return result.success;
}

bool GitClient::localBranchExists(const std::filesystem::path& repo,
                                  const std::string& branch) const {
    return run(repo, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch}).success;
}

bool GitClient::remoteBranchExists(const std::filesystem::path& repo,
                                   const std::string& remote,
                                   const std::string& branch) const {
    return run(repo, {"show-ref", "--verify", "--quiet",
                      "refs/remotes/" + remote + "/" + branch}).success;
}

std::optional<std::string> GitClient::remoteUrl(const std::filesystem::path& repo,
                                                const std::string& remote) const {
    auto result = run(repo, {"remote", "get-url", remote});
    if (!result.success || result.output.empty()) return std::nullopt;
    return result.output;
}

bool GitClient::hasUncommittedChanges(const std::filesystem::path& repo) const {
    auto result = run(repo, {"status", "--porcelain", "--untracked-files=no"});
    return result.success && !result.output.empty();
}

// ============================================================
// 변경
// ============================================================

GitResult GitClient::clone(const std::string& source, const std::filesystem::path& dest) const {
    return run({}, {"clone", "--quiet", "--no-hardlinks", "--", source, dest.string()});
}

GitResult GitClient::setRemoteUrl(const std::filesystem::path& repo, const std::string& remote,
                                  const std::string& url) const {
    return run(repo, {"remote", "set-url", remote, url});
}

GitResult GitClient::fetch(const std::filesystem::path& repo, const std::string& remote,
                           const std::string& token) const {
    return run(repo, {"fetch", "--quiet", "--prune", remote}, token);
}

GitResult GitClient::checkout(const std::filesystem::path& repo, const std::string& branch) const {
    if (looksLikeOption(branch)) return rejectArgument(branch);
    return run(repo, {"checkout", "--quiet", branch, "--"});
}

GitResult GitClient::createBranch(const std::filesystem::path& repo, const std::string& branch,
                                  const std::string& start_point) const {
    if (looksLikeOption(branch) || looksLikeOption(start_point)) {
        return rejectArgument(branch + " " + start_point);
    }
    return run(repo, {"checkout", "--quiet", "-b", branch, start_point, "--"});
}

GitResult GitClient::fastForward(const std::filesystem::path& repo, const std::string& upstream) const {
    if (looksLikeOption(upstream)) return rejectArgument(upstream);
    return run(repo, {"merge", "--ff-only", "--quiet", upstream});
}

GitResult GitClient::resetHard(const std::filesystem::path& repo, const std::string& commit) const {
    if (looksLikeOption(commit)) return rejectArgument(commit);
    return run(repo, {"reset", "--hard", "--quiet", commit});
}

GitResult GitClient::forcePush(const std::filesystem::path& repo, const std::string& remote,
                               const std::string& commit, const std::string& branch,
                               const std::optional<std::string>& expected_tip,
                               const std::string& token) const {
    if (looksLikeOption(branch)) return rejectArgument(branch);
    if (looksLikeOption(commit)) return rejectArgument(commit);

    // 빈 기대값은 "원격 브랜치가 아직 없어야 함"
    const std::string ref = "refs/heads/" + branch;
    const std::string lease = "--force-with-lease=" + ref + ":" + expected_tip.value_or("");
    return run(repo, {"push", lease, "--porcelain", remote, commit + ":" + ref}, token);
}

// ============================================================
// 자격 증명
// ============================================================

std::string GitClient::redact(const std::string& text) {
    std::string out = text;
    size_t search_from = 0;

    while (true) {
        auto scheme = out.find("://", search_from);
        if (scheme == std::string::npos) break;

        size_t creds_start = scheme + 3;
        size_t host_end = out.find_first_of("/ \n\t", creds_start);
        if (host_end == std::string::npos) host_end = out.size();

        auto at = out.rfind('@', host_end);
        if (at != std::string::npos && at >= creds_start) {
            std::string creds = out.substr(creds_start, at - creds_start);
            auto colon = creds.find(':');
            std::string user = colon == std::string::npos ? std::string("***") : creds.substr(0, colon);
            std::string masked = user + ":***";
            out.replace(creds_start, at - creds_start, masked);
            search_from = creds_start + masked.size();
        } else {
            search_from = creds_start;
        }
    }
    return out;
}

std::string GitClient::basicCredential(const std::string& token) {
    std::string plain = "oauth2:" + token;

    // base64 출력 길이: 4 * ceil(n / 3) + NUL
    std::string encoded(4 * ((plain.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        reinterpret_cast<const unsigned char*>(plain.data()),
        static_cast<int>(plain.size())
    );
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

} // namespace previewd::vcs
