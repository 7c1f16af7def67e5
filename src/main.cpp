/**
 * @file main.cpp
 * @brief previewd 명령줄 진입점
 *
 * QCoreApplication 초기화, 설정 로드, CLI 인수 파싱, 시그널 핸들링을 수행합니다.
 *
 * 명령:
 *   status <project> <session>            상태 조회 (필요하면 자동 시작)
 *   start <project> <session>             미리보기 시작
 *   stop <project> <session>              미리보기 정지
 *   restart <project> <session>           미리보기 재시작
 *   revert <project> <session> <sha>      세션 브랜치 되돌리기
 *   urls <project>                        프로젝트 미리보기 URL 목록
 *   stop-all [<project>]                  미리보기 일괄 정지 (프로젝트 생략 시 전체)
 *   sweep                                 유휴 인스턴스 한 번 회수
 *   serve                                 주기 회수 실행 (SIGINT/SIGTERM까지)
 *   session create|list|archive|history   세션 레코드 관리
 *   env set|unset|list                    프로젝트 환경 변수 관리
 *
 * 종료 코드: 0 성공, 1 오류, 2 사용법 오류
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <QTimer>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>

#include "core/config.h"
#include "core/idle_reclaimer.h"
#include "core/preview_app.h"
#include "core/preview_service.h"
#include "data/session_repository.h"

using namespace previewd;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

// ============================================================
// 전역 상태 (시그널 핸들러에서 접근)
// ============================================================

QCoreApplication* g_app = nullptr;

/**
 * @brief UNIX 시그널 핸들러
 *
 * SIGINT(Ctrl+C), SIGTERM 수신 시 Qt 이벤트 루프를 종료합니다.
 */
void signalHandler(int signum) {
    std::cerr << "\n[previewd] 시그널 " << signum << " 수신, 종료 중..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================
// 출력 헬퍼
// ============================================================

int printError(core::ErrorCode code, const std::string& message) {
    std::cerr << "error: " << core::errorCodeName(code) << ": " << message << std::endl;
    return kExitError;
}

int usageError(const std::string& message) {
    std::cerr << "usage: " << message << std::endl;
    return kExitUsage;
}

std::optional<int64_t> parseProjectId(const QString& text) {
    bool ok = false;
    const qlonglong value = text.toLongLong(&ok);
    if (!ok || value <= 0) return std::nullopt;
    return static_cast<int64_t>(value);
}

/// "KEY=VALUE" 목록 해석
std::optional<data::EnvVarList> parseEnvAssignments(const QStringList& assignments) {
    data::EnvVarList vars;
    for (const QString& entry : assignments) {
        const int eq = entry.indexOf('=');
        if (eq <= 0) return std::nullopt;
        vars.emplace_back(entry.left(eq).toStdString(), entry.mid(eq + 1).toStdString());
    }
    return vars;
}

// ============================================================
// 명령 처리
// ============================================================

struct CommandContext {
    core::PreviewApp& app;
    QCommandLineParser& parser;
    QStringList args;           ///< 명령 이름 뒤의 위치 인수
};

/// <project> <session> 두 인수를 요구하는 명령 공통 처리
bool requireSessionArgs(const CommandContext& ctx, int64_t& project_id, std::string& session_id) {
    if (ctx.args.size() < 2) return false;
    auto pid = parseProjectId(ctx.args.at(0));
    if (!pid) return false;
    project_id = *pid;
    session_id = ctx.args.at(1).toStdString();
    return true;
}

int cmdStatus(CommandContext& ctx) {
    int64_t pid = 0;
    std::string sid;
    if (!requireSessionArgs(ctx, pid, sid)) {
        return usageError("previewd status <project> <session> [--no-autostart] [--wait]");
    }

    if (ctx.parser.isSet("no-autostart")) {
        auto inspected = ctx.app.service().inspect(pid, sid);
        if (!inspected.success) return printError(inspected.error, inspected.error_message);
        const auto& instance = inspected.instance;
        std::cout << "state=" << runtime::instanceStateName(instance.state)
                  << " url=" << (instance.url.empty() ? "-" : instance.url)
                  << " container=" << instance.container_name << std::endl;
        return kExitOk;
    }

    auto status = ctx.app.service().status(pid, sid);
    if (!status.success) return printError(status.error, status.error_message);

    std::cout << "running=" << (status.running ? "true" : "false")
              << " url=" << status.url.value_or("-")
              << " responding=" << (status.is_responding ? "true" : "false")
              << " autostart=" << (status.auto_start_triggered ? "triggered"
                                   : status.start_in_progress ? "in-progress" : "no")
              << std::endl;

    if (status.auto_start_triggered && ctx.parser.isSet("wait")) {
        ctx.app.orchestrator().waitForBackgroundTasks();
        auto inspected = ctx.app.service().inspect(pid, sid);
        if (inspected.success) {
            std::cout << "state=" << runtime::instanceStateName(inspected.instance.state)
                      << " url=" << (inspected.instance.url.empty() ? "-" : inspected.instance.url) << std::endl;
        }
    }
    return kExitOk;
}

int cmdStart(CommandContext& ctx) {
    int64_t pid = 0;
    std::string sid;
    if (!requireSessionArgs(ctx, pid, sid)) {
        return usageError("previewd start <project> <session> [--env KEY=VALUE]... [--user <id>]");
    }
    auto env = parseEnvAssignments(ctx.parser.values("env"));
    if (!env) {
        return usageError("--env 값은 KEY=VALUE 형식이어야 합니다");
    }

    auto started = ctx.app.service().start(pid, sid, *env, ctx.parser.value("user").toStdString());
    if (!started.success) return printError(started.error, started.error_message);

    std::cout << "url=" << started.url
              << " status=" << runtime::instanceStateName(started.status)
              << " provisioned=" << (started.provisioned ? "true" : "false") << std::endl;
    return kExitOk;
}

int cmdStop(CommandContext& ctx) {
    int64_t pid = 0;
    std::string sid;
    if (!requireSessionArgs(ctx, pid, sid)) {
        return usageError("previewd stop <project> <session>");
    }
    auto stopped = ctx.app.service().stop(pid, sid);
    if (!stopped.success) return printError(stopped.error, stopped.error_message);
    std::cout << "stopped=" << (stopped.existed ? "true" : "false") << std::endl;
    return kExitOk;
}

int cmdRestart(CommandContext& ctx) {
    int64_t pid = 0;
    std::string sid;
    if (!requireSessionArgs(ctx, pid, sid)) {
        return usageError("previewd restart <project> <session>");
    }
    auto restarted = ctx.app.service().restart(pid, sid);
    if (!restarted.success) return printError(restarted.error, restarted.error_message);
    std::cout << "url=" << restarted.url << " status=" << runtime::instanceStateName(restarted.status) << std::endl;
    return kExitOk;
}

int cmdRevert(CommandContext& ctx) {
    int64_t pid = 0;
    std::string sid;
    if (ctx.args.size() < 3 || !requireSessionArgs(ctx, pid, sid)) {
        return usageError("previewd revert <project> <session> <commit> [--message-id <id>] [--no-restart]");
    }

    auto outcome = ctx.app.service().revert(pid, sid, ctx.args.at(2).toStdString(), "",
                                            ctx.parser.value("message-id").toStdString(),
                                            !ctx.parser.isSet("no-restart"));
    if (!outcome.success) return printError(outcome.error, outcome.error_message);

    std::cout << "reverted=" << outcome.revert.reverted_to_commit
              << " previous=" << outcome.revert.previous_commit
              << " branch=" << outcome.revert.branch
              << " restarted=" << (outcome.restarted ? "true" : "false") << std::endl;
    if (!outcome.warning.empty()) {
        std::cerr << "warning: " << outcome.warning << std::endl;
    }
    return kExitOk;
}

int cmdUrls(CommandContext& ctx) {
    auto pid = parseProjectId(ctx.args.value(0));
    if (!pid) {
        return usageError("previewd urls <project>");
    }
    const auto entries = ctx.app.service().previewUrls(*pid);
    for (const auto& entry : entries) {
        std::cout << entry.session_id << "\t" << entry.branch << "\t"
                  << (entry.url.empty() ? "-" : entry.url) << "\t" << entry.container_state << std::endl;
    }
    std::cout << "total=" << entries.size() << std::endl;
    return kExitOk;
}

int cmdStopAll(CommandContext& ctx) {
    std::optional<int64_t> pid;
    if (!ctx.args.isEmpty()) {
        pid = parseProjectId(ctx.args.at(0));
        if (!pid) {
            return usageError("previewd stop-all [<project>]");
        }
    }
    std::cout << "stopped=" << ctx.app.service().stopAll(pid) << std::endl;
    return kExitOk;
}

int cmdSweep(CommandContext& ctx) {
    auto report = ctx.app.reclaimer().sweep();
    std::cout << "idle=" << report.examined << " stopped=" << report.stopped
              << " failed=" << report.failed << " skipped=" << report.skipped << std::endl;
    return report.failed > 0 ? kExitError : kExitOk;
}

int cmdServe(CommandContext& ctx, QCoreApplication& qapp) {
    // 시작 직후 한 번 회수한 뒤 주기 스레드에 맡김
    QTimer::singleShot(0, [&ctx]() {
        ctx.app.reclaimer().sweep();
        ctx.app.reclaimer().startPeriodic();
    });

    std::cout << "[previewd] serve 실행 중 (유휴 기준 " << ctx.app.config().idle.idle_threshold_ms
              << "ms, 간격 " << ctx.app.config().idle.sweep_interval_ms << "ms)" << std::endl;
    int code = qapp.exec();
    ctx.app.reclaimer().stopPeriodic();
    return code == 0 ? kExitOk : kExitError;
}

int cmdSession(CommandContext& ctx) {
    const QString sub = ctx.args.value(0);
    const QStringList rest = ctx.args.mid(1);
    auto pid = parseProjectId(rest.value(0));
    if (!pid) {
        return usageError("previewd session create|list|archive|history <project> [<session>]");
    }

    if (sub == "list") {
        for (const auto& record : ctx.app.service().listSessions(*pid)) {
            std::cout << record.session_id << "\t" << record.branch_name << "\t"
                      << core::sessionStatusName(record.status)
                      << (record.is_default ? "\tdefault" : "") << "\t"
                      << record.last_activity_at << std::endl;
        }
        return kExitOk;
    }

    if (rest.size() < 2) {
        return usageError("previewd session " + sub.toStdString() + " <project> <session>");
    }
    const std::string sid = rest.at(1).toStdString();

    if (sub == "create") {
        core::ErrorCode error = core::ErrorCode::None;
        auto record = ctx.app.service().createSession(*pid, sid, ctx.parser.isSet("default"), &error);
        if (!record) return printError(error, "세션 생성 실패: " + sid);
        std::cout << "session=" << record->session_id << " branch=" << record->branch_name
                  << " default=" << (record->is_default ? "true" : "false") << std::endl;
        return kExitOk;
    }
    if (sub == "archive") {
        auto archived = ctx.app.service().archive(*pid, sid);
        if (!archived.success) return printError(archived.error, archived.error_message);
        if (!archived.warning.empty()) std::cerr << "warning: " << archived.warning << std::endl;
        std::cout << "archived=" << sid << std::endl;
        return kExitOk;
    }
    if (sub == "history") {
        for (const auto& entry : ctx.app.service().revertHistory(*pid, sid)) {
            std::cout << entry.reverted_at << "\t" << entry.previous_sha << " -> " << entry.commit_sha
                      << "\t" << (entry.triggering_message_id.empty() ? "-" : entry.triggering_message_id)
                      << std::endl;
        }
        return kExitOk;
    }
    return usageError("알 수 없는 session 하위 명령: " + sub.toStdString());
}

int cmdEnv(CommandContext& ctx) {
    const QString sub = ctx.args.value(0);
    const QStringList rest = ctx.args.mid(1);
    auto pid = parseProjectId(rest.value(0));
    if (!pid) {
        return usageError("previewd env set|unset|list <project> [KEY [VALUE]]");
    }
    auto& repository = ctx.app.repository();

    if (sub == "list") {
        // 값은 출력하지 않음
        for (const auto& [key, value] : repository.environmentVariables(*pid)) {
            std::cout << key << "=***" << std::endl;
        }
        return kExitOk;
    }
    if (sub == "set" && rest.size() >= 3) {
        if (!repository.setEnvironmentVariable(*pid, rest.at(1).toStdString(), rest.at(2).toStdString())) {
            return printError(core::ErrorCode::Internal, repository.lastError());
        }
        return kExitOk;
    }
    if (sub == "unset" && rest.size() >= 2) {
        if (!repository.removeEnvironmentVariable(*pid, rest.at(1).toStdString())) {
            return printError(core::ErrorCode::NotFound, "환경 변수가 없습니다: " + rest.at(1).toStdString());
        }
        return kExitOk;
    }
    return usageError("previewd env set <project> KEY VALUE | unset <project> KEY | list <project>");
}

} // 익명 네임스페이스


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // ---- Qt 애플리케이션 초기화 ----
    QCoreApplication qapp(argc, argv);
    QCoreApplication::setApplicationName("previewd");
    QCoreApplication::setApplicationVersion("0.1.0");

    g_app = &qapp;

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("세션 미리보기 오케스트레이터");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "status|start|stop|restart|revert|urls|stop-all|sweep|serve|session|env");

    parser.addOption(QCommandLineOption({"c", "config"}, "설정 파일 경로 (key=value)", "path"));
    parser.addOption(QCommandLineOption("env", "컨테이너 환경 변수 (KEY=VALUE, 반복 가능)", "assignment"));
    parser.addOption(QCommandLineOption("user", "요청 사용자 ID", "id"));
    parser.addOption(QCommandLineOption("message-id", "되돌리기를 요청한 메시지 ID", "id"));
    parser.addOption(QCommandLineOption("no-restart", "되돌린 뒤 인스턴스를 재시작하지 않음"));
    parser.addOption(QCommandLineOption("no-autostart", "자동 시작 없이 상태만 조회"));
    parser.addOption(QCommandLineOption("wait", "자동 시작이 끝날 때까지 대기"));
    parser.addOption(QCommandLineOption("default", "프로젝트 기본 세션으로 생성"));

    if (!parser.parse(qapp.arguments())) {
        return usageError(parser.errorText().toStdString());
    }
    if (parser.isSet("help")) {
        parser.showHelp(kExitOk);
    }
    if (parser.isSet("version")) {
        parser.showVersion();
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError("previewd <command> [options] (--help 참고)");
    }
    const QString command = positional.takeFirst();

    // ---- 설정 ----
    core::Config config = core::Config::load(parser.value("config").toStdString());
    if (auto problem = config.validate()) {
        return printError(core::ErrorCode::InvalidArgument, *problem);
    }

    // ---- 시그널 핸들러 설치 ----
    installSignalHandlers();

    // ---- 애플리케이션 초기화 ----
    core::PreviewApp app;
    if (!app.initialize(config)) {
        return printError(core::ErrorCode::Internal, app.lastError());
    }

    CommandContext ctx{app, parser, positional};
    int exit_code = kExitUsage;

    if (command == "status")        exit_code = cmdStatus(ctx);
    else if (command == "start")    exit_code = cmdStart(ctx);
    else if (command == "stop")     exit_code = cmdStop(ctx);
    else if (command == "restart")  exit_code = cmdRestart(ctx);
    else if (command == "revert")   exit_code = cmdRevert(ctx);
    else if (command == "urls")     exit_code = cmdUrls(ctx);
    else if (command == "stop-all") exit_code = cmdStopAll(ctx);
    else if (command == "sweep")    exit_code = cmdSweep(ctx);
    else if (command == "serve")    exit_code = cmdServe(ctx, qapp);
    else if (command == "session")  exit_code = cmdSession(ctx);
    else if (command == "env")      exit_code = cmdEnv(ctx);
    else exit_code = usageError("알 수 없는 명령: " + command.toStdString());

    // ---- 정리 ----
    app.shutdown();
    return exit_code;
}
