/**
 * @file docker_driver.cpp
 * @brief docker CLI 드라이버 구현
 */

#include "docker_driver.h"
#include "core/process_runner.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace previewd::runtime {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimmed(const std::string& text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

/// 포트 바인딩 배열에서 첫 호스트 포트 추출
std::optional<int> firstHostPort(const QJsonValue& bindings) {
    if (!bindings.isArray()) return std::nullopt;
    for (const auto& entry : bindings.toArray()) {
        const QString port = entry.toObject().value("HostPort").toString();
        bool ok = false;
        const int value = port.toInt(&ok);
        if (ok && value > 0) return value;
    }
    return std::nullopt;
}

DriverResult failureFrom(const core::ProcessResult& result) {
    if (!result.launched) {
        return DriverResult::fail(DriverError::Unavailable, result.describe());
    }
    if (result.timed_out) {
        return DriverResult::fail(DriverError::Failed, "docker 명령 시간 초과");
    }
    return DriverResult::fail(DockerCliDriver::classifyError(result.stderr_text), result.describe());
}

} // 익명 네임스페이스

const char* driverErrorName(DriverError error) {
    switch (error) {
        case DriverError::None:              return "None";
        case DriverError::NotFound:          return "NotFound";
        case DriverError::NameConflict:      return "NameConflict";
        case DriverError::PortConflict:      return "PortConflict";
        case DriverError::ResourceExhausted: return "ResourceExhausted";
        case DriverError::Unavailable:       return "Unavailable";
        case DriverError::Failed:            break;
    }
    return "Failed";
}

DockerCliDriver::DockerCliDriver(std::shared_ptr<core::CommandRunner> runner,
                                 std::string docker_binary,
                                 int container_port,
                                 std::chrono::milliseconds command_timeout)
    : runner_(std::move(runner))
    , docker_binary_(std::move(docker_binary))
    , container_port_(container_port)
    , command_timeout_(command_timeout) {}

// ============================================================
// 에러 분류 / 출력 해석
// ============================================================

DriverError DockerCliDriver::classifyError(const std::string& stderr_text) {
    const std::string text = toLower(stderr_text);

    if (text.find("no such container") != std::string::npos ||
        text.find("no such object") != std::string::npos) {
        return DriverError::NotFound;
    }
    if (text.find("port is already allocated") != std::string::npos ||
        text.find("address already in use") != std::string::npos) {
        return DriverError::PortConflict;
    }
    if (text.find("is already in use by container") != std::string::npos) {
        return DriverError::NameConflict;
    }
    if (text.find("no space left") != std::string::npos ||
        text.find("cannot allocate memory") != std::string::npos ||
        text.find("insufficient") != std::string::npos ||
        text.find("could not find an available") != std::string::npos ||
        text.find("too many") != std::string::npos) {
        return DriverError::ResourceExhausted;
    }
    if (text.find("cannot connect to the docker daemon") != std::string::npos ||
        text.find("is the docker daemon running") != std::string::npos ||
        text.find("permission denied while trying to connect") != std::string::npos) {
        return DriverError::Unavailable;
    }
    return DriverError::Failed;
}

std::optional<ContainerInfo> DockerCliDriver::parseInspectOutput(const std::string& json,
                                                                 int container_port) {
    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isArray() || doc.array().isEmpty()) {
        return std::nullopt;
    }

    const QJsonObject obj = doc.array().first().toObject();
    const QJsonObject state = obj.value("State").toObject();
    const QJsonObject config = obj.value("Config").toObject();

    ContainerInfo info;
    info.id = obj.value("Id").toString().toStdString();
    info.name = obj.value("Name").toString().toStdString();
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }
    info.running = state.value("Running").toBool(false);
    info.state = state.value("Status").toString().toStdString();
    info.created_at = obj.value("Created").toString().toStdString();

    const QJsonObject labels = config.value("Labels").toObject();
    for (auto it = labels.begin(); it != labels.end(); ++it) {
        info.labels[it.key().toStdString()] = it.value().toString().toStdString();
    }

    // 실행 중이면 NetworkSettings.Ports, 멈춘 컨테이너는 HostConfig.PortBindings에만 남음
    const QString port_key = QString::number(container_port) + "/tcp";
    info.host_port = firstHostPort(obj.value("NetworkSettings").toObject()
                                       .value("Ports").toObject().value(port_key));
    if (!info.host_port) {
        info.host_port = firstHostPort(obj.value("HostConfig").toObject()
                                           .value("PortBindings").toObject().value(port_key));
    }
    return info;
}

std::vector<std::string> DockerCliDriver::buildRunArgs(const ContainerSpec& spec) const {
    std::vector<std::string> args{docker_binary_, "run", "-d", "--name", spec.name};

    if (!spec.network.empty()) {
        args.insert(args.end(), {"--network", spec.network});
    }

    // 값은 프로세스 환경으로만 전달
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"-e", key});
    }

    std::vector<std::string> label_keys;
    label_keys.reserve(spec.labels.size());
    for (const auto& [key, value] : spec.labels) {
        label_keys.push_back(key);
    }
    std::sort(label_keys.begin(), label_keys.end());
    for (const auto& key : label_keys) {
        args.insert(args.end(), {"--label", key + "=" + spec.labels.at(key)});
    }

    if (spec.host_port) {
        args.insert(args.end(), {"-p", std::to_string(*spec.host_port) + ":" +
                                       std::to_string(spec.container_port)});
    }
    if (!spec.bind_source.empty()) {
        args.insert(args.end(), {"-v", spec.bind_source + ":" + spec.bind_target});
        args.insert(args.end(), {"-w", spec.bind_target});
    }

    args.push_back(spec.image);
    return args;
}

// ============================================================
// 런타임 연산
// ============================================================

bool DockerCliDriver::ping() {
    core::ProcessOptions options;
    options.timeout = std::chrono::seconds(10);
    auto result = runner_->run({docker_binary_, "version", "--format", "{{.Server.Version}}"}, options);
    if (!result.ok()) {
        std::cerr << "[DockerDriver] 데몬 접근 불가: " << result.describe() << std::endl;
        return false;
    }
    return true;
}

std::optional<ContainerInfo> DockerCliDriver::inspect(const std::string& name, DriverError* error) {
    if (error) *error = DriverError::None;

    core::ProcessOptions options;
    options.timeout = command_timeout_;
    auto result = runner_->run({docker_binary_, "container", "inspect", name}, options);
    if (!result.ok()) {
        DriverResult failure = failureFrom(result);
        if (error) *error = failure.error;
        if (failure.error != DriverError::NotFound) {
            std::cerr << "[DockerDriver] inspect 실패 (" << name << "): " << failure.message << std::endl;
        }
        return std::nullopt;
    }

    auto info = parseInspectOutput(result.stdout_text, container_port_);
    if (!info) {
        if (error) *error = DriverError::Failed;
        std::cerr << "[DockerDriver] inspect 출력 해석 실패: " << name << std::endl;
    }
    return info;
}

std::vector<ContainerInfo> DockerCliDriver::listByLabel(const std::string& key, const std::string& value) {
    core::ProcessOptions options;
    options.timeout = command_timeout_;
    auto result = runner_->run({docker_binary_, "ps", "-a",
                                "--filter", "label=" + key + "=" + value,
                                "--format", "{{.Names}}"}, options);
    std::vector<ContainerInfo> containers;
    if (!result.ok()) {
        std::cerr << "[DockerDriver] 목록 조회 실패: " << result.describe() << std::endl;
        return containers;
    }

    std::istringstream lines(result.stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        std::string name = trimmed(line);
        if (name.empty()) continue;
        if (auto info = inspect(name)) {
            containers.push_back(std::move(*info));
        }
    }
    return containers;
}

DriverResult DockerCliDriver::ensureImage(const std::string& image) {
    core::ProcessOptions options;
    options.timeout = command_timeout_;
    auto present = runner_->run({docker_binary_, "image", "inspect", "--format", "{{.Id}}", image}, options);
    if (present.ok()) {
        return DriverResult::ok();
    }
    if (!present.launched) {
        return failureFrom(present);
    }

    std::cout << "[DockerDriver] 이미지 가져오는 중: " << image << std::endl;
    options.timeout = std::chrono::minutes(10);
    auto pulled = runner_->run({docker_binary_, "pull", "--quiet", image}, options);
    if (!pulled.ok()) {
        return failureFrom(pulled);
    }
    return DriverResult::ok();
}

DriverResult DockerCliDriver::run(const ContainerSpec& spec) {
    core::ProcessOptions options;
    options.timeout = command_timeout_;
    options.extra_env = spec.env;

    auto result = runner_->run(buildRunArgs(spec), options);
    if (!result.ok()) {
        return failureFrom(result);
    }

    std::string id = trimmed(result.stdout_text);
    std::cout << "[DockerDriver] 컨테이너 시작: " << spec.name << " (" << id.substr(0, 12) << ")" << std::endl;
    return DriverResult::ok(std::move(id));
}

DriverResult DockerCliDriver::stop(const std::string& name, std::chrono::seconds grace) {
    core::ProcessOptions options;
    options.timeout = command_timeout_ + grace;
    auto result = runner_->run({docker_binary_, "stop", "-t", std::to_string(grace.count()), name}, options);
    if (!result.ok()) {
        return failureFrom(result);
    }
    return DriverResult::ok();
}

DriverResult DockerCliDriver::remove(const std::string& name) {
    core::ProcessOptions options;
    options.timeout = command_timeout_;
    auto result = runner_->run({docker_binary_, "rm", "-f", name}, options);
    if (!result.ok()) {
        return failureFrom(result);
    }
    return DriverResult::ok();
}

DriverResult DockerCliDriver::restart(const std::string& name, std::chrono::seconds grace) {
    core::ProcessOptions options;
    options.timeout = command_timeout_ + grace;
    auto result = runner_->run({docker_binary_, "restart", "-t", std::to_string(grace.count()), name}, options);
    if (!result.ok()) {
        return failureFrom(result);
    }
    return DriverResult::ok();
}

} // namespace previewd::runtime
