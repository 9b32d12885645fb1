#include <sandcell/container.h>

#include <sys/socket.h>
#include <cstdint>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "http_utils.h"
#include "utils.h"

namespace {

constexpr time_t kConnectTimeout = 5; // s
constexpr time_t kRequestTimeout = 60; // s; container create & delete may be slow
constexpr long kExecGrace = 10'000'000; // us

class DockerRuntime : public ContainerRuntime {
  std::string socket_path_;
  std::string api_prefix_;

  httplib::Client MakeClient_(time_t read_timeout_sec) const {
    httplib::Client cli(socket_path_);
    cli.set_address_family(AF_UNIX);
    cli.set_default_headers({{"Host", "docker"}});
    cli.set_connection_timeout(kConnectTimeout, 0);
    cli.set_read_timeout(read_timeout_sec, 0);
    cli.set_write_timeout(kRequestTimeout, 0);
    return cli;
  }
  std::string Url_(const std::string& path) const {
    return api_prefix_ + path;
  }
  [[noreturn]] void Fail_(const httplib::Result& res, const std::string& what,
                          ContainerErrorKind not_found = ContainerErrorKind::RUNTIME) const;

  void Start_(const std::string& id);
 public:
  DockerRuntime(const std::string& socket_path, const std::string& api_version) :
      socket_path_(socket_path), api_prefix_("/" + api_version) {}

  std::string Create(const std::string& name, const ContainerConfig& config,
                     const fs::path& data_dir) override;
  ExecResult Exec(const std::string& id, const std::vector<std::string>& command,
                  const std::string& workdir, long timeout) override;
  void Remove(const std::string& id) override;
};

std::string ErrorMessage(const httplib::Result& res) {
  try {
    return nlohmann::json::parse(res->body).value("message", res->body);
  } catch (const nlohmann::json::exception&) {
    return res->body;
  }
}

void DockerRuntime::Fail_(const httplib::Result& res, const std::string& what,
                          ContainerErrorKind not_found) const {
  if (!res) {
    throw ContainerError(ContainerErrorKind::DAEMON_UNAVAILABLE,
        fmt::format("{}: {} ({})", what, httplib::to_string(res.error()), socket_path_));
  }
  ContainerErrorKind kind = res->status == 404 ? not_found : ContainerErrorKind::RUNTIME;
  throw ContainerError(kind, fmt::format("{}: HTTP {} {}", what, res->status, ErrorMessage(res)));
}

std::string DockerRuntime::Create(const std::string& name, const ContainerConfig& config,
                                  const fs::path& data_dir) {
  nlohmann::json binds = nlohmann::json::array();
  binds.push_back(data_dir.string() + ":" + config.working_dir + ":rw");
  for (auto& [host, target] : config.read_only_mounts) binds.push_back(host + ":" + target + ":ro");
  nlohmann::json env = nlohmann::json::array();
  for (auto& [key, val] : config.environment) env.push_back(key + "=" + val);
  nlohmann::json body = {
    {"Image", config.image},
    {"Tty", true},
    {"OpenStdin", true},
    {"WorkingDir", config.working_dir},
    {"User", config.user},
    {"Env", env},
    {"HostConfig", {
      {"NetworkMode", NetworkModeName(config.network_mode)},
      {"NanoCpus", (int64_t)(config.cpu_limit * 1e9)},
      {"Memory", ParseMemoryLimit(config.memory_limit)},
      {"Binds", binds},
    }},
  };
  auto cli = MakeClient_(kRequestTimeout);
  std::string url = Url_("/containers/create?name=" + name);
  auto res = HTTPRequest<HTTPPost>(cli, url, body.dump(), "application/json");
  if (res && res->status == 409) {
    // left over from an earlier run
    spdlog::info("Container {} already exists, replacing it", name);
    Remove(name);
    res = HTTPRequest<HTTPPost>(cli, url, body.dump(), "application/json");
  }
  if (!IsSuccess(res)) Fail_(res, "create " + name, ContainerErrorKind::IMAGE_NOT_FOUND);
  std::string id;
  try {
    id = nlohmann::json::parse(res->body).at("Id").get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    throw ContainerError(ContainerErrorKind::RUNTIME, "create " + name + ": " + e.what());
  }
  try {
    Start_(id);
  } catch (const ContainerError&) {
    Remove(id);
    throw;
  }
  spdlog::info("Container created: name={} id={} network={}", name, id.substr(0, 12),
               NetworkModeName(config.network_mode));
  return id;
}

void DockerRuntime::Start_(const std::string& id) {
  auto cli = MakeClient_(kRequestTimeout);
  auto res = HTTPRequest<HTTPPost>(cli, Url_("/containers/" + id + "/start"), std::string(), "application/json");
  // 304: already started
  if (res && res->status == 304) return;
  if (!IsSuccess(res)) Fail_(res, "start " + id, ContainerErrorKind::CONTAINER_NOT_FOUND);
}

ExecResult DockerRuntime::Exec(const std::string& id, const std::vector<std::string>& command,
                               const std::string& workdir, long timeout) {
  nlohmann::json create_body = {
    {"AttachStdout", true},
    {"AttachStderr", true},
    {"Tty", false},
    {"Cmd", command},
    {"WorkingDir", workdir},
  };
  auto cli = MakeClient_(kRequestTimeout);
  auto res = HTTPRequest<HTTPPost>(cli, Url_("/containers/" + id + "/exec"),
                                   create_body.dump(), "application/json");
  if (!IsSuccess(res)) Fail_(res, "exec in " + id, ContainerErrorKind::CONTAINER_NOT_FOUND);
  std::string exec_id;
  try {
    exec_id = nlohmann::json::parse(res->body).at("Id").get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    throw ContainerError(ContainerErrorKind::RUNTIME, "exec in " + id + ": " + e.what());
  }

  auto stream_cli = MakeClient_((timeout + kExecGrace) / 1'000'000);
  nlohmann::json start_body = {{"Detach", false}, {"Tty", false}};
  res = HTTPRequest<HTTPPost>(stream_cli, Url_("/exec/" + exec_id + "/start"),
                              start_body.dump(), "application/json");
  if (!res && res.error() == httplib::Error::Read) {
    spdlog::warn("Exec {} in {} did not finish in time", exec_id.substr(0, 12), id.substr(0, 12));
    return {-1, "", true};
  }
  if (!IsSuccess(res)) Fail_(res, "exec start in " + id, ContainerErrorKind::CONTAINER_NOT_FOUND);

  // multiplexed stream: [type, 0, 0, 0, size(4, big endian)] payload
  std::string out, err;
  const std::string& body = res->body;
  for (size_t pos = 0; pos + 8 <= body.size();) {
    uint8_t type = body[pos];
    uint32_t size = (uint32_t)(uint8_t)body[pos + 4] << 24 | (uint32_t)(uint8_t)body[pos + 5] << 16 |
                    (uint32_t)(uint8_t)body[pos + 6] << 8 | (uint32_t)(uint8_t)body[pos + 7];
    pos += 8;
    size = std::min<size_t>(size, body.size() - pos);
    (type == 2 ? err : out).append(body, pos, size);
    pos += size;
  }

  res = HTTPRequest<HTTPGet>(cli, Url_("/exec/" + exec_id + "/json"));
  if (!IsSuccess(res)) Fail_(res, "exec inspect in " + id, ContainerErrorKind::CONTAINER_NOT_FOUND);
  int exit_code = -1;
  try {
    auto json = nlohmann::json::parse(res->body);
    if (json.contains("ExitCode") && json["ExitCode"].is_number_integer()) {
      exit_code = json["ExitCode"].get<int>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ContainerError(ContainerErrorKind::RUNTIME, "exec inspect in " + id + ": " + e.what());
  }
  return {exit_code, out + err, false};
}

void DockerRuntime::Remove(const std::string& id) {
  auto cli = MakeClient_(kRequestTimeout);
  auto res = HTTPRequest<HTTPDelete>(cli, Url_("/containers/" + id + "?force=true&v=true"));
  if (res && res->status == 404) return;
  if (!IsSuccess(res)) Fail_(res, "remove " + id);
  spdlog::info("Container removed: {}", id.substr(0, 12));
}

} // namespace

std::unique_ptr<ContainerRuntime> MakeDockerRuntime(
    const std::string& socket_path, const std::string& api_version) {
  return std::make_unique<DockerRuntime>(socket_path, api_version);
}
