#include <unistd.h>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <sandcell/tools.h>
#include <sandcell/utils.h>
#include <sandcell/config.h>
#include <sandcell/logger.h>
#include <sandcell/workspace.h>

namespace {

const char kCommandHelp[] =
    "Command: exec <cmd...> | shell | cell [code] | rerun <index> | show | show-cell <index> | "
    "delete <index> | clear | export <path> | import <file> | dataset <name> <level> | sensitivity";

struct Options {
  SessionKey key;
  std::string command;
  std::vector<std::string> args;
  int timeout = 0;
  bool no_run = false;
};

Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "sandcell");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/sandcell.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of sandbox workers");
  parser.add_argument("-u", "--user")
    .default_value(std::string(kDefaultUserId))
    .help("User identifier");
  parser.add_argument("-s", "--session")
    .default_value(std::string(kDefaultSessionId))
    .help("Session identifier");
  parser.add_argument("--sandbox")
    .help("Process sandbox backend: namespace or none");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .default_value(0)
    .help("Timeout in seconds; 0 uses the configured default");
  parser.add_argument("--no-run")
    .default_value(false)
    .implicit_value(true)
    .help("Add the cell without executing it");
  parser.add_argument("command")
    .help(kCommandHelp);
  parser.add_argument("args")
    .remaining()
    .help("Command arguments");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  try {
    if (!ParseConfig(config_file)) {
      spdlog::info("Configuration file {} not found, using defaults", std::string(config_file));
    }
  } catch (const std::invalid_argument& err) {
    spdlog::error("Invalid configuration file {}: {}", std::string(config_file), err.what());
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<std::string>("--sandbox")) {
    auto backend = GetSandboxBackend(val.value());
    if (!backend) {
      spdlog::error("Unknown sandbox backend {}", val.value());
      exit(1);
    }
    kSandboxBackend = *backend;
  }

  Options ret;
  ret.key = {parser.get<std::string>("--user"), parser.get<std::string>("--session")};
  ret.command = parser.get<std::string>("command");
  if (auto args = parser.present<std::vector<std::string>>("args")) ret.args = args.value();
  ret.timeout = parser.get<int>("--timeout");
  ret.no_run = parser["--no-run"] == true;
  return ret;
}

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string ret;
  for (auto& i : args) {
    if (ret.size()) ret += ' ';
    ret += i;
  }
  return ret;
}

const std::string& Arg(const Options& opt, size_t index) {
  if (index >= opt.args.size()) {
    throw std::invalid_argument(fmt::format("'{}' expects at least {} argument(s)",
                                            opt.command, index + 1));
  }
  return opt.args[index];
}

int ArgNumber(const Options& opt, size_t index) {
  const std::string& str = Arg(opt, index);
  size_t pos = 0;
  int ret = std::stoi(str, &pos);
  if (pos != str.size()) throw std::invalid_argument("not a cell index: " + str);
  return ret;
}

// one persistent container for the lifetime of the shell
int RunShell(ContainerManager& containers, const Options& opt) {
  for (std::string line; std::cout << "$ " << std::flush, std::getline(std::cin, line);) {
    if (line.empty()) continue;
    if (line == "exit") break;
    ExecResult res = containers.ExecuteCommand(opt.key, line, opt.timeout * 1'000'000L, true);
    std::cout << res.output;
    if (res.output.size() && res.output.back() != '\n') std::cout << '\n';
    if (res.exit_code) std::cout << "[exit code " << res.exit_code << "]\n";
  }
  containers.CloseSession(opt.key);
  return 0;
}

int Dispatch(Toolbox& tools, NotebookEngine& engine, ContainerManager& containers,
             SensitivityTracker& tracker, const Options& opt) {
  const std::string& cmd = opt.command;
  if (cmd == "exec") {
    std::cout << tools.SandboxExecute(JoinArgs(opt.args), opt.timeout) << std::endl;
  } else if (cmd == "shell") {
    return RunShell(containers, opt);
  } else if (cmd == "cell") {
    std::string code = JoinArgs(opt.args);
    if (code.empty() || code == "-") {
      code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    Cell cell = tools.AddCell(code, !opt.no_run, opt.timeout);
    Notebook nb = engine.Load(opt.key);
    std::cout << cell.Render(nb.Find(cell.id));
    return cell.state == CellState::COMPLETED || cell.state == CellState::IDLE ? 0 : 2;
  } else if (cmd == "rerun") {
    int index = ArgNumber(opt, 0);
    Cell cell = tools.RerunCell(index, opt.timeout);
    std::cout << cell.Render(index);
    return cell.state == CellState::COMPLETED ? 0 : 2;
  } else if (cmd == "show") {
    std::cout << tools.ShowNotebook();
  } else if (cmd == "show-cell") {
    std::cout << tools.ShowCell(ArgNumber(opt, 0));
  } else if (cmd == "delete") {
    std::cout << tools.DeleteCell(ArgNumber(opt, 0)) << std::endl;
  } else if (cmd == "clear") {
    std::cout << tools.ClearNotebook() << std::endl;
  } else if (cmd == "export") {
    std::cout << tools.ExportIpynb(Arg(opt, 0)) << std::endl;
  } else if (cmd == "import") {
    engine.ImportIpynb(opt.key, Arg(opt, 0));
    std::cout << engine.ShowNotebook(opt.key);
  } else if (cmd == "dataset") {
    auto level = GetSensitivity(Arg(opt, 1));
    if (!level) throw std::invalid_argument("unknown sensitivity level: " + Arg(opt, 1));
    tools.RegisterDataset(Arg(opt, 0), *level);
    std::cout << "Sensitivity: " << SensitivityName(tracker.GetSensitivity(opt.key)) << std::endl;
  } else if (cmd == "sensitivity") {
    std::cout << "Sensitivity: " << SensitivityName(tracker.GetSensitivity(opt.key)) << '\n'
              << "Network: " << NetworkModeName(tracker.RequiredNetworkMode(opt.key)) << '\n'
              << "Datasets: " << JoinArgs(tracker.Datasets(opt.key)) << std::endl;
  } else {
    std::cerr << "Unknown command " << cmd << "\n" << kCommandHelp << std::endl;
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Options opt = ParseArgs(argc, argv);
  if (kSandboxBackend == SandboxBackend::NAMESPACE && geteuid() != 0) {
    spdlog::error("The namespace sandbox must be run as root; use --sandbox none for development.");
    return 1;
  }
  try {
    ValidateSessionKey(opt.key);
  } catch (const std::invalid_argument& err) {
    spdlog::error("{}", err.what());
    return 1;
  }

  std::unique_ptr<ProcessSandbox> sandbox = MakeSandbox(kSandboxBackend);
  std::unique_ptr<ContainerRuntime> runtime = MakeDockerRuntime(kDockerSocket, kDockerApiVersion);
  SensitivityTracker tracker;
  ContainerManager containers(*runtime, tracker);
  NotebookEngine engine(*sandbox, tracker);
  Scheduler scheduler(kMaxParallel);
  Toolbox tools(scheduler, tracker, containers, engine);
  ScopedSession session(opt.key);

  try {
    return Dispatch(tools, engine, containers, tracker, opt);
  } catch (const NotebookError& err) {
    spdlog::error("Notebook error ({}): {}", NotebookErrorName(err.Kind()), err.what());
  } catch (const ContainerError& err) {
    spdlog::error("{}: {}", ContainerErrorDesc(err.Kind()), err.what());
  } catch (const SandboxError& err) {
    spdlog::error("Sandbox failure: {}", err.what());
  } catch (const SensitivityError& err) {
    spdlog::error("Failed recording sensitivity: {}", err.what());
  } catch (const WorkspaceError& err) {
    spdlog::error("{}", err.what());
  } catch (const std::logic_error& err) {
    // malformed arguments, including out-of-range cell numbers
    spdlog::error("{}", err.what());
  }
  return 1;
}
