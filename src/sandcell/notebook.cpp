#include <sandcell/notebook.h>

#include <algorithm>

#include <fmt/format.h>
#include <sandcell/utils.h>
#include "utils.h"

int kMaxCells = 1000;
long kCellTimeout = 30'000'000;
std::string kPythonPrefix;
SnapshotPolicy kSnapshotPolicy = SnapshotPolicy::DROP;

NotebookError::NotebookError(NotebookErrorKind kind, const std::string& msg) :
    std::runtime_error(msg), kind_(kind) {}

namespace {

using nlohmann::json;

// nbformat multiline strings: a list of lines, each keeping its '\n'
json SplitLines(const std::string& str) {
  json ret = json::array();
  size_t begin = 0;
  while (begin < str.size()) {
    size_t end = str.find('\n', begin);
    end = end == std::string::npos ? str.size() : end + 1;
    ret.push_back(str.substr(begin, end - begin));
    begin = end;
  }
  return ret;
}

std::string JoinLines(const json& val) {
  if (val.is_string()) return val.get<std::string>();
  std::string ret;
  for (auto& i : val) ret += i.get<std::string>();
  return ret;
}

std::string Indent(const std::string& str, const char* prefix) {
  std::string ret;
  size_t begin = 0;
  while (begin < str.size()) {
    size_t end = str.find('\n', begin);
    if (end == std::string::npos) end = str.size();
    ret += prefix;
    ret.append(str, begin, end - begin);
    ret += '\n';
    begin = end + 1;
  }
  return ret;
}

json OutputToJson(const CellOutput& output) {
  json ret = {
    {"type", OutputTypeName(output.type)},
    {"content", output.content},
    {"timestamp", output.timestamp},
  };
  if (!output.mime.empty()) ret["mime"] = output.mime;
  return ret;
}

CellOutput OutputFromJson(const json& obj) {
  CellOutput ret;
  auto type = GetOutputType(obj.at("type").get<std::string>());
  if (!type) throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, "unknown output type");
  ret.type = *type;
  ret.content = obj.at("content").get<std::string>();
  ret.mime = obj.value("mime", "");
  ret.timestamp = obj.value("timestamp", (int64_t)0);
  return ret;
}

json FragmentsToJson(const std::vector<SourceFragment>& list) {
  json ret = json::array();
  for (auto& i : list) ret.push_back({{"code", i.code}, {"cell_id", i.cell_id}});
  return ret;
}

std::vector<SourceFragment> FragmentsFromJson(const json& arr) {
  std::vector<SourceFragment> ret;
  for (auto& i : arr) {
    ret.push_back({i.at("code").get<std::string>(), i.at("cell_id").get<std::string>()});
  }
  return ret;
}

json IpynbOutput(const CellOutput& output) {
  switch (output.type) {
    case OutputType::TEXT:
      return {{"output_type", "stream"}, {"name", "stdout"}, {"text", SplitLines(output.content)}};
    case OutputType::ERROR: {
      json traceback = json::array();
      size_t begin = 0;
      while (true) {
        size_t end = output.content.find('\n', begin);
        traceback.push_back(output.content.substr(begin, end - begin));
        if (end == std::string::npos) break;
        begin = end + 1;
      }
      // "NameError: name 'x' is not defined" on the last non-empty line
      std::string last;
      for (auto& i : traceback) {
        if (!i.get<std::string>().empty()) last = i.get<std::string>();
      }
      size_t colon = last.find(':');
      std::string ename = "Error", evalue = last;
      if (colon != std::string::npos && colon > 0 && last.find(' ') > colon) {
        ename = last.substr(0, colon);
        evalue = last.substr(std::min(colon + 2, last.size()));
      }
      return {{"output_type", "error"}, {"ename", ename}, {"evalue", evalue},
              {"traceback", traceback}};
    }
    case OutputType::HTML:
    case OutputType::TABLE:
      return {
        {"output_type", "display_data"},
        {"data", {{"text/html", SplitLines(output.content)}}},
        {"metadata", {{"sandcell", {{"type", OutputTypeName(output.type)}}}}},
      };
    case OutputType::IMAGE:
      return {
        {"output_type", "display_data"},
        {"data", {{output.mime.empty() ? "image/png" : output.mime, output.content}}},
        {"metadata", json::object()},
      };
  }
  __builtin_unreachable();
}

std::optional<CellOutput> OutputFromIpynb(const json& obj) {
  CellOutput ret{OutputType::TEXT, "", "", 0};
  std::string output_type = obj.at("output_type").get<std::string>();
  if (output_type == "stream") {
    ret.type = obj.value("name", "stdout") == "stderr" ? OutputType::ERROR : OutputType::TEXT;
    ret.content = JoinLines(obj.at("text"));
    return ret;
  }
  if (output_type == "error") {
    ret.type = OutputType::ERROR;
    if (obj.contains("traceback") && !obj["traceback"].empty()) {
      std::vector<std::string> lines = obj["traceback"].get<std::vector<std::string>>();
      for (size_t i = 0; i < lines.size(); i++) ret.content += (i ? "\n" : "") + lines[i];
    } else {
      ret.content = obj.value("ename", "Error") + ": " + obj.value("evalue", "");
    }
    return ret;
  }
  if (output_type != "display_data" && output_type != "execute_result") return std::nullopt;
  const json& data = obj.at("data");
  for (auto& [mime, val] : data.items()) {
    if (mime.compare(0, 6, "image/") == 0 && mime != "image/svg+xml") {
      ret.type = OutputType::IMAGE;
      ret.mime = mime;
      ret.content = JoinLines(val);
      // base64 line breaks are not part of the payload
      ret.content.erase(std::remove(ret.content.begin(), ret.content.end(), '\n'), ret.content.end());
      return ret;
    }
  }
  if (data.contains("text/html")) {
    std::string type;
    if (obj.contains("metadata") && obj["metadata"].contains("sandcell")) {
      type = obj["metadata"]["sandcell"].value("type", "");
    }
    ret.type = type == "TABLE" ? OutputType::TABLE : OutputType::HTML;
    ret.content = JoinLines(data["text/html"]);
    return ret;
  }
  if (data.contains("text/plain")) {
    ret.content = JoinLines(data["text/plain"]);
    return ret;
  }
  return std::nullopt;
}

} // namespace

nlohmann::json Cell::ToJson() const {
  json outputs_json = json::array();
  for (auto& i : outputs) outputs_json.push_back(OutputToJson(i));
  return {
    {"id", id},
    {"code", code},
    {"state", CellStateName(state)},
    {"outputs", outputs_json},
    {"execution_count", execution_count},
    {"created_at", created_at},
    {"executed_at", executed_at},
    {"execution_time", execution_time},
    {"bound_names", bound_names},
  };
}

Cell Cell::FromJson(const nlohmann::json& obj) {
  Cell ret;
  ret.id = obj.at("id").get<std::string>();
  ret.code = obj.at("code").get<std::string>();
  auto state = GetCellState(obj.at("state").get<std::string>());
  if (!state) throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, "unknown cell state");
  // a cell cannot still be running after a restart
  ret.state = *state == CellState::RUNNING ? CellState::ERROR : *state;
  for (auto& i : obj.at("outputs")) ret.outputs.push_back(OutputFromJson(i));
  ret.execution_count = obj.value("execution_count", 0);
  ret.created_at = obj.value("created_at", (int64_t)0);
  ret.executed_at = obj.value("executed_at", (int64_t)0);
  ret.execution_time = obj.value("execution_time", (int64_t)0);
  ret.bound_names = obj.value("bound_names", std::vector<std::string>());
  return ret;
}

std::string Cell::Render(int index) const {
  std::string ret = fmt::format("--- Cell {} [{}] {}", index,
      execution_count ? std::to_string(execution_count) : std::string(" "), CellStateName(state));
  if (execution_count) ret += fmt::format(" ({:.3f}s)", execution_time / 1e6);
  ret += " ---\n";
  ret += Indent(code, "    ");
  for (auto& output : outputs) {
    switch (output.type) {
      case OutputType::TEXT: ret += Indent(output.content, ""); break;
      case OutputType::ERROR: ret += Indent(output.content, "! "); break;
      case OutputType::HTML:
      case OutputType::TABLE:
        ret += fmt::format("[{}, {} bytes]\n", OutputTypeName(output.type), output.content.size());
        break;
      case OutputType::IMAGE:
        ret += fmt::format("[{}, {} bytes base64]\n",
                           output.mime.empty() ? "image" : output.mime, output.content.size());
        break;
    }
  }
  return ret;
}

size_t Notebook::Find(const std::string& ref) const {
  for (size_t i = 0; i < cells.size(); i++) {
    if (cells[i].id == ref) return i;
  }
  if (!ref.empty() && ref.size() < 10 &&
      std::all_of(ref.begin(), ref.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    size_t number = std::stoul(ref);
    if (number < cells.size()) return number;
  }
  throw NotebookError(NotebookErrorKind::CELL_NOT_FOUND, "Cell " + ref + " not found");
}

nlohmann::json Notebook::ToJson() const {
  json cells_json = json::array();
  for (auto& i : cells) cells_json.push_back(i.ToJson());
  return {
    {"user_id", key.user_id},
    {"session_id", key.session_id},
    {"execution_count", execution_count},
    {"created_at", created_at},
    {"updated_at", updated_at},
    {"cells", cells_json},
    {"imports", FragmentsToJson(imports)},
    {"definitions", FragmentsToJson(definitions)},
    {"namespace_snapshot", namespace_snapshot},
    {"pending_drops", pending_drops},
  };
}

Notebook Notebook::FromJson(const nlohmann::json& obj) {
  try {
    Notebook ret;
    ret.key = {obj.at("user_id").get<std::string>(), obj.at("session_id").get<std::string>()};
    ret.execution_count = obj.value("execution_count", 0);
    ret.created_at = obj.value("created_at", (int64_t)0);
    ret.updated_at = obj.value("updated_at", (int64_t)0);
    for (auto& i : obj.at("cells")) ret.cells.push_back(Cell::FromJson(i));
    ret.imports = FragmentsFromJson(obj.value("imports", json::array()));
    ret.definitions = FragmentsFromJson(obj.value("definitions", json::array()));
    ret.namespace_snapshot = obj.value("namespace_snapshot", "");
    ret.pending_drops = obj.value("pending_drops", std::vector<std::string>());
    return ret;
  } catch (const json::exception& e) {
    throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, e.what());
  }
}

nlohmann::json Notebook::ToIpynb() const {
  json cells_json = json::array();
  for (auto& cell : cells) {
    json outputs = json::array();
    for (auto& i : cell.outputs) outputs.push_back(IpynbOutput(i));
    cells_json.push_back({
      {"cell_type", "code"},
      {"id", cell.id},
      {"execution_count", cell.execution_count ? json(cell.execution_count) : json(nullptr)},
      {"metadata", {{"sandcell", {
        {"state", CellStateName(cell.state)},
        {"created_at", cell.created_at},
        {"executed_at", cell.executed_at},
        {"execution_time", cell.execution_time},
      }}}},
      {"source", SplitLines(cell.code)},
      {"outputs", outputs},
    });
  }
  return {
    {"cells", cells_json},
    {"metadata", {
      {"kernelspec", {{"display_name", "Python 3"}, {"language", "python"}, {"name", "python3"}}},
      {"language_info", {{"name", "python"}}},
      {"sandcell", {{"user_id", key.user_id}, {"session_id", key.session_id},
                    {"exported_at", NowMicros()}}},
    }},
    {"nbformat", 4},
    {"nbformat_minor", 5},
  };
}

Notebook Notebook::FromIpynb(const nlohmann::json& obj) {
  try {
    if (obj.at("nbformat").get<int>() != 4) {
      throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, "only nbformat 4 is supported");
    }
    Notebook ret;
    int64_t now = NowMicros();
    ret.created_at = ret.updated_at = now;
    for (auto& item : obj.at("cells")) {
      if (item.at("cell_type").get<std::string>() != "code") continue;
      Cell cell;
      std::string id = item.value("id", "");
      bool duplicated = std::any_of(ret.cells.begin(), ret.cells.end(),
                                    [&](const Cell& x) { return x.id == id; });
      cell.id = !id.empty() && id.size() <= 64 && !duplicated ? id : RandomHex(12);
      cell.code = JoinLines(item.at("source"));
      cell.created_at = now;
      if (item.contains("execution_count") && item["execution_count"].is_number_integer()) {
        cell.execution_count = item["execution_count"].get<int>();
      }
      for (auto& i : item.value("outputs", json::array())) {
        if (auto output = OutputFromIpynb(i)) {
          output->timestamp = now;
          cell.outputs.push_back(std::move(*output));
        }
      }
      cell.state = cell.execution_count ? CellState::COMPLETED : CellState::IDLE;
      if (item.contains("metadata") && item["metadata"].contains("sandcell")) {
        const json& meta = item["metadata"]["sandcell"];
        if (auto state = GetCellState(meta.value("state", ""))) {
          cell.state = *state == CellState::RUNNING ? CellState::IDLE : *state;
        }
        cell.created_at = meta.value("created_at", now);
        cell.executed_at = meta.value("executed_at", (int64_t)0);
        cell.execution_time = meta.value("execution_time", (int64_t)0);
      }
      ret.execution_count = std::max(ret.execution_count, cell.execution_count);
      ret.cells.push_back(std::move(cell));
    }
    if (ret.cells.empty()) {
      throw NotebookError(NotebookErrorKind::EMPTY_NOTEBOOK, "no code cells to import");
    }
    return ret;
  } catch (const json::exception& e) {
    throw NotebookError(NotebookErrorKind::INVALID_DOCUMENT, e.what());
  }
}

std::string Notebook::Render() const {
  if (cells.empty()) return "Notebook is empty.\n";
  std::string ret = fmt::format("Notebook {}: {} cell(s), {} execution(s)\n",
                                key.ToString(), cells.size(), execution_count);
  for (size_t i = 0; i < cells.size(); i++) {
    ret += '\n';
    ret += cells[i].Render(i);
  }
  return ret;
}
