// sandcell-notebook-exec <repl dir>
// Runs one notebook cell inside the sandbox. Reads input.json (and
// snapshot.bin if named there) from the directory and writes output.json and
// snapshot.out.bin back to it.

#include <cstdio>
#include <algorithm>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <optional>
#include <unordered_map>

#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include <nlohmann/json.hpp>

namespace py = pybind11;
using nlohmann::json;

namespace {

std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

bool WriteFile(const std::string& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  fout << content;
  fout.close();
  return static_cast<bool>(fout);
}

bool IsDunder(const std::string& name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
      name.compare(name.size() - 2, 2, "__") == 0;
}

// type name -> what the value usually is; values of these types never pickle
const std::unordered_map<std::string, std::string> kUnpicklableTypes = {
  {"TextIOWrapper", "file handle"},
  {"BufferedReader", "file handle"},
  {"BufferedWriter", "file handle"},
  {"BufferedRandom", "file handle"},
  {"FileIO", "file handle"},
  {"generator", "generator"},
  {"async_generator", "generator"},
  {"coroutine", "coroutine"},
  {"map", "iterator"},
  {"filter", "iterator"},
  {"zip", "iterator"},
  {"enumerate", "iterator"},
  {"list_iterator", "iterator"},
  {"dict_keyiterator", "iterator"},
  {"Thread", "thread"},
  {"lock", "lock"},
  {"RLock", "lock"},
  {"Connection", "database connection"},
  {"Cursor", "database cursor"},
  {"socket", "socket"},
  {"SSLSocket", "socket"},
};

class CellExecutor {
  const json& input_;
  std::string dir_;
  py::dict ns_;
  py::module_ builtins_, pickle_, ast_, types_, traceback_, io_, sys_;
  json outputs_ = json::array();
  std::vector<std::string> notes_;
  bool completed_ = true;

  void AddOutput(const char* type, const std::string& content, const std::string& mime = "") {
    if (content.empty()) return;
    json item = {{"type", type}, {"content", content}};
    if (!mime.empty()) item["mime"] = mime;
    outputs_.push_back(std::move(item));
  }

  std::string FormatException(const py::error_already_set& e) {
    py::list lines = traceback_.attr("format_exception")(e.type(), e.value(), e.trace());
    return py::str("").attr("join")(lines).cast<std::string>();
  }

  std::string TypeName(py::handle value) {
    return py::type::of(value).attr("__name__").cast<std::string>();
  }

  // runs accumulated imports/definitions; failures are reported, not fatal
  void Replay(const char* what, const json& fragments) {
    for (auto& fragment : fragments) {
      try {
        py::exec(fragment.get<std::string>(), ns_);
      } catch (py::error_already_set& e) {
        notes_.push_back(std::string("Failed to re-run ") + what + ": " + e.what());
      }
    }
  }

  void Restore() {
    std::string name = input_.value("snapshot", "");
    std::vector<std::pair<std::string, py::bytes>> deferred;
    if (!name.empty()) {
      auto data = ReadFile(dir_ + "/" + name);
      if (!data) {
        notes_.push_back("Namespace snapshot is missing; starting with an empty namespace");
      } else {
        try {
          py::dict blobs = pickle_.attr("loads")(py::bytes(*data));
          for (auto item : blobs) {
            std::string key = item.first.cast<std::string>();
            py::bytes blob = py::reinterpret_borrow<py::bytes>(item.second);
            try {
              ns_[key.c_str()] = pickle_.attr("loads")(blob);
            } catch (py::error_already_set&) {
              // may reference a class that is defined by replay
              deferred.emplace_back(key, blob);
            }
          }
        } catch (py::error_already_set& e) {
          notes_.push_back(std::string("Namespace snapshot is unreadable: ") + e.what());
        }
      }
    }
    Replay("import", input_.at("imports"));
    Replay("definition", input_.at("definitions"));
    for (auto& [key, blob] : deferred) {
      try {
        ns_[key.c_str()] = pickle_.attr("loads")(blob);
      } catch (py::error_already_set& e) {
        notes_.push_back("Note: '" + key + "' could not be restored: " + e.what());
      }
    }
    for (auto& drop : input_.at("drop_names")) {
      ns_.attr("pop")(drop.get<std::string>(), py::none());
    }
  }

  // top-level names the code assigns, imports or defines; nested scopes are skipped
  void CollectStores(py::handle node, std::vector<std::string>& names) {
    for (const char* scope : {"FunctionDef", "AsyncFunctionDef", "ClassDef"}) {
      if (py::isinstance(node, ast_.attr(scope))) {
        names.push_back(node.attr("name").cast<std::string>());
        return;
      }
    }
    for (const char* scope : {"Lambda", "ListComp", "SetComp", "DictComp", "GeneratorExp"}) {
      if (py::isinstance(node, ast_.attr(scope))) return;
    }
    if (py::isinstance(node, ast_.attr("Import")) || py::isinstance(node, ast_.attr("ImportFrom"))) {
      for (auto alias : node.attr("names")) {
        if (!alias.attr("asname").is_none()) {
          names.push_back(alias.attr("asname").cast<std::string>());
        } else {
          std::string name = alias.attr("name").cast<std::string>();
          if (name != "*") names.push_back(name.substr(0, name.find('.')));
        }
      }
      return;
    }
    if (py::isinstance(node, ast_.attr("Name")) && py::isinstance(node.attr("ctx"), ast_.attr("Store"))) {
      names.push_back(node.attr("id").cast<std::string>());
      return;
    }
    for (auto child : ast_.attr("iter_child_nodes")(node)) CollectStores(child, names);
  }

  void Display(py::handle value) {
    if (py::hasattr(value, "_repr_html_")) {
      try {
        py::object html = value.attr("_repr_html_")();
        if (!html.is_none()) {
          std::string type_name = TypeName(value);
          bool table = type_name == "DataFrame" || type_name == "Series";
          AddOutput(table ? "TABLE" : "HTML", html.cast<std::string>());
          return;
        }
      } catch (py::error_already_set& e) {
        notes_.push_back(std::string("_repr_html_ failed: ") + e.what());
      }
    }
    AddOutput("TEXT", py::repr(value).cast<std::string>());
  }

  void CaptureFigures() {
    if (!sys_.attr("modules").contains("matplotlib.pyplot")) return;
    try {
      py::module_ plt = py::module_::import("matplotlib.pyplot");
      py::module_ base64 = py::module_::import("base64");
      for (auto num : plt.attr("get_fignums")()) {
        py::object fig = plt.attr("figure")(num);
        py::object buf = io_.attr("BytesIO")();
        fig.attr("savefig")(buf, py::arg("format") = "png", py::arg("bbox_inches") = "tight");
        py::object encoded = base64.attr("b64encode")(buf.attr("getvalue")()).attr("decode")("ascii");
        AddOutput("IMAGE", encoded.cast<std::string>(), "image/png");
      }
      plt.attr("close")("all");
    } catch (py::error_already_set& e) {
      notes_.push_back(std::string("Failed capturing figures: ") + e.what());
    }
  }

  // a message if the value is of a known unpicklable kind
  std::optional<std::string> Hint(const std::string& name, py::handle value) {
    std::string type_name = TypeName(value);
    if (type_name == "function" && value.attr("__name__").cast<std::string>() == "<lambda>") {
      return "Note: '" + name + "' (lambda) is not kept between cells; use 'def " + name +
          "(...)' instead";
    }
    auto it = kUnpicklableTypes.find(type_name);
    if (it == kUnpicklableTypes.end()) return std::nullopt;
    return "Note: '" + name + "' (" + it->second + ") is not kept between cells; recreate it "
        "in the cell that uses it";
  }

  py::dict Snapshot() {
    std::string policy = input_.value("policy", "drop");
    py::dict blobs;
    for (auto item : ns_) {
      std::string name = item.first.cast<std::string>();
      py::handle value = item.second;
      if (IsDunder(name)) continue;
      if (py::isinstance(value, types_.attr("ModuleType")) ||
          py::isinstance(value, types_.attr("BuiltinFunctionType"))) {
        continue;
      }
      // functions and classes are rebuilt from definitions
      bool lambda = py::isinstance(value, types_.attr("FunctionType")) &&
          value.attr("__name__").cast<std::string>() == "<lambda>";
      if (!lambda && (py::isinstance(value, types_.attr("FunctionType")) ||
                      py::isinstance<py::type>(value))) {
        continue;
      }
      std::string error;
      if (lambda) {
        error = "lambdas cannot be pickled";
      } else {
        try {
          py::bytes blob = pickle_.attr("dumps")(value);
          pickle_.attr("loads")(blob);
          blobs[name.c_str()] = blob;
          continue;
        } catch (py::error_already_set& e) {
          error = e.what();
        }
      }
      if (policy == "placeholder") {
        blobs[name.c_str()] = pickle_.attr("dumps")(py::str("<unserializable " + TypeName(value) + ">"));
      } else if (policy == "fail") {
        completed_ = false;
        AddOutput("ERROR", "Cannot keep '" + name + "' (" + TypeName(value) + ") between cells: " + error);
      } else if (auto hint = Hint(name, value)) {
        notes_.push_back(*hint);
      }
    }
    return blobs;
  }

 public:
  CellExecutor(const json& input, const std::string& dir) :
      input_(input), dir_(dir),
      builtins_(py::module_::import("builtins")),
      pickle_(py::module_::import("pickle")),
      ast_(py::module_::import("ast")),
      types_(py::module_::import("types")),
      traceback_(py::module_::import("traceback")),
      io_(py::module_::import("io")),
      sys_(py::module_::import("sys")) {
    // user classes pickle by reference to __main__
    ns_ = py::module_::import("__main__").attr("__dict__");
    py::list argv;
    argv.append("");
    sys_.attr("argv") = argv;
    sys_.attr("path").attr("insert")(0, py::module_::import("os").attr("getcwd")());
  }

  json Run() {
    py::object stdout_buf = io_.attr("StringIO")(), stderr_buf = io_.attr("StringIO")();
    sys_.attr("stdout") = stdout_buf;
    sys_.attr("stderr") = stderr_buf;

    Restore();
    py::dict before = ns_.attr("copy")();

    std::string error_text;
    py::object result = py::none();
    std::vector<std::string> stored;
    try {
      py::object tree = ast_.attr("parse")(input_.at("code").get<std::string>(), "<cell>", "exec");
      CollectStores(tree, stored);
      py::list body = tree.attr("body");
      py::object last = py::none();
      if (py::len(body) > 0 && py::isinstance(body[py::len(body) - 1], ast_.attr("Expr"))) {
        last = body.attr("pop")();
      }
      py::object module = ast_.attr("Module")(body, py::list());
      builtins_.attr("exec")(builtins_.attr("compile")(module, "<cell>", "exec"), ns_);
      if (!last.is_none()) {
        py::object expression = ast_.attr("Expression")(last.attr("value"));
        result = builtins_.attr("eval")(builtins_.attr("compile")(expression, "<cell>", "eval"), ns_);
      }
    } catch (py::error_already_set& e) {
      completed_ = false;
      error_text = FormatException(e);
    }

    sys_.attr("stdout") = sys_.attr("__stdout__");
    sys_.attr("stderr") = sys_.attr("__stderr__");
    AddOutput("TEXT", stdout_buf.attr("getvalue")().cast<std::string>());
    AddOutput("ERROR", stderr_buf.attr("getvalue")().cast<std::string>());
    if (!result.is_none()) Display(result);
    CaptureFigures();
    AddOutput("ERROR", error_text);

    // rebinding a name to the same object (small ints, None) only shows in the source
    std::vector<std::string> bound_names;
    for (auto item : ns_) {
      std::string name = item.first.cast<std::string>();
      if (IsDunder(name)) continue;
      bool assigned = std::find(stored.begin(), stored.end(), name) != stored.end();
      if (assigned || !before.contains(item.first) || !before[item.first].is(item.second)) {
        bound_names.push_back(name);
      }
    }

    py::dict blobs = Snapshot();
    py::bytes data = pickle_.attr("dumps")(blobs);
    if (!WriteFile(dir_ + "/snapshot.out.bin", static_cast<std::string>(data))) {
      completed_ = false;
      notes_.push_back("Failed writing namespace snapshot");
    }
    std::string notes;
    for (auto& i : notes_) notes += i + "\n";
    AddOutput("TEXT", notes);

    return {
      {"state", completed_ ? "COMPLETED" : "ERROR"},
      {"outputs", outputs_},
      {"bound_names", bound_names},
    };
  }
};

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    fprintf(stderr, "Usage: %s <repl dir>\n", argv[0]);
    return 2;
  }
  std::string dir = argv[1];
  auto content = ReadFile(dir + "/input.json");
  if (!content) {
    fprintf(stderr, "Cannot read %s/input.json\n", dir.c_str());
    return 2;
  }
  json input = json::parse(*content, nullptr, false);
  if (input.is_discarded()) {
    fprintf(stderr, "Malformed cell input\n");
    return 2;
  }

  py::scoped_interpreter guard{};
  json output;
  try {
    CellExecutor executor(input, dir);
    output = executor.Run();
  } catch (py::error_already_set& e) {
    fprintf(stderr, "Executor failure: %s\n", e.what());
    return 3;
  } catch (json::exception& e) {
    fprintf(stderr, "Malformed cell input: %s\n", e.what());
    return 2;
  }
  if (!WriteFile(dir + "/output.json", output.dump(-1, ' ', false, json::error_handler_t::replace))) {
    fprintf(stderr, "Cannot write %s/output.json\n", dir.c_str());
    return 3;
  }
  return 0;
}
