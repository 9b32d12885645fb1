#include <fstream>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <sandcell/notebook.h>
#include <sandcell/workspace.h>

#include "utils.h"

namespace {

std::string AllText(const Cell& cell) {
  std::string ret;
  for (auto& i : cell.outputs) ret += i.content;
  return ret;
}

bool HasOutput(const Cell& cell, OutputType type, const std::string& needle) {
  for (auto& i : cell.outputs) {
    if (i.type == type && i.content.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

class NotebookTest : public ScratchTest {
 protected:
  PlainSandbox sandbox;
  SensitivityTracker tracker;
  std::unique_ptr<NotebookEngine> engine;
  SessionKey key{"alice", "nb"};
  SnapshotPolicy policy_;
  int max_cells_;

  void SetUp() override {
    ScratchTest::SetUp();
    policy_ = kSnapshotPolicy;
    max_cells_ = kMaxCells;
    engine = std::make_unique<NotebookEngine>(sandbox, tracker);
  }
  void TearDown() override {
    kSnapshotPolicy = policy_;
    kMaxCells = max_cells_;
    ScratchTest::TearDown();
  }

  Cell Add(const std::string& code, long timeout = 0) {
    return engine->AddCell(key, code, true, timeout);
  }
};

TEST_F(NotebookTest, StateCarriesAcrossCells) {
  EXPECT_EQ(Add("x = 1").state, CellState::COMPLETED);
  EXPECT_EQ(Add("y = x + 1").state, CellState::COMPLETED);
  Cell cell = Add("print(y)");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  ASSERT_EQ(cell.outputs.size(), 1u);
  EXPECT_EQ(cell.outputs[0].type, OutputType::TEXT);
  EXPECT_EQ(cell.outputs[0].content, "2\n");
  EXPECT_EQ(cell.execution_count, 3);
}

TEST_F(NotebookTest, TrailingExpressionDisplayed) {
  Cell cell = Add("a = [1, 2]\na + [3]");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_TRUE(HasOutput(cell, OutputType::TEXT, "[1, 2, 3]"));
  EXPECT_EQ(cell.bound_names, std::vector<std::string>{"a"});
}

TEST_F(NotebookTest, ExceptionRecordedInCell) {
  Cell cell = Add("1 / 0");
  EXPECT_EQ(cell.state, CellState::ERROR);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "ZeroDivisionError"));
}

TEST_F(NotebookTest, StderrIsErrorOutput) {
  Cell cell = Add("import sys\nprint('warn', file=sys.stderr)");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "warn"));
}

TEST_F(NotebookTest, ImportsAndDefinitionsReplayed) {
  Add("import math\ndef square(v):\n    return v * v\nclass Point:\n    def __init__(self, x):\n"
      "        self.x = x");
  Add("p = Point(3)");
  Cell cell = Add("print(math.sqrt(square(p.x) + 7))");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_EQ(AllText(cell), "4.0\n");
  Notebook nb = engine->Load(key);
  EXPECT_EQ(nb.imports.size(), 1u);
  EXPECT_EQ(nb.definitions.size(), 2u);
}

TEST_F(NotebookTest, DeletedCellNamesDropped) {
  Add("x = 5");
  Add("print(x)");
  engine->DeleteCell(key, "0");
  EXPECT_EQ(engine->Load(key).pending_drops, std::vector<std::string>{"x"});
  Cell cell = engine->RerunCell(key, "0");
  EXPECT_EQ(cell.state, CellState::ERROR);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "NameError"));
  EXPECT_TRUE(engine->Load(key).pending_drops.empty());
}

TEST_F(NotebookTest, DeletedDefinitionNotReplayed) {
  Add("def helper():\n    return 1");
  engine->DeleteCell(key, "0");
  EXPECT_TRUE(engine->Load(key).definitions.empty());
  Cell cell = Add("helper()");
  EXPECT_EQ(cell.state, CellState::ERROR);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "NameError"));
}

TEST_F(NotebookTest, NameBoundElsewhereSurvivesDelete) {
  Add("x = 1");
  Add("x = 2");
  engine->DeleteCell(key, "0");
  EXPECT_TRUE(engine->Load(key).pending_drops.empty());
  EXPECT_EQ(AllText(Add("print(x)")), "2\n");
}

TEST_F(NotebookTest, RebindToSameObjectSurvivesDelete) {
  Add("x = 1\nflag = None");
  std::vector<std::string> names = Add("x = 1\nflag = None").bound_names;
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"flag", "x"}));
  Add("print(x, flag)");
  engine->DeleteCell(key, "0");
  EXPECT_TRUE(engine->Load(key).pending_drops.empty());
  Cell cell = engine->RerunCell(key, "1");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_EQ(AllText(cell), "1 None\n");
}

TEST_F(NotebookTest, BoundNamesFromSource) {
  Cell cell = Add("import os.path\nfrom json import dumps as d\n"
                  "a, (b, *c) = 1, (2, 3)\nfor i in range(2):\n    pass\n"
                  "def f():\n    inner = 1\nsq = [k * k for k in range(3)]");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  std::vector<std::string> names = cell.bound_names;
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"a", "b", "c", "d", "f", "i", "os", "sq"}));
}

TEST_F(NotebookTest, FailedCellDefinitionsRolledBack) {
  Cell cell = Add("def g():\n    return 1\nraise ValueError('boom')");
  EXPECT_EQ(cell.state, CellState::ERROR);
  EXPECT_TRUE(engine->Load(key).definitions.empty());
}

TEST_F(NotebookTest, LambdaDroppedWithNote) {
  Cell cell = Add("f = lambda v: v");
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_TRUE(HasOutput(cell, OutputType::TEXT, "lambda"));
  EXPECT_EQ(Add("f(1)").state, CellState::ERROR);
}

TEST_F(NotebookTest, UnserializablePlaceholder) {
  kSnapshotPolicy = SnapshotPolicy::PLACEHOLDER;
  Add("g = (i for i in range(3))");
  EXPECT_EQ(AllText(Add("print(g)")), "<unserializable generator>\n");
}

TEST_F(NotebookTest, UnserializableFails) {
  kSnapshotPolicy = SnapshotPolicy::FAIL;
  Cell cell = Add("g = (i for i in range(3))");
  EXPECT_EQ(cell.state, CellState::ERROR);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "'g'"));
}

TEST_F(NotebookTest, Timeout) {
  Add("x = 7");
  Cell cell = Add("import time\ntime.sleep(30)", 1'000'000);
  EXPECT_EQ(cell.state, CellState::TIMEOUT);
  EXPECT_TRUE(HasOutput(cell, OutputType::ERROR, "Cell execution timed out after 1 seconds"));
  EXPECT_TRUE(engine->Load(key).imports.empty());
  EXPECT_EQ(AllText(Add("print(x)")), "7\n");
}

TEST_F(NotebookTest, FilesLandInWorkspace) {
  Add("with open('out.txt', 'w') as f:\n    f.write('hello')");
  std::ifstream fin(SessionWorkspacePath(key) / "out.txt");
  std::string content;
  std::getline(fin, content);
  EXPECT_EQ(content, "hello");
}

TEST_F(NotebookTest, ParseErrorLeavesNotebookUnchanged) {
  Add("x = 1");
  try {
    Add("print(");
    FAIL() << "no exception";
  } catch (const NotebookError& e) {
    EXPECT_EQ(e.Kind(), NotebookErrorKind::PARSE_ERROR);
  }
  Notebook nb = engine->Load(key);
  EXPECT_EQ(nb.cells.size(), 1u);
  EXPECT_EQ(nb.execution_count, 1);
}

TEST_F(NotebookTest, CellLimit) {
  kMaxCells = 2;
  engine->AddCell(key, "1", false);
  engine->AddCell(key, "2", false);
  try {
    engine->AddCell(key, "3", false);
    FAIL() << "no exception";
  } catch (const NotebookError& e) {
    EXPECT_EQ(e.Kind(), NotebookErrorKind::CELL_LIMIT);
  }
}

TEST_F(NotebookTest, AddWithoutExecuting) {
  Cell cell = engine->AddCell(key, "z = 3", false);
  EXPECT_EQ(cell.state, CellState::IDLE);
  EXPECT_EQ(cell.execution_count, 0);
  cell = engine->ExecuteCell(key, cell.id);
  EXPECT_EQ(cell.state, CellState::COMPLETED);
  EXPECT_EQ(cell.execution_count, 1);
}

TEST_F(NotebookTest, InsertAtPosition) {
  engine->AddCell(key, "a = 1", false);
  engine->AddCell(key, "c = 3", false);
  engine->AddCell(key, "b = 2", false, 0, 1);
  Notebook nb = engine->Load(key);
  ASSERT_EQ(nb.cells.size(), 3u);
  EXPECT_EQ(nb.cells[1].code, "b = 2");
}

TEST_F(NotebookTest, MissingCell) {
  Add("x = 1");
  for (std::string ref : {"1", "2", "abc", "-1"}) {
    try {
      engine->ExecuteCell(key, ref);
      FAIL() << "no exception for " << ref;
    } catch (const NotebookError& e) {
      EXPECT_EQ(e.Kind(), NotebookErrorKind::CELL_NOT_FOUND);
    }
  }
  EXPECT_THROW(engine->DeleteCell(key, "5"), NotebookError);
  EXPECT_THROW(engine->ShowCell(key, "5"), NotebookError);
}

TEST_F(NotebookTest, ClearResetsNamespace) {
  Add("import os\nx = 1");
  engine->ClearNotebook(key);
  Notebook nb = engine->Load(key);
  EXPECT_TRUE(nb.cells.empty());
  EXPECT_TRUE(nb.imports.empty());
  EXPECT_EQ(nb.execution_count, 0);
  EXPECT_FALSE(fs::exists(NotebookSnapshotFile(key)));
  EXPECT_EQ(Add("x").state, CellState::ERROR);
}

TEST_F(NotebookTest, PersistsAcrossEngines) {
  Add("x = 41");
  NotebookEngine other(sandbox, tracker);
  EXPECT_EQ(other.Load(key).cells.size(), 1u);
  Cell cell = other.AddCell(key, "x + 1");
  EXPECT_EQ(AllText(cell), "42");
}

TEST_F(NotebookTest, Show) {
  EXPECT_EQ(engine->ShowNotebook(key), "Notebook is empty.\n");
  Add("print('hi')");
  std::string text = engine->ShowNotebook(key);
  EXPECT_NE(text.find("print('hi')"), std::string::npos);
  EXPECT_NE(text.find("COMPLETED"), std::string::npos);
  EXPECT_NE(text.find("--- Cell 0 [1] COMPLETED"), std::string::npos);
  EXPECT_NE(engine->ShowCell(key, "0").find("hi\n"), std::string::npos);
}

TEST_F(NotebookTest, SessionsAreIsolated) {
  Add("secret = 1");
  SessionKey other{"alice", "other"};
  Cell cell = engine->AddCell(other, "secret");
  EXPECT_EQ(cell.state, CellState::ERROR);
}

TEST_F(NotebookTest, ExportEmpty) {
  try {
    engine->ExportIpynb(key, SandboxToHostPath(key, "/workspace/nb.ipynb"));
    FAIL() << "no exception";
  } catch (const NotebookError& e) {
    EXPECT_EQ(e.Kind(), NotebookErrorKind::EMPTY_NOTEBOOK);
  }
}

TEST_F(NotebookTest, ExportAndImport) {
  Add("x = 3\nprint(x)");
  Add("x / 0");
  engine->AddCell(key, "y = 1", false);
  fs::path path = engine->ExportIpynb(key, SandboxToHostPath(key, "/workspace/out/nb.ipynb"));
  ASSERT_TRUE(fs::exists(path));

  std::ifstream fin(path);
  auto doc = nlohmann::json::parse(fin);
  EXPECT_EQ(doc["nbformat"], 4);
  EXPECT_EQ(doc["nbformat_minor"], 5);
  ASSERT_EQ(doc["cells"].size(), 3u);
  EXPECT_EQ(doc["cells"][0]["outputs"][0]["output_type"], "stream");
  EXPECT_EQ(doc["cells"][1]["outputs"][0]["output_type"], "error");
  EXPECT_EQ(doc["cells"][1]["outputs"][0]["ename"], "ZeroDivisionError");
  EXPECT_TRUE(doc["cells"][2]["execution_count"].is_null());

  SessionKey other{"bob", "copy"};
  engine->ImportIpynb(other, path);
  Notebook orig = engine->Load(key), copy = engine->Load(other);
  ASSERT_EQ(copy.cells.size(), orig.cells.size());
  for (size_t i = 0; i < orig.cells.size(); i++) {
    EXPECT_EQ(copy.cells[i].code, orig.cells[i].code);
    EXPECT_EQ(copy.cells[i].state, orig.cells[i].state);
    EXPECT_EQ(AllText(copy.cells[i]), AllText(orig.cells[i]));
  }
  // nothing ran in the new session yet
  EXPECT_EQ(engine->RerunCell(other, "1").state, CellState::ERROR);
  EXPECT_EQ(AllText(engine->RerunCell(other, "0")), "3\n");
}

TEST(IpynbTest, ForeignNotebook) {
  auto doc = nlohmann::json::parse(R"({
    "nbformat": 4, "nbformat_minor": 4, "metadata": {},
    "cells": [
      {"cell_type": "markdown", "metadata": {}, "source": ["# Title\n"]},
      {"cell_type": "code", "execution_count": 2, "metadata": {}, "source": ["import pandas as pd\n", "df"],
       "outputs": [
         {"output_type": "stream", "name": "stdout", "text": ["a\n", "b\n"]},
         {"output_type": "execute_result", "execution_count": 2, "metadata": {},
          "data": {"text/plain": ["   x\n", "0  1"], "text/html": "<table></table>"}},
         {"output_type": "display_data", "metadata": {},
          "data": {"image/png": "iVBORw0KGgo=\n", "text/plain": "<Figure>"}}
       ]},
      {"cell_type": "code", "execution_count": null, "metadata": {}, "source": "x = 1", "outputs": []}
    ]
  })");
  Notebook nb = Notebook::FromIpynb(doc);
  ASSERT_EQ(nb.cells.size(), 2u);
  EXPECT_EQ(nb.execution_count, 2);
  const Cell& first = nb.cells[0];
  EXPECT_EQ(first.code, "import pandas as pd\ndf");
  EXPECT_EQ(first.state, CellState::COMPLETED);
  ASSERT_EQ(first.outputs.size(), 3u);
  EXPECT_EQ(first.outputs[0].type, OutputType::TEXT);
  EXPECT_EQ(first.outputs[0].content, "a\nb\n");
  EXPECT_EQ(first.outputs[1].type, OutputType::HTML);
  EXPECT_EQ(first.outputs[2].type, OutputType::IMAGE);
  EXPECT_EQ(first.outputs[2].mime, "image/png");
  EXPECT_EQ(first.outputs[2].content, "iVBORw0KGgo=");
  EXPECT_EQ(nb.cells[1].state, CellState::IDLE);
  EXPECT_NE(nb.cells[0].id, nb.cells[1].id);
}

TEST(IpynbTest, Rejected) {
  auto Kind = [](const std::string& text) {
    try {
      Notebook::FromIpynb(nlohmann::json::parse(text));
    } catch (const NotebookError& e) {
      return e.Kind();
    }
    return NotebookErrorKind::PERSISTENCE;
  };
  EXPECT_EQ(Kind(R"({"nbformat": 3, "cells": []})"), NotebookErrorKind::INVALID_DOCUMENT);
  EXPECT_EQ(Kind(R"({"nbformat": 4})"), NotebookErrorKind::INVALID_DOCUMENT);
  EXPECT_EQ(Kind(R"({"nbformat": 4, "cells": [{"cell_type": "markdown", "source": ""}]})"),
            NotebookErrorKind::EMPTY_NOTEBOOK);
}

namespace {

// records every request and runs it on the host
class RecordingSandbox : public PlainSandbox {
 public:
  std::vector<SandboxRequest> requests;
  SandboxResult Run(const SandboxRequest& req) override {
    requests.push_back(req);
    return PlainSandbox::Run(req);
  }
};

} // namespace

TEST_F(NotebookTest, EscalationIsolatesNextCell) {
  RecordingSandbox recorder;
  NotebookEngine recorded(recorder, tracker);
  recorded.AddCell(key, "x = 1");
  ASSERT_EQ(recorder.requests.size(), 1u);
  EXPECT_FALSE(recorder.requests[0].isolate_network);
  EXPECT_TRUE(recorder.requests[0].isolate_pid);

  tracker.AddDataset(key, "salaries", Sensitivity::CONFIDENTIAL);
  Cell cell = recorded.AddCell(key, "print(x)");
  ASSERT_EQ(recorder.requests.size(), 2u);
  EXPECT_TRUE(recorder.requests[1].isolate_network);
  EXPECT_EQ(AllText(cell), "1\n");
}
