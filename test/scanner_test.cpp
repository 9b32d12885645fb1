#include <sandcell/notebook.h>
#include <sandcell/source_scan.h>

#include <gtest/gtest.h>

namespace {

using Strings = std::vector<std::string>;

} // namespace

TEST(ScannerTest, Imports) {
  auto scan = ScanSource("import os\nfrom math import sqrt, pi\nx = 1\nimport numpy as np; y = 2\n");
  EXPECT_EQ(scan.imports, (Strings{"import os", "from math import sqrt, pi", "import numpy as np"}));
  EXPECT_TRUE(scan.definitions.empty());
}

TEST(ScannerTest, ParenthesizedImport) {
  auto scan = ScanSource("from os.path import (\n    join,\n    dirname,\n)\n");
  EXPECT_EQ(scan.imports, (Strings{"from os.path import (\n    join,\n    dirname,\n)"}));
}

TEST(ScannerTest, NestedImportsIgnored) {
  auto scan = ScanSource("def f():\n    import json\n    return json\nif True:\n    import os\n");
  EXPECT_TRUE(scan.imports.empty());
  EXPECT_EQ(scan.definitions, (Strings{"def f():\n    import json\n    return json"}));
}

TEST(ScannerTest, Definitions) {
  std::string code =
      "@decorator\n"
      "@other(1)\n"
      "def f(x):\n"
      "    # comment\n"
      "\n"
      "    return x\n"
      "\n"
      "class A(Base):\n"
      "    y = 1\n"
      "async def g():\n"
      "    pass\n"
      "z = f(2)\n";
  auto scan = ScanSource(code);
  EXPECT_EQ(scan.definitions, (Strings{
      "@decorator\n@other(1)\ndef f(x):\n    # comment\n\n    return x",
      "class A(Base):\n    y = 1",
      "async def g():\n    pass"}));
}

TEST(ScannerTest, OneLineDefinition) {
  auto scan = ScanSource("def sq(x): return x * x\nprint(sq(3))");
  EXPECT_EQ(scan.definitions, (Strings{"def sq(x): return x * x"}));
}

TEST(ScannerTest, StringsDoNotConfuse) {
  std::string code =
      "s = '''\n"
      "import fake\n"
      "def fake():\n"
      "'''\n"
      "t = \"(\" + ')'  # [\n"
      "u = 'it\\'s'\n"
      "import real\n";
  auto scan = ScanSource(code);
  EXPECT_EQ(scan.imports, (Strings{"import real"}));
  EXPECT_TRUE(scan.definitions.empty());
}

TEST(ScannerTest, LineContinuation) {
  auto scan = ScanSource("from os import \\\n    path\nx = 1");
  EXPECT_EQ(scan.imports, (Strings{"from os import \\\n    path"}));
}

TEST(ScannerTest, IdentifiersStartingWithKeywords) {
  auto scan = ScanSource("imported = 1\nfrom_x = 2\ndefault = 3\nclassic = 4\n");
  EXPECT_TRUE(scan.imports.empty());
  EXPECT_TRUE(scan.definitions.empty());
}

TEST(ScannerTest, EmptyCode) {
  auto scan = ScanSource("");
  EXPECT_TRUE(scan.imports.empty());
  EXPECT_TRUE(scan.definitions.empty());
  EXPECT_NO_THROW(ScanSource("# only a comment\n\n"));
}

class ScannerParseError : public testing::TestWithParam<std::string> {};
TEST_P(ScannerParseError, Rejected) {
  try {
    ScanSource(GetParam());
    FAIL() << "no exception";
  } catch (const NotebookError& e) {
    EXPECT_EQ(e.Kind(), NotebookErrorKind::PARSE_ERROR);
  }
}
INSTANTIATE_TEST_SUITE_P(Unbalanced, ScannerParseError,
    testing::Values(
      "print(1",
      "x = [1, 2)",
      "y = 1)",
      "s = 'abc",
      "s = \"\"\"never closed",
      "def f(:\n    pass\n)]"
    ));
