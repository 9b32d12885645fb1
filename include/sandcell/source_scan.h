#ifndef INCLUDE_SANDCELL_SOURCE_SCAN_H_
#define INCLUDE_SANDCELL_SOURCE_SCAN_H_

#include <string>
#include <vector>

// Top-level structure of a Python cell, found without running an interpreter
struct SourceScan {
  std::vector<std::string> imports; // "import x" / "from x import y" statements
  std::vector<std::string> definitions; // def / async def / class blocks with decorators
};

// Throws NotebookError(PARSE_ERROR) on unbalanced brackets or unterminated strings
SourceScan ScanSource(const std::string& code);

#endif  // INCLUDE_SANDCELL_SOURCE_SCAN_H_
