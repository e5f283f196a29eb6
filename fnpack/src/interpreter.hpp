#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Byte-compiles every .py below root into a sibling .pyc using the given
// interpreter ("<interpreter> -m compileall -b -q -f <root>"). Files with
// syntax errors are skipped by the interpreter; that is reported as a
// warning and false is returned. A missing interpreter throws.
bool compile_tree(const std::filesystem::path& root, const std::string& interpreter);

// Existing directories on the interpreter's sys.path, in search order.
std::vector<std::filesystem::path> interpreter_site_dirs(const std::string& interpreter);
