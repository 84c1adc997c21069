#ifndef SECURITY_PYTHON_SCANNER_HPP
#define SECURITY_PYTHON_SCANNER_HPP

#include <string>
#include <vector>

namespace security {

// Structural information extracted from a Python source. Line numbers are
// 1-based.
struct PythonScan {
  struct Import {
    // Full dotted module name, e.g. "os.path".
    std::string module;
    int line = 0;
  };
  struct Call {
    // Dotted name of the called object, e.g. "eval" or "pickle.loads".
    std::string name;
    int line = 0;
  };
  struct Function {
    std::string name;
    int line = 0;
    // Whether the body (nested blocks included) calls the function by name.
    bool calls_itself = false;
    // Whether the body contains if/elif/while/for/try or a conditional
    // expression.
    bool has_branch = false;
  };
  std::vector<Import> imports;
  std::vector<Call> calls;
  std::vector<Function> functions;
};

// Tokenizes the source, skipping strings and comments, and walks its
// indentation-based block structure. Returns false and sets error if the
// source cannot be tokenized (unterminated strings, unbalanced brackets or
// inconsistent dedents). This is not a full Python parser: syntax errors that
// do not break the token structure are not detected.
bool ScanPython(const std::string& source, PythonScan* scan,
                std::string* error);

}  // namespace security

#endif
