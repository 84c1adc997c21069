#include "security/python_scanner.hpp"

#include <cctype>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

namespace {

enum class TokenType { NAME, NUMBER, STRING, OP, NEWLINE, INDENT, DEDENT };

struct Token {
  TokenType type;
  std::string text;
  int line;
};

const std::set<std::string>& Keywords() {
  static const std::set<std::string> keywords = {
      "False",  "None",   "True",    "and",      "as",       "assert",
      "async",  "await",  "break",   "class",    "continue", "def",
      "del",    "elif",   "else",    "except",   "finally",  "for",
      "from",   "global", "if",      "import",   "in",       "is",
      "lambda", "nonlocal", "not",   "or",       "pass",     "raise",
      "return", "try",    "while",   "with",     "yield"};
  return keywords;
}

bool IsNameStart(char c) {
  return isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsNameChar(char c) {
  return IsNameStart(c) || isdigit(static_cast<unsigned char>(c));
}

bool IsStringPrefix(const std::string& s) {
  if (s.size() > 2) return false;
  for (char c : s) {
    if (!strchr("rRbBuUfF", c)) return false;
  }
  return true;
}

class Tokenizer {
 public:
  explicit Tokenizer(const std::string& source) : src_(source) {}

  bool Run(std::vector<Token>* tokens, std::string* error) {
    tokens_ = tokens;
    indents_ = {0};
    at_line_start_ = true;
    while (pos_ < src_.size()) {
      if (at_line_start_ && depth_ == 0) {
        if (!HandleIndentation(error)) return false;
        if (pos_ >= src_.size()) break;
      }
      char c = src_[pos_];
      if (c == '\n') {
        if (depth_ == 0 && line_has_tokens_) {
          Emit(TokenType::NEWLINE, "");
          line_has_tokens_ = false;
        }
        line_++;
        pos_++;
        at_line_start_ = depth_ == 0;
      } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
        pos_++;
      } else if (c == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') pos_++;
      } else if (c == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\r') pos_++;
        if (pos_ + 1 >= src_.size() || src_[pos_ + 1] != '\n') {
          *error = absl::StrCat("unexpected character after line "
                                "continuation at line ",
                                line_);
          return false;
        }
        pos_ += 2;
        line_++;
      } else if (c == '"' || c == '\'') {
        if (!ReadString(error)) return false;
      } else if (IsNameStart(c)) {
        size_t start = pos_;
        while (pos_ < src_.size() && IsNameChar(src_[pos_])) pos_++;
        std::string name = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
            IsStringPrefix(name)) {
          if (!ReadString(error)) return false;
        } else {
          Emit(TokenType::NAME, name);
        }
      } else if (isdigit(static_cast<unsigned char>(c)) ||
                 (c == '.' && pos_ + 1 < src_.size() &&
                  isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
        size_t start = pos_;
        while (pos_ < src_.size() &&
               (IsNameChar(src_[pos_]) || src_[pos_] == '.')) {
          pos_++;
        }
        Emit(TokenType::NUMBER, src_.substr(start, pos_ - start));
      } else {
        if (c == '(' || c == '[' || c == '{') {
          brackets_.push_back(c);
          depth_++;
        } else if (c == ')' || c == ']' || c == '}') {
          char open = c == ')' ? '(' : c == ']' ? '[' : '{';
          if (brackets_.empty() || brackets_.back() != open) {
            *error = absl::StrCat("unmatched '", std::string(1, c),
                                  "' at line ", line_);
            return false;
          }
          brackets_.pop_back();
          depth_--;
        }
        Emit(TokenType::OP, std::string(1, c));
        pos_++;
      }
    }
    if (depth_ != 0) {
      *error = absl::StrCat("unclosed '", std::string(1, brackets_.back()),
                            "' at end of input");
      return false;
    }
    if (line_has_tokens_) Emit(TokenType::NEWLINE, "");
    while (indents_.size() > 1) {
      indents_.pop_back();
      Emit(TokenType::DEDENT, "");
    }
    return true;
  }

 private:
  void Emit(TokenType type, std::string text) {
    if (type != TokenType::NEWLINE && type != TokenType::INDENT &&
        type != TokenType::DEDENT) {
      line_has_tokens_ = true;
    }
    tokens_->push_back(Token{type, std::move(text), line_});
  }

  // Measures the indentation of the current line and emits INDENT/DEDENT
  // tokens. Blank and comment-only lines are left to the main loop.
  bool HandleIndentation(std::string* error) {
    at_line_start_ = false;
    int column = 0;
    size_t p = pos_;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t' ||
                               src_[p] == '\f')) {
      if (src_[p] == '\t') {
        column = (column / 8 + 1) * 8;
      } else if (src_[p] == ' ') {
        column++;
      }
      p++;
    }
    if (p >= src_.size() || src_[p] == '\n' || src_[p] == '\r' ||
        src_[p] == '#') {
      return true;
    }
    pos_ = p;
    if (column > indents_.back()) {
      indents_.push_back(column);
      Emit(TokenType::INDENT, "");
      return true;
    }
    while (column < indents_.back()) {
      indents_.pop_back();
      Emit(TokenType::DEDENT, "");
    }
    if (column != indents_.back()) {
      *error = absl::StrCat("inconsistent dedent at line ", line_);
      return false;
    }
    return true;
  }

  bool ReadString(std::string* error) {
    int start_line = line_;
    char quote = src_[pos_];
    bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == quote &&
                  src_[pos_ + 2] == quote;
    pos_ += triple ? 3 : 1;
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') line_++;
        pos_ += 2;
        continue;
      }
      if (c == '\n') {
        if (!triple) break;
        line_++;
      }
      if (c == quote) {
        if (!triple) {
          pos_++;
          Emit(TokenType::STRING, "");
          return true;
        }
        if (pos_ + 2 < src_.size() && src_[pos_ + 1] == quote &&
            src_[pos_ + 2] == quote) {
          pos_ += 3;
          tokens_->push_back(Token{TokenType::STRING, "", start_line});
          line_has_tokens_ = true;
          return true;
        }
      }
      pos_++;
    }
    *error = absl::StrCat("unterminated string starting at line ", start_line);
    return false;
  }

  const std::string& src_;
  std::vector<Token>* tokens_ = nullptr;
  std::vector<int> indents_;
  std::vector<char> brackets_;
  size_t pos_ = 0;
  int line_ = 1;
  int depth_ = 0;
  bool at_line_start_ = true;
  bool line_has_tokens_ = false;
};

using TokenIt = std::vector<Token>::const_iterator;

// Walks logical lines keeping track of the functions whose body encloses the
// current statement.
class Walker {
 public:
  explicit Walker(security::PythonScan* scan) : scan_(scan) {}

  void Run(const std::vector<Token>& tokens) {
    std::vector<Token> line;
    for (const Token& token : tokens) {
      switch (token.type) {
        case TokenType::INDENT:
          blocks_.push_back(pending_function_);
          pending_function_ = -1;
          break;
        case TokenType::DEDENT:
          if (!blocks_.empty()) blocks_.pop_back();
          pending_function_ = -1;
          break;
        case TokenType::NEWLINE:
          Statements(line.begin(), line.end(), Active());
          line.clear();
          break;
        default:
          if (line.empty()) pending_function_ = -1;
          line.push_back(token);
      }
    }
  }

 private:
  std::vector<int> Active() const {
    std::vector<int> active;
    for (int block : blocks_) {
      if (block >= 0) active.push_back(block);
    }
    return active;
  }

  static bool IsOp(TokenIt it, const char* op) {
    return it->type == TokenType::OP && it->text == op;
  }

  static bool IsName(TokenIt it, const char* name) {
    return it->type == TokenType::NAME && it->text == name;
  }

  // Finds the first token equal to op outside of any bracket, or end.
  static TokenIt FindTopLevel(TokenIt begin, TokenIt end, const char* op) {
    int depth = 0;
    for (TokenIt it = begin; it != end; ++it) {
      if (it->type != TokenType::OP) continue;
      const std::string& t = it->text;
      if (t == "(" || t == "[" || t == "{") depth++;
      if (t == ")" || t == "]" || t == "}") depth--;
      if (depth == 0 && t == op) return it;
    }
    return end;
  }

  // A ';'-separated list of simple statements, or a compound statement
  // header optionally followed by a one-line body.
  void Statements(TokenIt begin, TokenIt end, const std::vector<int>& active) {
    while (begin != end) {
      TokenIt stop = FindTopLevel(begin, end, ";");
      Statement(begin, stop, active);
      if (stop == end) break;
      begin = stop + 1;
    }
  }

  void Statement(TokenIt begin, TokenIt end, const std::vector<int>& active) {
    if (begin == end) return;
    if (IsName(begin, "async") && begin + 1 != end) ++begin;
    if (IsName(begin, "def")) {
      Def(begin, end, active);
      return;
    }
    if (IsName(begin, "import")) {
      Import(begin + 1, end);
      return;
    }
    if (IsName(begin, "from")) {
      From(begin + 1, end);
      return;
    }
    static const std::set<std::string> compound = {
        "if",   "elif",    "else",    "while", "for",  "try",
        "with", "except",  "finally", "class", "match", "case"};
    if (begin->type == TokenType::NAME && compound.count(begin->text)) {
      // "match" and "case" are soft keywords: only a header if a colon
      // follows.
      TokenIt colon = FindTopLevel(begin, end, ":");
      if (colon == end && (begin->text == "match" || begin->text == "case")) {
        Expression(begin, end, active);
        return;
      }
      static const std::set<std::string> branches = {"if", "elif", "while",
                                                     "for", "try"};
      if (branches.count(begin->text)) MarkBranch(active);
      Expression(begin + 1, colon, active);
      if (colon != end) Statements(colon + 1, end, active);
      return;
    }
    Expression(begin, end, active);
  }

  void Def(TokenIt begin, TokenIt end, const std::vector<int>& active) {
    TokenIt name = begin + 1;
    if (name == end || name->type != TokenType::NAME) return;
    security::PythonScan::Function function;
    function.name = name->text;
    function.line = name->line;
    scan_->functions.push_back(function);
    int index = static_cast<int>(scan_->functions.size()) - 1;
    // Default values and annotations are evaluated in the enclosing scope.
    TokenIt colon = FindTopLevel(name + 1, end, ":");
    Expression(name + 1, colon, active);
    if (colon == end) return;
    if (colon + 1 == end) {
      pending_function_ = index;
      return;
    }
    std::vector<int> inner = active;
    inner.push_back(index);
    Statements(colon + 1, end, inner);
  }

  // Reads a dotted name starting at it, advancing it past the name.
  static std::string DottedName(TokenIt* it, TokenIt end) {
    std::string name;
    while (*it != end && (*it)->type == TokenType::NAME) {
      name += (*it)->text;
      ++*it;
      if (*it == end || !IsOp(*it, ".") || *it + 1 == end ||
          (*it + 1)->type != TokenType::NAME) {
        break;
      }
      name += ".";
      ++*it;
    }
    return name;
  }

  void Import(TokenIt it, TokenIt end) {
    while (it != end) {
      int line = it->line;
      std::string module = DottedName(&it, end);
      if (!module.empty()) scan_->imports.push_back({module, line});
      if (it != end && IsName(it, "as")) {
        ++it;
        if (it != end && it->type == TokenType::NAME) ++it;
      }
      while (it != end && !IsOp(it, ",")) ++it;
      if (it != end) ++it;
    }
  }

  void From(TokenIt it, TokenIt end) {
    // Relative imports refer to the program's own modules.
    if (it == end || IsOp(it, ".")) return;
    int line = it->line;
    std::string module = DottedName(&it, end);
    if (!module.empty()) scan_->imports.push_back({module, line});
  }

  void MarkBranch(const std::vector<int>& active) {
    for (int index : active) scan_->functions[index].has_branch = true;
  }

  void Expression(TokenIt begin, TokenIt end, const std::vector<int>& active) {
    for (TokenIt it = begin; it != end;) {
      if (IsName(it, "if") || IsName(it, "for") || IsName(it, "while")) {
        MarkBranch(active);
        ++it;
        continue;
      }
      if (it->type != TokenType::NAME || Keywords().count(it->text) ||
          (it != begin && IsOp(it - 1, "."))) {
        ++it;
        continue;
      }
      int line = it->line;
      std::string name = DottedName(&it, end);
      if (it == end || !IsOp(it, "(")) continue;
      scan_->calls.push_back({name, line});
      for (int index : active) {
        if (scan_->functions[index].name == name) {
          scan_->functions[index].calls_itself = true;
        }
      }
    }
  }

  security::PythonScan* scan_;
  std::vector<int> blocks_;
  int pending_function_ = -1;
};

}  // namespace

namespace security {

bool ScanPython(const std::string& source, PythonScan* scan,
                std::string* error) {
  std::vector<Token> tokens;
  Tokenizer tokenizer(source);
  if (!tokenizer.Run(&tokens, error)) return false;
  *scan = PythonScan();
  Walker(scan).Run(tokens);
  return true;
}

}  // namespace security
