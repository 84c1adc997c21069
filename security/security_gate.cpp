#include "security/security_gate.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "security/python_scanner.hpp"

namespace {

// Destructive shell idioms, matched case-insensitively anywhere in a source.
const std::vector<std::string>& CommandBlacklist() {
  static const std::vector<std::string> commands = {
      "rm -rf /",         "rm -fr /",       "rm -rf ~",
      "rm -rf *",         "mkfs",           "format c:",
      "del /s",           "rmdir /s",       "shutdown -h",
      "shutdown -r",      "shutdown now",   "shutdown /s",
      "shutdown /r",      "sudo reboot",    "systemctl reboot",
      "systemctl poweroff", "halt -f",      "poweroff -f",
      "init 0",           "init 6",         "dd if=/dev/zero of=/dev/",
      "dd if=/dev/urandom of=/dev/",        "> /dev/sda",
      "chmod -r 777 /"};
  return commands;
}

const std::set<std::string>& DeniedPythonModules() {
  static const std::set<std::string> modules = {
      "subprocess", "os",   "sys",  "socket", "ftplib",
      "urllib",     "http", "shutil", "ctypes", "pty"};
  return modules;
}

const std::map<std::string, std::string>& DeniedPythonCalls() {
  static const std::map<std::string, std::string> calls = {
      {"eval", "Call to dynamic evaluation primitive: eval"},
      {"exec", "Call to dynamic evaluation primitive: exec"},
      {"compile", "Call to dynamic evaluation primitive: compile"},
      {"__import__", "Call to dynamic evaluation primitive: __import__"},
      {"importlib.import_module",
       "Call to dynamic evaluation primitive: importlib.import_module"},
      {"pickle.loads", "Unsafe deserialization call: pickle.loads"},
      {"marshal.loads", "Unsafe deserialization call: marshal.loads"}};
  return calls;
}

// A pattern whose first capture group is the offending text. If with_subject
// is set, the group is appended to the message.
struct PatternRule {
  std::regex pattern;
  std::string message;
  bool with_subject;
};

PatternRule Rule(const std::string& pattern, std::string message,
                 bool with_subject = true, bool icase = false) {
  auto flags = std::regex::ECMAScript;
  if (icase) flags |= std::regex::icase;
  return PatternRule{std::regex(pattern, flags), std::move(message),
                     with_subject};
}

using RuleTable = std::map<std::string, std::vector<PatternRule>>;

RuleTable* BuildLanguageRules() {
  auto* table = new RuleTable();
  std::string python_modules = absl::StrJoin(DeniedPythonModules(), "|");
  (*table)["python"] = {
      Rule(absl::StrCat("(?:^|\\n)[ \\t]*(?:import|from)\\s+((?:",
                        python_modules, ")\\b)"),
           "Import of restricted module: "),
      Rule("\\b(eval|exec|compile|__import__)\\s*\\(",
           "Call to dynamic evaluation primitive: "),
      Rule("\\b(importlib\\.import_module)\\s*\\(",
           "Call to dynamic evaluation primitive: "),
      Rule("\\b((?:pickle|marshal)\\.loads)\\s*\\(",
           "Unsafe deserialization call: ")};
  std::string js_modules =
      "(?:node:)?(child_process|fs|net|http|https|dgram|cluster|vm|os|"
      "worker_threads)";
  (*table)["javascript"] = {
      Rule(absl::StrCat("\\brequire\\s*\\(\\s*['\"]", js_modules,
                        "['\"]\\s*\\)"),
           "Import of restricted module: "),
      Rule(absl::StrCat("\\bimport\\s[^;\\n]*?from\\s*['\"]", js_modules,
                        "['\"]"),
           "Import of restricted module: "),
      Rule("\\b(eval)\\s*\\(", "Call to dynamic evaluation primitive: "),
      Rule("\\b(new\\s+Function)\\s*\\(", "Function constructor", false),
      Rule("(?:^|[^.\\w])(import)\\s*\\(", "Dynamic import", false)};
  (*table)["java"] = {
      Rule("\\b(Runtime\\s*\\.\\s*getRuntime\\s*\\(\\s*\\)\\s*\\.\\s*exec)"
           "\\s*\\(",
           "Process execution: Runtime.exec", false),
      Rule("\\b(ProcessBuilder)\\b", "Process execution: ProcessBuilder",
           false),
      Rule("\\b(java\\.net\\.\\w+)", "Network access: ")};
  (*table)["go"] = {
      Rule("\"(os/exec|syscall|net|net/http|plugin|unsafe)\"",
           "Import of restricted package: ")};
  (*table)["rust"] = {
      Rule("\\b((?:std::)?process::Command)\\b", "Process execution: "),
      Rule("\\b(std::net)\\b", "Network access: "),
      Rule("\\b(libc::(?:system|fork|exec\\w*))\\b", "Process execution: ")};
  std::vector<PatternRule> c_rules = {
      Rule("\\b(system|popen|fork|vfork|execl|execlp|execle|execv|execvp|"
           "execvpe|dlopen)\\s*\\(",
           "Process execution call: "),
      Rule("#\\s*include\\s*<(sys/socket\\.h|netinet/in\\.h|arpa/inet\\.h|"
           "dlfcn\\.h)>",
           "Include of restricted header: ")};
  (*table)["c"] = c_rules;
  (*table)["cpp"] = c_rules;
  (*table)["bash"] = {
      Rule("\\b(rm\\s+-rf\\s+/)", "Destructive command: "),
      Rule("\\b(dd\\s+if=)", "Destructive command: "),
      Rule("\\b(mkfs\\.)", "Destructive command: "),
      Rule("(:\\s*\\(\\s*\\)\\s*\\{\\s*:\\s*\\|\\s*:\\s*&\\s*\\}\\s*;?)",
           "Fork bomb", false)};
  return table;
}

const std::vector<PatternRule>* LanguageRules(const std::string& language) {
  static const RuleTable* table = BuildLanguageRules();
  auto it = table->find(language);
  if (it == table->end()) return nullptr;
  return &it->second;
}

const std::vector<PatternRule>& WarningRules(bool javascript) {
  static const std::vector<PatternRule>* common = new std::vector<PatternRule>{
      Rule("\\b(password|passwd|api[_-]?key|secret)\\s*[=:]\\s*['\"][^'\"]+"
           "['\"]",
           "Possible hard-coded credential: ", true, true),
      Rule("\\b((?:\\d{1,3}\\.){3}\\d{1,3})\\b", "Hard-coded IP address: ")};
  static const std::vector<PatternRule>* js = [] {
    auto* rules = new std::vector<PatternRule>(*common);
    rules->push_back(Rule("\\b(document\\.write)\\b",
                          "document.write can inject markup into the page",
                          false));
    return rules;
  }();
  return javascript ? *js : *common;
}

int LineOf(const std::string& source, size_t pos) {
  return 1 + static_cast<int>(std::count(source.begin(),
                                         source.begin() + pos, '\n'));
}

// Accumulates the findings of a check. Messages are kept unique in the order
// they are first seen.
class VerdictBuilder {
 public:
  void Violation(const std::string& message, int line) {
    if (seen_violations_.insert(message).second) {
      verdict_.add_violations(message);
    }
    if (line > 0) violating_lines_.insert(line);
  }

  void Warning(const std::string& message) {
    if (seen_warnings_.insert(message).second) verdict_.add_warnings(message);
  }

  void ApplyRules(const std::vector<PatternRule>& rules,
                  const std::string& source, bool as_violation) {
    for (const PatternRule& rule : rules) {
      auto begin =
          std::sregex_iterator(source.begin(), source.end(), rule.pattern);
      for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        std::string message = rule.message;
        if (rule.with_subject) message += match[1].str();
        if (as_violation) {
          Violation(message, LineOf(source, match.position(1)));
        } else {
          Warning(message);
        }
      }
    }
  }

  // Comments out every line that produced a violation.
  proto::SecurityVerdict Build(const std::string& source,
                               const std::string& comment) {
    verdict_.set_safe(verdict_.violations_size() == 0);
    if (violating_lines_.empty()) {
      verdict_.set_sanitized_source(source);
      return verdict_;
    }
    std::vector<std::string> lines = absl::StrSplit(source, '\n');
    for (int line : violating_lines_) {
      if (line > static_cast<int>(lines.size())) continue;
      std::string& text = lines[line - 1];
      size_t indent = text.find_first_not_of(" \t");
      if (indent == std::string::npos) continue;
      text = absl::StrCat(text.substr(0, indent), comment, " REMOVED: ",
                          text.substr(indent));
    }
    verdict_.set_sanitized_source(absl::StrJoin(lines, "\n"));
    return verdict_;
  }

 private:
  proto::SecurityVerdict verdict_;
  std::set<std::string> seen_violations_;
  std::set<std::string> seen_warnings_;
  std::set<int> violating_lines_;
};

void CheckPython(const std::string& source, VerdictBuilder* builder) {
  security::PythonScan scan;
  std::string error;
  if (!security::ScanPython(source, &scan, &error)) {
    VLOG(1) << "Python scan failed: " << error;
    builder->Warning(absl::StrCat("Could not parse the Python source (", error,
                                  "), falling back to pattern checks"));
    builder->ApplyRules(*LanguageRules("python"), source, true);
    return;
  }
  for (const auto& import : scan.imports) {
    std::string top = import.module.substr(0, import.module.find('.'));
    if (DeniedPythonModules().count(top)) {
      builder->Violation(absl::StrCat("Import of restricted module: ", top),
                         import.line);
    }
  }
  for (const auto& call : scan.calls) {
    auto it = DeniedPythonCalls().find(call.name);
    if (it != DeniedPythonCalls().end()) {
      builder->Violation(it->second, call.line);
    }
  }
  for (const auto& function : scan.functions) {
    if (function.calls_itself && !function.has_branch) {
      builder->Warning(absl::StrCat("Function '", function.name,
                                    "' calls itself without a termination "
                                    "condition"));
    }
  }
}

}  // namespace

namespace security {

SecurityGate::SecurityGate(const language::LanguageRegistry* registry,
                           SecurityOptions options)
    : registry_(registry), options_(options) {}

proto::SecurityVerdict SecurityGate::Check(const std::string& source,
                                           const std::string& language) const {
  std::string id = absl::AsciiStrToLower(language);
  if (registry_ != nullptr) {
    const proto::LanguageDescriptor* descriptor = registry_->Describe(language);
    if (descriptor != nullptr) id = descriptor->id();
  }

  std::string comment = id == "python" || id == "bash" ? "#" : "//";
  VerdictBuilder builder;
  if (static_cast<int64_t>(source.size()) > options_.max_source_length) {
    // The pattern rules are not run on oversized sources.
    builder.Violation(absl::StrCat("Source is too long (", source.size(),
                                   " characters, the limit is ",
                                   options_.max_source_length, ")"),
                      0);
    LOG(INFO) << "Rejected " << source.size() << " characters of " << id
              << " source";
    return builder.Build(source, comment);
  }

  std::string lowered = absl::AsciiStrToLower(source);
  for (const std::string& command : CommandBlacklist()) {
    for (size_t pos = lowered.find(command); pos != std::string::npos;
         pos = lowered.find(command, pos + 1)) {
      builder.Violation(absl::StrCat("Blacklisted command: ", command),
                        LineOf(source, pos));
    }
  }

  if (id == "python") {
    CheckPython(source, &builder);
  } else if (const std::vector<PatternRule>* rules = LanguageRules(id)) {
    builder.ApplyRules(*rules, source, true);
  }
  builder.ApplyRules(WarningRules(id == "javascript"), source, false);

  proto::SecurityVerdict verdict = builder.Build(source, comment);
  if (!verdict.safe()) {
    LOG(INFO) << "Rejected " << id << " source: "
              << absl::StrJoin(verdict.violations(), "; ");
  }
  return verdict;
}

std::string SecurityGate::Summary() const {
  return absl::StrCat("max_source_length=", options_.max_source_length,
                      " blacklisted_commands=", CommandBlacklist().size(),
                      " restricted_python_modules=",
                      DeniedPythonModules().size(),
                      " restricted_python_calls=", DeniedPythonCalls().size());
}

}  // namespace security
