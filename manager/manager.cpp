#include <iostream>
#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "executor/orchestrator.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "language/language_registry.hpp"
#include "manager/workflow.hpp"
#include "nlohmann/json.hpp"
#include "repair/command_code_producer.hpp"
#include "security/security_gate.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(action, "execute",  // NOLINT
              "One of execute, check, debug, run, generate, info");
DEFINE_string(source_file, "-",  // NOLINT
              "File with the program source, - for standard input");
DEFINE_string(stdin_file, "",  // NOLINT
              "File given to the program as standard input, - for the "
              "standard input of codemend");
DEFINE_string(language, "python", "Language of the source");  // NOLINT
DEFINE_string(mode, "auto",  // NOLINT
              "Backend: auto, container, local or remote");
DEFINE_string(error, "", "Error produced by the source, for debug");  // NOLINT
DEFINE_string(error_file, "",  // NOLINT
              "File with the error produced by the source, for debug");
DEFINE_string(prompt, "", "Description of the program, for generate");  // NOLINT

namespace {

std::string ReadInput(const std::string& path) {
  if (path.empty()) return "";
  return util::File::Read(path == "-" ? "/dev/stdin" : path);
}

proto::ExecutionMode ParseMode(const std::string& name) {
  proto::ExecutionMode mode;
  if (!proto::ExecutionMode_Parse(absl::AsciiStrToUpper(name), &mode)) {
    throw std::invalid_argument("Invalid --mode: " + name);
  }
  return mode;
}

std::unique_ptr<language::LanguageRegistry> BuildRegistry() {
  if (FLAGS_languages_file.empty()) return language::LanguageRegistry::Default();
  return language::LanguageRegistry::FromFile(FLAGS_languages_file);
}

std::unique_ptr<repair::CodeProducer> BuildProducer() {
  std::vector<std::string> command = absl::StrSplit(
      FLAGS_producer_command, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (command.empty()) return nullptr;
  return absl::make_unique<repair::CommandCodeProducer>(
      command, FLAGS_temp_directory, FLAGS_producer_timeout_seconds);
}

proto::ExecutionRequest BuildRequest() {
  proto::ExecutionRequest request;
  request.set_language(FLAGS_language);
  request.set_source(ReadInput(FLAGS_source_file));
  request.set_stdin_data(ReadInput(FLAGS_stdin_file));
  request.set_mode(ParseMode(FLAGS_mode));
  return request;
}

nlohmann::json RunAction(manager::Workflow* workflow,
                         executor::Orchestrator* orchestrator,
                         const security::SecurityGate& gate,
                         repair::CodeProducer* producer) {
  if (FLAGS_action == "execute") {
    return manager::ResultToJson(workflow->Execute(BuildRequest()));
  }
  if (FLAGS_action == "run") {
    return manager::OutcomeToJson(workflow->ExecuteWithRepair(BuildRequest()));
  }
  if (FLAGS_action == "check") {
    return manager::VerdictToJson(workflow->CheckSecurity(
        ReadInput(FLAGS_source_file), FLAGS_language));
  }
  if (FLAGS_action == "debug") {
    std::string error = FLAGS_error_file.empty() ? FLAGS_error
                                                 : ReadInput(FLAGS_error_file);
    return manager::OutcomeToJson(workflow->DebugAndFix(
        ReadInput(FLAGS_source_file), error, FLAGS_language));
  }
  if (FLAGS_action == "generate") {
    if (producer == nullptr) {
      throw std::invalid_argument("--producer_command is required");
    }
    try {
      std::string source = producer->Generate(FLAGS_prompt);
      return {{"success", true},
              {"source", source},
              {"security", manager::VerdictToJson(
                               gate.Check(source, FLAGS_language))}};
    } catch (const repair::producer_error& e) {
      return {{"success", false}, {"error", e.what()}};
    }
  }
  if (FLAGS_action == "info") {
    return {{"languages", orchestrator->registry().SupportedLanguages()},
            {"backends", orchestrator->AvailableBackends()},
            {"configuration", orchestrator->Describe()},
            {"security", gate.Summary()}};
  }
  throw std::invalid_argument("Invalid --action: " + FLAGS_action);
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs untrusted programs in a sandbox and repairs the failing ones");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::unique_ptr<language::LanguageRegistry> registry;
  std::unique_ptr<executor::Orchestrator> orchestrator;
  try {
    if (FLAGS_max_repair_attempts < 0) {
      throw std::invalid_argument("--max_repair_attempts must not be negative");
    }
    registry = BuildRegistry();
    orchestrator = executor::Orchestrator::Create(registry.get());
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  security::SecurityOptions security_options;
  security_options.max_source_length = FLAGS_max_source_length;
  security::SecurityGate gate(registry.get(), security_options);
  std::unique_ptr<repair::CodeProducer> producer = BuildProducer();
  manager::Workflow workflow(&gate, orchestrator.get(), producer.get(),
                             FLAGS_max_repair_attempts);

  int status = 0;
  try {
    nlohmann::json output =
        RunAction(&workflow, orchestrator.get(), gate, producer.get());
    std::cout << manager::FormatJson(output) << std::endl;
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    status = 1;
  } catch (const std::system_error& e) {
    LOG(ERROR) << e.what();
    status = 1;
  }
  orchestrator->TearDown();
  return status;
}
