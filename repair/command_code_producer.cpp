#include "repair/command_code_producer.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "executor/subprocess.hpp"
#include "glog/logging.h"
#include "nlohmann/json.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace repair {

namespace {

const char kFence[] = "```";

bool IsTagChar(char c) {
  return absl::ascii_isalnum(c) || c == '_' || c == '+' || c == '#' ||
         c == '-';
}

// Drops every fence marker together with its language tag.
std::string RemoveFences(std::string text) {
  for (size_t pos = text.find(kFence); pos != std::string::npos;
       pos = text.find(kFence, pos)) {
    size_t end = pos + sizeof(kFence) - 1;
    while (end < text.size() && IsTagChar(text[end])) end++;
    if (end < text.size() && text[end] == '\n') end++;
    text.erase(pos, end - pos);
  }
  return text;
}

}  // namespace

std::string ExtractCodeBlock(const std::string& reply) {
  size_t open = reply.find(kFence);
  if (open == std::string::npos) {
    return std::string(absl::StripAsciiWhitespace(reply));
  }
  size_t line_end = reply.find('\n', open);
  size_t close = line_end == std::string::npos
                     ? std::string::npos
                     : reply.find(std::string("\n") + kFence, line_end);
  if (close == std::string::npos) {
    return std::string(absl::StripAsciiWhitespace(RemoveFences(reply)));
  }
  if (close == line_end) return "";
  return std::string(absl::StripAsciiWhitespace(
      absl::string_view(reply).substr(line_end + 1, close - line_end - 1)));
}

CommandCodeProducer::CommandCodeProducer(std::vector<std::string> command,
                                         std::string temp_directory,
                                         int32_t timeout_seconds)
    : command_(std::move(command)),
      temp_directory_(std::move(temp_directory)),
      timeout_seconds_(timeout_seconds) {}

std::string CommandCodeProducer::Generate(const std::string& prompt) {
  return Ask(nlohmann::json({{"action", "generate"}, {"prompt", prompt}})
                 .dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace));
}

std::string CommandCodeProducer::Repair(const std::string& source,
                                        const std::string& error,
                                        const std::string& language) {
  return Ask(nlohmann::json({{"action", "repair"},
                             {"source", source},
                             {"error", error},
                             {"language", language}})
                 .dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace));
}

std::string CommandCodeProducer::Ask(const std::string& request) {
  if (command_.empty()) throw producer_error("No producer command configured");
  std::string program = util::which(command_[0]);
  if (program.empty()) {
    throw producer_error(
        absl::StrCat("Producer command '", command_[0], "' not found"));
  }
  util::TempDir tmp(temp_directory_);
  std::string request_file = util::File::JoinPath(tmp.Path(), "request.json");
  util::File::Write(request_file, request);

  executor::Subprocess process;
  process.argv = command_;
  process.argv[0] = program;
  process.workdir = tmp.Path();
  process.stdin_file = request_file;
  process.wall_limit_millis = timeout_seconds_ * 1000LL;
  executor::SubprocessOutput output;
  std::string error;
  if (!executor::RunSubprocess(process, tmp.Path(), &output, &error)) {
    throw producer_error(absl::StrCat("Cannot run the producer: ", error));
  }
  if (output.info.timed_out) {
    throw producer_error(absl::StrCat("Producer timed out after ",
                                      timeout_seconds_, " seconds"));
  }
  if (!output.Ok()) {
    throw producer_error(absl::StrCat("Producer exited with code ",
                                      output.ExitCode(), ": ",
                                      output.stderr_data));
  }
  std::string code = ExtractCodeBlock(output.stdout_data);
  if (code.empty()) throw producer_error("Producer returned no code");
  VLOG(1) << "Producer returned " << code.size() << " bytes of code";
  return code;
}

}  // namespace repair
