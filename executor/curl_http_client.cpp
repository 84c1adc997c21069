#include "executor/curl_http_client.hpp"

#include <stdexcept>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "executor/subprocess.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace executor {

CurlHttpClient::CurlHttpClient(std::string curl_binary,
                               std::string temp_directory)
    : curl_binary_(std::move(curl_binary)),
      temp_directory_(std::move(temp_directory)) {}

bool CurlHttpClient::Send(const HttpRequest& request, HttpResponse* response,
                          std::string* error) {
  try {
    std::string curl = util::which(curl_binary_);
    if (curl.empty()) {
      *error = absl::StrCat("'", curl_binary_, "' not found in PATH");
      return false;
    }
    util::TempDir tmp(temp_directory_);
    std::string headers = "Accept: application/json\n";
    if (!request.bearer_token.empty()) {
      absl::StrAppend(&headers, "Authorization: Bearer ", request.bearer_token,
                      "\n");
    }
    Subprocess command;
    command.argv = {curl, "-sS", "-X", request.method, "-w", "\n%{http_code}"};
    if (request.timeout_seconds > 0) {
      command.argv.push_back("--max-time");
      command.argv.push_back(absl::StrCat(request.timeout_seconds));
      command.wall_limit_millis =
          (request.timeout_seconds + kGraceSeconds) * 1000LL;
    }
    if (!request.body.empty()) {
      absl::StrAppend(&headers, "Content-Type: application/json\n");
      std::string body_file = util::File::JoinPath(tmp.Path(), "body");
      util::File::Write(body_file, request.body);
      command.argv.push_back("--data-binary");
      command.argv.push_back("@" + body_file);
    }
    std::string headers_file = util::File::JoinPath(tmp.Path(), "headers");
    util::File::Write(headers_file, headers);
    command.argv.push_back("-H");
    command.argv.push_back("@" + headers_file);
    command.argv.push_back(request.url);
    command.workdir = tmp.Path();

    SubprocessOutput output;
    if (!RunSubprocess(command, tmp.Path(), &output, error)) return false;
    if (output.info.timed_out) {
      *error = absl::StrCat("request timed out after ",
                            request.timeout_seconds, " seconds");
      return false;
    }
    if (!output.Ok()) {
      *error = absl::StrCat("curl exited with code ", output.ExitCode(), ": ",
                            absl::StripTrailingAsciiWhitespace(
                                output.stderr_data));
      return false;
    }
    size_t newline = output.stdout_data.rfind('\n');
    if (newline == std::string::npos ||
        !absl::SimpleAtoi(output.stdout_data.substr(newline + 1),
                          &response->status)) {
      *error = "cannot read the HTTP status from curl's output";
      return false;
    }
    response->body = output.stdout_data.substr(0, newline);
  } catch (const std::runtime_error& exc) {
    *error = exc.what();
    return false;
  }
  VLOG(1) << request.method << " " << request.url << " -> "
          << response->status;
  return true;
}

}  // namespace executor
