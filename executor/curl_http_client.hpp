#ifndef EXECUTOR_CURL_HTTP_CLIENT_HPP
#define EXECUTOR_CURL_HTTP_CLIENT_HPP

#include <string>

#include "executor/http_client.hpp"

namespace executor {

// HttpClient that runs the curl command line tool in the process sandbox.
// Headers and bodies are passed through private files, so that credentials
// never appear in the command line of a process.
class CurlHttpClient : public HttpClient {
 public:
  CurlHttpClient(std::string curl_binary, std::string temp_directory);
  bool Send(const HttpRequest& request, HttpResponse* response,
            std::string* error) override;

 private:
  // Extra time given to curl to give up on its own before being killed.
  static const constexpr int32_t kGraceSeconds = 5;

  std::string curl_binary_;
  std::string temp_directory_;
};

}  // namespace executor

#endif
