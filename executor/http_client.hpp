#ifndef EXECUTOR_HTTP_CLIENT_HPP
#define EXECUTOR_HTTP_CLIENT_HPP

#include <cstdint>
#include <string>

namespace executor {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  // Sent as a JSON body if not empty.
  std::string body;
  // Sent as an Authorization: Bearer header if not empty.
  std::string bearer_token;
  int32_t timeout_seconds = 0;
};

struct HttpResponse {
  int32_t status = 0;
  std::string body;
};

class HttpClient {
 public:
  // Performs a request. Returns false and sets error if no response was
  // received; a response with any status code is a success.
  virtual bool Send(const HttpRequest& request, HttpResponse* response,
                    std::string* error) = 0;

  HttpClient() = default;
  virtual ~HttpClient() = default;
  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;
  HttpClient(HttpClient&&) = delete;
  HttpClient& operator=(HttpClient&&) = delete;
};

}  // namespace executor

#endif
