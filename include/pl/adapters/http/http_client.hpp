// File: include/pl/adapters/http/http_client.hpp
#pragma once

#include <string>
#include <vector>

#include "pl/core/status.hpp"

namespace pl {

struct HttpRequest {
  std::string method{"GET"};  // GET | PUT
  std::string url;
  std::vector<std::string> headers;  // "Name: value"
  std::string body;                  // PUT payload

  int connect_timeout_s{10};
  int timeout_s{15};
};

struct HttpResponse {
  long status{0};
  std::string body;
};

// Process-wide libcurl init/cleanup. Create one in main() before any request.
class HttpGlobal {
 public:
  HttpGlobal();
  ~HttpGlobal();

  HttpGlobal(const HttpGlobal&) = delete;
  HttpGlobal& operator=(const HttpGlobal&) = delete;
};

// One blocking request, bounded by the request's timeouts.
// Transport failures -> unavailable (timeout for timeouts). Any HTTP status is returned
// as a response; callers decide what counts as success.
Result<HttpResponse> http_request(const HttpRequest& req);

}  // namespace pl
