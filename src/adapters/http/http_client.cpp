// File: src/adapters/http/http_client.cpp
#include "pl/adapters/http/http_client.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <utility>

#include <curl/curl.h>

namespace pl {
namespace {

constexpr std::size_t kMaxBody = 1024 * 1024;

struct CurlDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::size_t on_body(char* data, std::size_t size, std::size_t nmemb, void* user) {
  auto* out = static_cast<std::string*>(user);
  const std::size_t n = size * nmemb;
  const std::size_t room = kMaxBody > out->size() ? kMaxBody - out->size() : 0;
  out->append(data, std::min(n, room));
  return n;
}

struct UploadCursor {
  const std::string* body;
  std::size_t offset;
};

std::size_t on_upload(char* buf, std::size_t size, std::size_t nmemb, void* user) {
  auto* cur = static_cast<UploadCursor*>(user);
  const std::size_t n = std::min(size * nmemb, cur->body->size() - cur->offset);
  std::memcpy(buf, cur->body->data() + cur->offset, n);
  cur->offset += n;
  return n;
}

}  // namespace

HttpGlobal::HttpGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
HttpGlobal::~HttpGlobal() { curl_global_cleanup(); }

Result<HttpResponse> http_request(const HttpRequest& req) {
  using R = Result<HttpResponse>;

  CurlHandle h(curl_easy_init());
  if (!h) return R::err(Status::internal("curl_easy_init failed"));

  HeaderList headers;
  for (const auto& line : req.headers) {
    curl_slist* next = curl_slist_append(headers.get(), line.c_str());
    if (next == nullptr) return R::err(Status::internal("curl_slist_append failed"));
    headers.release();
    headers.reset(next);
  }

  HttpResponse resp;
  UploadCursor cursor{&req.body, 0};

  curl_easy_setopt(h.get(), CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(req.connect_timeout_s));
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, static_cast<long>(req.timeout_s));
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, &on_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &resp.body);
  if (headers) curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());

  if (req.method == "PUT") {
    curl_easy_setopt(h.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h.get(), CURLOPT_READFUNCTION, &on_upload);
    curl_easy_setopt(h.get(), CURLOPT_READDATA, &cursor);
    curl_easy_setopt(h.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
  } else if (req.method != "GET") {
    return R::err(Status::unsupported("http_request: method " + req.method));
  }

  const CURLcode rc = curl_easy_perform(h.get());
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    return R::err(Status::timeout(req.method + " " + req.url + ": " + curl_easy_strerror(rc)));
  }
  if (rc != CURLE_OK) {
    return R::err(Status::unavailable(req.method + " " + req.url + ": " + curl_easy_strerror(rc)));
  }

  curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  return R::ok(std::move(resp));
}

}  // namespace pl
