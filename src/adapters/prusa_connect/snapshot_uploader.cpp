// File: src/adapters/prusa_connect/snapshot_uploader.cpp
#include "pl/adapters/prusa_connect/snapshot_uploader.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/adapters/http/http_client.hpp"

namespace pl {

std::string pad_fingerprint(const std::string& fp) {
  constexpr std::size_t kMinLen = 16;
  if (fp.size() >= kMinLen) return fp;
  return fp + std::string(kMinLen - fp.size(), '0');
}

SnapshotUploader::SnapshotUploader(UploadConfig cfg, IFrameSource& source)
    : cfg_(std::move(cfg)), source_(source), fingerprint_(pad_fingerprint(cfg_.fingerprint)) {}

Status SnapshotUploader::upload(const std::string& image_path) const {
  std::ifstream f(image_path, std::ios::binary);
  if (!f.is_open()) return Status::not_found("snapshot missing: " + image_path);

  HttpRequest req;
  req.method = "PUT";
  req.url = cfg_.url;
  req.body.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  req.headers = {
      "Content-Type: image/jpg",
      "Token: " + cfg_.token,
      "Fingerprint: " + fingerprint_,
  };
  req.timeout_s = cfg_.request_timeout_s;

  auto resp = http_request(req);
  if (!resp.ok()) return resp.status();
  if (resp->status != 200 && resp->status != 204) {
    return Status::unavailable("snapshot upload returned HTTP " + std::to_string(resp->status));
  }
  return Status::ok_status();
}

int SnapshotUploader::cycle() {
  auto shot = source_.capture();
  if (!shot.ok()) {
    ++failures_;
    spdlog::warn("[SnapshotUploader] capture failed ({}/{}): {}", failures_, cfg_.max_failures,
                 shot.status().message());
  } else {
    const Status st = upload(*shot);
    if (st.ok()) {
      failures_ = 0;
    } else {
      ++failures_;
      spdlog::warn("[SnapshotUploader] upload failed ({}/{}): {}", failures_, cfg_.max_failures,
                   st.message());
    }
  }

  if (failures_ >= cfg_.max_failures) {
    spdlog::warn("[SnapshotUploader] too many failures, waiting {}s", cfg_.backoff_s);
    failures_ = 0;
    return cfg_.backoff_s;
  }
  return cfg_.interval_s;
}

}  // namespace pl
