// File: src/adapters/prusalink/prusalink_poller.cpp
#include "pl/adapters/prusalink/prusalink_poller.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "pl/adapters/http/http_client.hpp"

namespace pl {
namespace {

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool is_active_state(const std::string& s) {
  return s == "PRINTING" || s == "PAUSED" || s == "ATTENTION";
}

std::optional<std::string> scalar_string(const YAML::Node& n) {
  if (!n || !n.IsScalar()) return std::nullopt;
  std::string v = n.as<std::string>();
  if (v.empty() || v == "null") return std::nullopt;
  return v;
}

}  // namespace

Result<PrinterStatus> parse_status_body(const std::string& body) {
  using R = Result<PrinterStatus>;

  // JSON is a YAML subset; one parser for config and API bodies.
  YAML::Node root;
  try {
    root = YAML::Load(body);
  } catch (const YAML::Exception& e) {
    return R::err(Status::parse_error(std::string("status body: ") + e.what()));
  }
  if (!root.IsMap()) return R::err(Status::parse_error("status body is not a JSON object"));

  PrinterStatus out;
  std::optional<std::string> job_state;
  std::optional<std::string> printer_state;

  try {
    const YAML::Node job = root["job"];
    if (job && job.IsMap()) {
      job_state = scalar_string(job["state"]);

      if (const YAML::Node id = job["id"]; id && id.IsScalar()) {
        try {
          out.job_id = id.as<JobId>();
        } catch (const YAML::BadConversion&) {
          spdlog::debug("[PrusaLinkPoller] ignoring non-numeric job id '{}'", id.as<std::string>());
        }
      }

      out.job_name = scalar_string(job["display_name"]);
      if (!out.job_name) {
        const YAML::Node file = job["file"];
        if (file && file.IsMap()) out.job_name = scalar_string(file["display_name"]);
      }

      if (const YAML::Node p = job["progress"]; p && p.IsScalar() && p.as<std::string>() != "null") {
        out.progress_percent = p.as<float>();
      }
    }

    const YAML::Node printer = root["printer"];
    if (printer && printer.IsMap()) printer_state = scalar_string(printer["state"]);
  } catch (const YAML::Exception& e) {
    return R::err(Status::parse_error(std::string("status body: ") + e.what()));
  }

  if (job_state) out.state_text = to_upper(*job_state);
  else if (printer_state) out.state_text = to_upper(*printer_state);

  out.is_printing = out.state_text == "PRINTING";
  out.is_job_active = is_active_state(out.state_text);
  return R::ok(std::move(out));
}

std::optional<std::string> parse_job_name(const std::string& body) {
  try {
    const YAML::Node root = YAML::Load(body);
    if (!root.IsMap()) return std::nullopt;
    const YAML::Node file = root["file"];
    if (!file || !file.IsMap()) return std::nullopt;
    if (auto n = scalar_string(file["display_name"])) return n;
    return scalar_string(file["name"]);
  } catch (const YAML::Exception&) {
    return std::nullopt;
  }
}

PrusaLinkPoller::PrusaLinkPoller(PrinterConfig cfg) : cfg_(std::move(cfg)) {}

static std::string base_url(const std::string& host) {
  if (host.rfind("http://", 0) == 0 || host.rfind("https://", 0) == 0) return host;
  return "http://" + host;
}

std::string PrusaLinkPoller::status_url() const { return base_url(cfg_.host) + cfg_.status_path; }
std::string PrusaLinkPoller::job_url() const { return base_url(cfg_.host) + "/api/v1/job"; }

Result<std::string> PrusaLinkPoller::get(const std::string& url) const {
  HttpRequest req;
  req.url = url;
  req.headers = {"X-Api-Key: " + cfg_.api_key, "Accept: application/json"};
  req.connect_timeout_s = std::min(cfg_.request_timeout_s, 10);
  req.timeout_s = cfg_.request_timeout_s;

  auto resp = http_request(req);
  if (!resp.ok()) return Result<std::string>::err(resp.status());
  if (resp->status != 200) {
    return Result<std::string>::err(
        Status::unavailable("GET " + url + " returned HTTP " + std::to_string(resp->status)));
  }
  return Result<std::string>::ok(std::move(resp->body));
}

Result<PrinterStatus> PrusaLinkPoller::poll() {
  auto body = get(status_url());
  if (!body.ok()) return Result<PrinterStatus>::err(body.status());

  auto st = parse_status_body(*body);
  if (!st.ok()) return st;

  if (st->job_id && !st->job_name) {
    if (named_job_ != st->job_id) {
      named_job_ = st->job_id;
      job_name_.reset();
      auto job_body = get(job_url());
      if (job_body.ok()) {
        job_name_ = parse_job_name(*job_body);
      } else {
        spdlog::debug("[PrusaLinkPoller] job name lookup failed: {}", job_body.status().message());
        named_job_.reset();
      }
    }
    st->job_name = job_name_;
  }
  return st;
}

}  // namespace pl
