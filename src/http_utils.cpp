#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

bool IsApiPath(const std::string& path) {
  return path.rfind("/api/", 0) == 0;
}

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

std::string FormatOneParam(const httplib::Headers& headers) {
  auto it = headers.find("Content-Type");
  return it == headers.end() ? "" : it->second;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  auto level = IsSuccess(res.status) ? spdlog::level::debug : spdlog::level::info;
  spdlog::log(level, "{} {} {} params {} type {} -> {}", req.remote_addr, req.method, req.path,
              FormatOneParam(req.params), FormatOneParam(req.headers), res.status);
}

} // namespace http_utils

nlohmann::json ResultJSON(const ExecutionResult& result) {
  return {
    {"success", result.success},
    {"output", result.output},
    {"errors", result.errors},
  };
}

int ResultStatus(const ExecutionResult& result) {
  return result.outcome == Outcome::ADMISSION_DENIED ? http_utils::kTooManyRequests : 200;
}

void SendJSON(httplib::Response& res, const nlohmann::json& body, int status) {
  res.status = status;
  // replace invalid UTF-8 from child output instead of throwing
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}
