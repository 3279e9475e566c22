#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Serve JSON & log HTTP requests

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <coderun/gate.h>

namespace http_utils {

constexpr int kNoContent = 204;
constexpr int kTooManyRequests = 429;
constexpr int kInternalServerError = 500;

bool IsSuccess(int code);
bool IsApiPath(const std::string& path);

std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);

void LogRequest(const httplib::Request&, const httplib::Response&);

} // namespace http_utils

nlohmann::json ResultJSON(const ExecutionResult&);
// 429 for a rate-limit rejection, 200 for everything else
int ResultStatus(const ExecutionResult&);

void SendJSON(httplib::Response&, const nlohmann::json&, int status = 200);

// Parse a JSON object body and hand the string field (empty if missing or null) to func.
// Malformed bodies never reach func.
template <class Func>
ExecutionResult WithStringField(const httplib::Request& req, const char* field, Func&& func) {
  std::string value;
  try {
    nlohmann::json body = nlohmann::json::parse(req.body);
    if (!body.is_object()) {
      return ExecutionResult(Outcome::VALIDATION_FAILED, "Invalid request body: expected a JSON object");
    }
    if (auto it = body.find(field); it != body.end() && !it->is_null()) {
      value = it->get<std::string>();
    }
  } catch (const nlohmann::json::exception& err) {
    spdlog::debug("JSON decoding error: {}", err.what());
    return ExecutionResult(Outcome::VALIDATION_FAILED, std::string("Invalid request body: ") + err.what());
  }
  return func(std::move(value));
}

#endif  // HTTP_UTILS_H_
