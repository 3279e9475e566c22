#include "server.h"

#include <exception>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <coderun/gate.h>
#include <coderun/utils.h>
#include "http_utils.h"

std::string kListenHost = "0.0.0.0";
int kListenPort = 5000;
int kMaxParallel = 8;
std::string kStaticRoot = "";
std::string kAllowedOrigin = "*";
const char kVersionCode[] = "1.0.0";

namespace {

nlohmann::json ApiDescription() {
  return {
    {"name", "coderun"},
    {"version", kVersionCode},
    {"endpoints", {
      {"/api/run", "POST - Execute Python code"},
      {"/api/install", "POST - Install pip package"},
      {"/api/health", "GET - Health check"},
    }},
    {"documentation", "See README.md for usage instructions"},
  };
}

void SendResult(const char* endpoint, const httplib::Request& req, httplib::Response& res,
                const ExecutionResult& result, double start) {
  spdlog::info("{} client={} outcome={} elapsed={:.3f}s", endpoint, req.remote_addr,
               OutcomeToAbr(result.outcome), MonotonicTimestamp() - start);
  SendJSON(res, ResultJSON(result), ResultStatus(result));
}

void Preflight(const httplib::Request&, httplib::Response& res) {
  res.status = http_utils::kNoContent;
}

} // namespace

void SetupServer(httplib::Server& svr, RateLimiter& run_limiter, RateLimiter& install_limiter) {
  using httplib::Request;
  using httplib::Response;

  svr.new_task_queue = [] { return new httplib::ThreadPool(kMaxParallel); };

  if (kStaticRoot.size() && !svr.set_mount_point("/", kStaticRoot)) {
    spdlog::warn("Static root {} is not a directory; serving API description at /", kStaticRoot);
  }

  svr.Post("/api/run", [&run_limiter](const Request& req, Response& res) {
    double start = MonotonicTimestamp();
    ExecutionResult result = WithAdmission(run_limiter, req.remote_addr, [&req]() {
      return WithStringField(req, "code", [](std::string&& code) {
        return RunCode(RunRequest{std::move(code)});
      });
    });
    SendResult("run", req, res, result, start);
  });
  svr.Post("/api/install", [&install_limiter](const Request& req, Response& res) {
    double start = MonotonicTimestamp();
    ExecutionResult result = WithAdmission(install_limiter, req.remote_addr, [&req]() {
      return WithStringField(req, "package", [](std::string&& package) {
        return InstallPackage(InstallRequest{std::move(package)});
      });
    });
    SendResult("install", req, res, result, start);
  });
  svr.Options("/api/run", Preflight);
  svr.Options("/api/install", Preflight);

  svr.Get("/api/health", [](const Request&, Response& res) {
    SendJSON(res, {
      {"status", "healthy"},
      {"python_version", InterpreterVersion()},
      {"timestamp", UnixTimestamp()},
    });
  });
  svr.Get("/", [](const Request&, Response& res) {
    SendJSON(res, ApiDescription());
  });

  svr.set_post_routing_handler([](const Request& req, Response& res) {
    if (!http_utils::IsApiPath(req.path)) return;
    res.set_header("Access-Control-Allow-Origin", kAllowedOrigin);
    res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
  });
  svr.set_exception_handler([](const Request& req, Response& res, std::exception_ptr ep) {
    std::string what = "unknown error";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& err) {
      what = err.what();
    } catch (...) {
      what = "non-standard exception";
    }
    spdlog::warn("Unhandled exception serving {} {}: {}", req.method, req.path, what);
    SendJSON(res, ResultJSON(ExecutionResult(Outcome::INTERNAL_FAULT, "Server error: " + what)),
             http_utils::kInternalServerError);
  });
  svr.set_logger(http_utils::LogRequest);
}

bool ServerWorkLoop() {
  RateLimiter run_limiter(kRunPolicy);
  RateLimiter install_limiter(kInstallPolicy);
  httplib::Server svr;
  SetupServer(svr, run_limiter, install_limiter);
  spdlog::info("Server starting on http://{}:{}", kListenHost, kListenPort);
  if (!svr.listen(kListenHost, kListenPort)) {
    spdlog::error("Failed to listen on {}:{}", kListenHost, kListenPort);
    return false;
  }
  return true;
}
