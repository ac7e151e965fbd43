#include "tests/helpers/test_helpers.hpp"

#include "otto/observability/global.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace otto::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("otto-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  config::Config config;
  config.home = workspace.path().string();
  config.observability.backend = "none";
  config.scheduler.tick_ms = 1'000;
  config.scheduler.lock_lease_ms = 90'000;
  return config;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

persistence::Job recurring_job(const std::string &id, const std::string &type,
                               const std::int64_t cadence_minutes, const std::int64_t next_run_at) {
  persistence::Job job;
  job.id = id;
  job.type = type;
  job.schedule_type = persistence::ScheduleType::Recurring;
  job.cadence_minutes = cadence_minutes;
  job.next_run_at = next_run_at;
  job.created_at = next_run_at;
  job.updated_at = next_run_at;
  return job;
}

persistence::Job oneshot_job(const std::string &id, const std::string &type,
                             const std::int64_t run_at) {
  persistence::Job job;
  job.id = id;
  job.type = type;
  job.schedule_type = persistence::ScheduleType::Oneshot;
  job.run_at = run_at;
  job.next_run_at = run_at;
  job.created_at = run_at;
  job.updated_at = run_at;
  return job;
}

void add_finished_run(persistence::JobStore &jobs, const std::string &run_id,
                      const std::string &job_id, const std::int64_t started_at,
                      const persistence::RunStatus status,
                      std::optional<std::string> error_message) {
  persistence::JobRun run;
  run.id = run_id;
  run.job_id = job_id;
  run.started_at = started_at;
  run.created_at = started_at;
  if (!jobs.insert_run(run).ok()) {
    throw std::runtime_error("insert run " + run_id);
  }
  const bool failed = status == persistence::RunStatus::Failed;
  const auto finished = jobs.mark_run_finished(
      run_id, persistence::RunCompletion{
                  .finished_at = started_at + 100,
                  .status = status,
                  .error_code = failed ? std::optional<std::string>("task_failed") : std::nullopt,
                  .error_message = std::move(error_message),
                  .result_json = std::nullopt,
              });
  if (!finished.ok()) {
    throw std::runtime_error("finish run " + run_id + ": " + finished.error());
  }
}

void FakeSessionGateway::push_reply(std::string reply) {
  replies_.push_back(Reply{true, std::move(reply)});
}

void FakeSessionGateway::push_error(std::string error) {
  replies_.push_back(Reply{false, std::move(error)});
}

void FakeSessionGateway::set_session_error(std::string error) { session_error_ = std::move(error); }

void FakeSessionGateway::forget_session(const std::string &session_id) {
  forgotten_.push_back(session_id);
}

common::Result<std::string>
FakeSessionGateway::ensure_session(const std::optional<std::string> &existing) {
  if (session_error_.has_value()) {
    return common::Result<std::string>::failure(*session_error_);
  }
  if (existing.has_value() &&
      std::find(forgotten_.begin(), forgotten_.end(), *existing) == forgotten_.end()) {
    return common::Result<std::string>::success(*existing);
  }
  ++sessions_created;
  return common::Result<std::string>::success("session-" + std::to_string(sessions_created));
}

common::Result<std::string> FakeSessionGateway::prompt_session(const std::string &session_id,
                                                               const std::string &text,
                                                               const gateway::PromptOptions &options) {
  prompts.push_back(RecordedPrompt{session_id, text, options});
  if (replies_.empty()) {
    return common::Result<std::string>::success(default_reply);
  }
  Reply reply = replies_.front();
  replies_.pop_front();
  if (!reply.ok) {
    return common::Result<std::string>::failure(reply.text);
  }
  return common::Result<std::string>::success(reply.text);
}

common::Status RecordingSender::send_text(const std::int64_t chat_id, const std::string &text) {
  ++attempts;
  if (fail_with.has_value()) {
    return common::Status::error(*fail_with);
  }
  sent.push_back(SentMessage{chat_id, text, std::nullopt});
  return common::Status::success();
}

common::Status RecordingSender::send_file(const std::int64_t chat_id,
                                          const outbound::FileDelivery &file) {
  ++attempts;
  if (fail_with.has_value()) {
    return common::Status::error(*fail_with);
  }
  sent.push_back(SentMessage{chat_id, file.caption, file});
  return common::Status::success();
}

void FakeHttpClient::route(const std::string &method, const std::string &url,
                           const std::uint16_t status, std::string body) {
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  routes_.emplace_back(method + " " + url, std::move(response));
}

void FakeHttpClient::route_network_error(const std::string &method, const std::string &url,
                                         std::string message) {
  http::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  routes_.emplace_back(method + " " + url, std::move(response));
}

http::HttpResponse FakeHttpClient::respond(const std::string &method,
                                           const std::string &url) const {
  const std::string key = method + " " + url;
  for (auto it = routes_.rbegin(); it != routes_.rend(); ++it) {
    if (it->first == key) {
      return it->second;
    }
  }
  http::HttpResponse missing;
  missing.status = 404;
  missing.body = R"({"error":"not found"})";
  return missing;
}

http::HttpResponse FakeHttpClient::get(const std::string &url, const http::HeaderMap &headers,
                                       const std::uint64_t timeout_ms) {
  requests.push_back(RecordedRequest{"GET", url, headers, "", {}, timeout_ms});
  return respond("GET", url);
}

http::HttpResponse FakeHttpClient::post_json(const std::string &url,
                                             const http::HeaderMap &headers,
                                             const std::string &body,
                                             const std::uint64_t timeout_ms) {
  requests.push_back(RecordedRequest{"POST", url, headers, body, {}, timeout_ms});
  return respond("POST", url);
}

http::HttpResponse FakeHttpClient::post_multipart(const std::string &url,
                                                  const http::HeaderMap &headers,
                                                  const std::vector<http::MultipartField> &fields,
                                                  const std::uint64_t timeout_ms) {
  requests.push_back(RecordedRequest{"POST", url, headers, "", fields, timeout_ms});
  return respond("POST", url);
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverGuard::ObserverGuard() {
  auto observer = std::make_unique<RecordingObserver>();
  recorder_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverGuard::~ObserverGuard() { observability::set_global_observer(nullptr); }

} // namespace otto::testing
