#pragma once

#include "otto/common/clock.hpp"
#include "otto/config/schema.hpp"
#include "otto/gateway/session_gateway.hpp"
#include "otto/http/http_client.hpp"
#include "otto/observability/observer.hpp"
#include "otto/outbound/queue.hpp"
#include "otto/persistence/job_store.hpp"

#include <atomic>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace otto::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path db_path() const { return path_ / "otto.db"; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Defaults with the home pointed at the workspace and observability off.
config::Config temp_config(const TempWorkspace &workspace);

/// Settable time source; copies of clock() all observe the same value.
class ManualClock {
public:
  explicit ManualClock(std::int64_t start) : now_(std::make_shared<std::atomic<std::int64_t>>(start)) {}

  [[nodiscard]] common::Clock clock() const {
    auto now = now_;
    return [now]() { return now->load(); };
  }
  [[nodiscard]] std::int64_t now() const { return now_->load(); }
  void set(std::int64_t value) { now_->store(value); }
  void advance(std::int64_t delta_ms) { now_->fetch_add(delta_ms); }

private:
  std::shared_ptr<std::atomic<std::int64_t>> now_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

persistence::Job recurring_job(const std::string &id, const std::string &type,
                               std::int64_t cadence_minutes, std::int64_t next_run_at);
persistence::Job oneshot_job(const std::string &id, const std::string &type,
                             std::int64_t run_at);

/// Inserts a run for an existing job and finishes it 100 ms after `started_at`.
void add_finished_run(persistence::JobStore &jobs, const std::string &run_id,
                      const std::string &job_id, std::int64_t started_at,
                      persistence::RunStatus status,
                      std::optional<std::string> error_message = std::nullopt);

struct RecordedPrompt {
  std::string session_id;
  std::string text;
  gateway::PromptOptions options;
};

/// Replies are handed out in order; an empty queue replies with `default_reply`.
class FakeSessionGateway final : public gateway::ISessionGateway {
public:
  void push_reply(std::string reply);
  void push_error(std::string error);
  void set_session_error(std::string error);
  /// Sessions in this list are reported as gone and replaced on ensure_session.
  void forget_session(const std::string &session_id);

  [[nodiscard]] common::Result<std::string>
  ensure_session(const std::optional<std::string> &existing) override;
  [[nodiscard]] common::Result<std::string> prompt_session(const std::string &session_id,
                                                           const std::string &text,
                                                           const gateway::PromptOptions &options) override;

  std::string default_reply = R"({"status":"success","summary":"done","errors":[]})";
  std::vector<RecordedPrompt> prompts;
  std::size_t sessions_created = 0;

private:
  struct Reply {
    bool ok = true;
    std::string text;
  };
  std::deque<Reply> replies_;
  std::optional<std::string> session_error_;
  std::vector<std::string> forgotten_;
};

struct SentMessage {
  std::int64_t chat_id = 0;
  std::string text;
  std::optional<outbound::FileDelivery> file;
};

class RecordingSender final : public outbound::IOutboundSender {
public:
  [[nodiscard]] common::Status send_text(std::int64_t chat_id, const std::string &text) override;
  [[nodiscard]] common::Status send_file(std::int64_t chat_id,
                                         const outbound::FileDelivery &file) override;

  /// When set, every send fails with this message.
  std::optional<std::string> fail_with;
  std::vector<SentMessage> sent;
  std::size_t attempts = 0;
};

struct RecordedRequest {
  std::string method;
  std::string url;
  http::HeaderMap headers;
  std::string body;
  std::vector<http::MultipartField> fields;
  std::uint64_t timeout_ms = 0;
};

/// Answers by `METHOD url`; unknown routes get a 404.
class FakeHttpClient final : public http::HttpClient {
public:
  void route(const std::string &method, const std::string &url, std::uint16_t status,
             std::string body);
  void route_network_error(const std::string &method, const std::string &url,
                           std::string message);

  [[nodiscard]] http::HttpResponse get(const std::string &url, const http::HeaderMap &headers,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse post_json(const std::string &url,
                                             const http::HeaderMap &headers,
                                             const std::string &body,
                                             std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse post_multipart(const std::string &url,
                                                  const http::HeaderMap &headers,
                                                  const std::vector<http::MultipartField> &fields,
                                                  std::uint64_t timeout_ms) override;

  std::vector<RecordedRequest> requests;

private:
  [[nodiscard]] http::HttpResponse respond(const std::string &method, const std::string &url) const;

  std::vector<std::pair<std::string, http::HttpResponse>> routes_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for the lifetime of the guard.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;

  [[nodiscard]] RecordingObserver &recorder() const { return *recorder_; }

private:
  RecordingObserver *recorder_ = nullptr;
};

/// Redirects std::cerr into a buffer until destroyed.
class StderrCapture {
public:
  StderrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(previous_); }

  StderrCapture(const StderrCapture &) = delete;
  StderrCapture &operator=(const StderrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

} // namespace otto::testing
