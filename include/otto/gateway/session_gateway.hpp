#pragma once

#include "otto/common/result.hpp"
#include "otto/http/http_client.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace otto::gateway {

struct PromptOptions {
  std::optional<std::string> system_prompt;
  /// Allowlist; each name is sent enabled.
  std::optional<std::vector<std::string>> tools;
  std::optional<std::string> agent;
};

/// A conversational execution backend with durable sessions.
class ISessionGateway {
public:
  virtual ~ISessionGateway() = default;

  /// Returns `existing` when the gateway still knows it, otherwise a freshly created session.
  [[nodiscard]] virtual common::Result<std::string>
  ensure_session(const std::optional<std::string> &existing) = 0;
  /// Sends one user turn and returns the assistant's text reply.
  [[nodiscard]] virtual common::Result<std::string>
  prompt_session(const std::string &session_id, const std::string &text,
                 const PromptOptions &options) = 0;
};

struct ModelSelection {
  std::string provider_id;
  std::string model_id;
};

/// Splits `provider/model`; both halves must be non-empty.
[[nodiscard]] common::Result<ModelSelection> parse_model_ref(const std::string &model);

struct OpencodeGatewayOptions {
  std::string base_url;
  std::uint64_t request_timeout_ms = 30'000;
  std::uint64_t prompt_timeout_ms = 300'000;
  /// `provider/model`; when absent the server's configured default is used.
  std::optional<std::string> model;
  std::optional<std::string> auth_token;
  std::string session_title = "Otto scheduled task";
};

/// ISessionGateway over the OpenCode server HTTP API.
class OpencodeSessionGateway final : public ISessionGateway {
public:
  OpencodeSessionGateway(OpencodeGatewayOptions options, std::shared_ptr<http::HttpClient> http);

  [[nodiscard]] common::Result<std::string>
  ensure_session(const std::optional<std::string> &existing) override;
  [[nodiscard]] common::Result<std::string> prompt_session(const std::string &session_id,
                                                           const std::string &text,
                                                           const PromptOptions &options) override;

private:
  [[nodiscard]] common::Result<ModelSelection> resolve_model();
  [[nodiscard]] http::HeaderMap headers() const;
  [[nodiscard]] std::string url(const std::string &path) const;

  OpencodeGatewayOptions options_;
  std::shared_ptr<http::HttpClient> http_;
  std::optional<ModelSelection> model_;
  std::mutex model_mutex_;
};

/// Joins the `text` parts of a session message reply with newlines.
[[nodiscard]] common::Result<std::string> extract_assistant_text(const std::string &response_body);

} // namespace otto::gateway
