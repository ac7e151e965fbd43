#pragma once

#include "otto/http/http_client.hpp"
#include "otto/outbound/queue.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace otto::outbound {

struct TelegramSenderOptions {
  std::string bot_token;
  std::string api_base_url = "https://api.telegram.org";
  std::uint64_t timeout_ms = 30'000;
};

/// IOutboundSender over the Telegram Bot API.
class TelegramSender final : public IOutboundSender {
public:
  TelegramSender(TelegramSenderOptions options, std::shared_ptr<http::HttpClient> http);

  [[nodiscard]] common::Status send_text(std::int64_t chat_id, const std::string &text) override;
  [[nodiscard]] common::Status send_file(std::int64_t chat_id, const FileDelivery &file) override;

private:
  [[nodiscard]] std::string method_url(const std::string &method) const;

  TelegramSenderOptions options_;
  std::shared_ptr<http::HttpClient> http_;
};

/// A Bot API reply counts as delivered only with a 2xx status and `"ok": true`.
[[nodiscard]] common::Status check_telegram_response(const std::string &method,
                                                     const http::HttpResponse &response);

} // namespace otto::outbound
