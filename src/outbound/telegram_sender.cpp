#include "otto/outbound/telegram_sender.hpp"

#include "otto/common/json_util.hpp"

#include <filesystem>

namespace otto::outbound {

common::Status check_telegram_response(const std::string &method,
                                       const http::HttpResponse &response) {
  if (!response.is_success()) {
    return common::Status::error("telegram " + method + " failed: " +
                                 http::describe_failure(response));
  }

  const auto members = common::json_object_members(response.body);
  if (!members.has_value()) {
    return common::Status::error("telegram " + method + " returned a non-JSON body");
  }
  const auto ok_it = members->find("ok");
  if (ok_it == members->end() || common::json_as_bool(ok_it->second) != true) {
    std::string description = "unknown error";
    if (const auto it = members->find("description"); it != members->end()) {
      description = common::json_as_string(it->second).value_or(description);
    }
    return common::Status::error("telegram " + method + " rejected: " + description);
  }
  return common::Status::success();
}

TelegramSender::TelegramSender(TelegramSenderOptions options, std::shared_ptr<http::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {
  while (!options_.api_base_url.empty() && options_.api_base_url.back() == '/') {
    options_.api_base_url.pop_back();
  }
}

std::string TelegramSender::method_url(const std::string &method) const {
  return options_.api_base_url + "/bot" + options_.bot_token + "/" + method;
}

common::Status TelegramSender::send_text(const std::int64_t chat_id, const std::string &text) {
  const std::string body = "{\"chat_id\":" + std::to_string(chat_id) +
                           ",\"text\":" + common::json_quote(text) + "}";
  const auto response = http_->post_json(method_url("sendMessage"), {}, body, options_.timeout_ms);
  return check_telegram_response("sendMessage", response);
}

common::Status TelegramSender::send_file(const std::int64_t chat_id, const FileDelivery &file) {
  const bool photo = file.kind == persistence::MessageKind::Photo;
  const std::string method = photo ? "sendPhoto" : "sendDocument";

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file.file_path, ec)) {
    return common::Status::error("telegram " + method + ": file not found: " + file.file_path);
  }

  std::vector<http::MultipartField> fields;
  fields.push_back(http::MultipartField{.name = "chat_id", .value = std::to_string(chat_id)});
  http::MultipartField upload;
  upload.name = photo ? "photo" : "document";
  upload.file_path = file.file_path;
  upload.filename = file.filename.has_value()
                        ? file.filename
                        : std::optional<std::string>(
                              std::filesystem::path(file.file_path).filename().string());
  upload.content_type = file.mime_type;
  fields.push_back(std::move(upload));
  if (!file.caption.empty()) {
    fields.push_back(http::MultipartField{.name = "caption", .value = file.caption});
  }

  const auto response = http_->post_multipart(method_url(method), {}, fields, options_.timeout_ms);
  return check_telegram_response(method, response);
}

} // namespace otto::outbound
