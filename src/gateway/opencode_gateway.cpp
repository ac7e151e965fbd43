#include "otto/gateway/session_gateway.hpp"

#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

namespace otto::gateway {

namespace {

constexpr std::uint16_t kHttpNotFound = 404;

std::string url_encode_segment(const std::string &value) {
  static const char *kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (const char raw : value) {
    const auto ch = static_cast<unsigned char>(raw);
    if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(raw);
    } else {
      out.push_back('%');
      out.push_back(kHex[ch >> 4U]);
      out.push_back(kHex[ch & 0x0FU]);
    }
  }
  return out;
}

std::optional<std::string> string_member(const std::string &json, const std::string &key) {
  const auto members = common::json_object_members(json);
  if (!members.has_value()) {
    return std::nullopt;
  }
  const auto it = members->find(key);
  if (it == members->end()) {
    return std::nullopt;
  }
  return common::json_as_string(it->second);
}

std::string build_message_body(const ModelSelection &model, const std::string &text,
                               const PromptOptions &options) {
  std::ostringstream body;
  body << "{\"providerID\":" << common::json_quote(model.provider_id)
       << ",\"modelID\":" << common::json_quote(model.model_id);
  if (options.agent.has_value()) {
    body << ",\"agent\":" << common::json_quote(*options.agent);
  }
  if (options.system_prompt.has_value()) {
    body << ",\"system\":" << common::json_quote(*options.system_prompt);
  }
  if (options.tools.has_value()) {
    body << ",\"tools\":{";
    for (std::size_t i = 0; i < options.tools->size(); ++i) {
      if (i > 0) {
        body << ",";
      }
      body << common::json_quote((*options.tools)[i]) << ":true";
    }
    body << "}";
  }
  body << ",\"parts\":[{\"type\":\"text\",\"text\":" << common::json_quote(text) << "}]}";
  return body.str();
}

} // namespace

common::Result<ModelSelection> parse_model_ref(const std::string &model) {
  const auto slash = model.find('/');
  if (slash == std::string::npos || slash == 0 || slash == model.size() - 1) {
    return common::Result<ModelSelection>::failure(
        "model must be in provider/model format, received: " + model);
  }
  return common::Result<ModelSelection>::success(
      ModelSelection{model.substr(0, slash), model.substr(slash + 1)});
}

common::Result<std::string> extract_assistant_text(const std::string &response_body) {
  const auto members = common::json_object_members(response_body);
  if (!members.has_value()) {
    return common::Result<std::string>::failure("session message response is not a JSON object");
  }

  std::vector<std::string> texts;
  const auto parts_it = members->find("parts");
  if (parts_it != members->end()) {
    const auto parts = common::json_array_elements(parts_it->second);
    if (!parts.has_value()) {
      return common::Result<std::string>::failure("session message parts must be an array");
    }
    for (const auto &part : *parts) {
      if (string_member(part, "type").value_or("") != "text") {
        continue;
      }
      texts.push_back(string_member(part, "text").value_or(""));
    }
  }
  return common::Result<std::string>::success(common::join(texts, "\n"));
}

OpencodeSessionGateway::OpencodeSessionGateway(OpencodeGatewayOptions options,
                                               std::shared_ptr<http::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

http::HeaderMap OpencodeSessionGateway::headers() const {
  http::HeaderMap headers{{"Accept", "application/json"}};
  if (options_.auth_token.has_value() && !options_.auth_token->empty()) {
    headers["Authorization"] = "Bearer " + *options_.auth_token;
  }
  return headers;
}

std::string OpencodeSessionGateway::url(const std::string &path) const {
  return options_.base_url + path;
}

common::Result<std::string>
OpencodeSessionGateway::ensure_session(const std::optional<std::string> &existing) {
  if (existing.has_value() && !existing->empty()) {
    const auto response = http_->get(url("/session/" + url_encode_segment(*existing)), headers(),
                                     options_.request_timeout_ms);
    if (response.is_success()) {
      return common::Result<std::string>::success(*existing);
    }
    if (response.network_error || response.status != kHttpNotFound) {
      return common::Result<std::string>::failure("session lookup failed: " +
                                                  http::describe_failure(response));
    }
  }

  const std::string body = "{\"title\":" + common::json_quote(options_.session_title) + "}";
  const auto response =
      http_->post_json(url("/session"), headers(), body, options_.request_timeout_ms);
  if (!response.is_success()) {
    return common::Result<std::string>::failure("session creation failed: " +
                                                http::describe_failure(response));
  }
  const auto id = string_member(response.body, "id");
  if (!id.has_value() || id->empty()) {
    return common::Result<std::string>::failure("session creation did not return a session id");
  }
  return common::Result<std::string>::success(*id);
}

common::Result<ModelSelection> OpencodeSessionGateway::resolve_model() {
  std::lock_guard<std::mutex> lock(model_mutex_);
  if (model_.has_value()) {
    return common::Result<ModelSelection>::success(*model_);
  }

  std::string model_ref;
  if (options_.model.has_value()) {
    model_ref = *options_.model;
  } else {
    const auto response = http_->get(url("/config"), headers(), options_.request_timeout_ms);
    if (!response.is_success()) {
      return common::Result<ModelSelection>::failure("config lookup failed: " +
                                                     http::describe_failure(response));
    }
    const auto configured = string_member(response.body, "model");
    if (!configured.has_value() || configured->empty()) {
      return common::Result<ModelSelection>::failure("gateway config is missing a default model");
    }
    model_ref = *configured;
  }

  auto parsed = parse_model_ref(model_ref);
  if (parsed.ok()) {
    model_ = parsed.value();
  }
  return parsed;
}

common::Result<std::string> OpencodeSessionGateway::prompt_session(const std::string &session_id,
                                                                   const std::string &text,
                                                                   const PromptOptions &options) {
  const auto model = resolve_model();
  if (!model.ok()) {
    return common::Result<std::string>::failure(model.error());
  }

  std::cerr << "[gateway] prompt session=" << session_id
            << " provider=" << model.value().provider_id << " model=" << model.value().model_id
            << "\n";

  const auto response =
      http_->post_json(url("/session/" + url_encode_segment(session_id) + "/message"), headers(),
                       build_message_body(model.value(), text, options),
                       options_.prompt_timeout_ms);
  if (!response.is_success()) {
    return common::Result<std::string>::failure("session prompt failed: " +
                                                http::describe_failure(response));
  }
  return extract_assistant_text(response.body);
}

} // namespace otto::gateway
