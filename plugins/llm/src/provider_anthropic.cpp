#include "wgen_llm/providers.h"

#include "wgen/json_fields.h"
#include "wgen/log.h"

#include <nlohmann/json.hpp>

namespace wgen::llm {

using json = nlohmann::json;

namespace {
constexpr const char* kApiVersion = "2023-06-01";
} // namespace

HttpRequest AnthropicProvider::build_request(const LlmRequest& request, const ProviderConfig& config,
                                             const std::string& credential) const {
  json body;
  body["model"] = config.model;
  body["max_tokens"] = config.max_tokens;
  body["temperature"] = config.temperature;
  if (!request.system_prompt.empty()) {
    body["system"] = request.system_prompt;
  }
  body["messages"] = json::array({{{"role", "user"}, {"content", request.user_prompt}}});

  HttpRequest http;
  const std::string base = config.base_url.empty() ? "https://api.anthropic.com" : config.base_url;
  http.url = base + "/v1/messages";
  http.headers.emplace_back("x-api-key", credential);
  http.headers.emplace_back("anthropic-version", kApiVersion);
  http.headers.emplace_back("Content-Type", "application/json");
  http.body = body.dump();
  http.timeout_seconds = config.timeout_seconds;
  return http;
}

bool AnthropicProvider::parse_response(const HttpResponse& response, ModelResponse& out) const {
  out.http_status = response.status;
  if (!response.transport_error.empty()) {
    out.error = response.transport_error;
    return false;
  }
  if (response.status < 200 || response.status >= 300) {
    out.error = describe_http_error(response.status, response.body);
    return false;
  }

  const json parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    out.error = "response is not a JSON object";
    return false;
  }
  std::string type;
  if (fields::read(parsed, "type", type) && type == "error") {
    std::string message = "unknown";
    const auto err = parsed.find("error");
    if (err != parsed.end() && (!err->is_object() || !fields::read(*err, "message", message))) {
      message = err->dump();
    }
    out.error = "Anthropic error: " + message;
    return false;
  }
  const auto content = parsed.find("content");
  if (content == parsed.end() || !content->is_array()) {
    out.error = "response has no content blocks";
    return false;
  }
  for (const auto& block : *content) {
    std::string block_type;
    std::string text;
    if (fields::read(block, "type", block_type) && block_type == "text" && fields::read(block, "text", text)) {
      out.content += text;
    }
  }
  if (out.content.empty()) {
    out.error = "response has no text content";
    return false;
  }
  const auto usage = parsed.find("usage");
  if (usage != parsed.end()) {
    int input_tokens = 0;
    int output_tokens = 0;
    if (!fields::read(*usage, "input_tokens", input_tokens) || !fields::read(*usage, "output_tokens", output_tokens)) {
      log::warn("anthropic usage counts are not numbers, token count dropped");
      input_tokens = 0;
      output_tokens = 0;
    }
    out.tokens_used = input_tokens + output_tokens;
  }
  return true;
}

} // namespace wgen::llm
