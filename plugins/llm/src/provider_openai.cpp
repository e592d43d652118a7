#include "wgen_llm/providers.h"

#include "wgen/json_fields.h"
#include "wgen/log.h"

#include <nlohmann/json.hpp>

namespace wgen::llm {

using json = nlohmann::json;

HttpRequest OpenAiProvider::build_request(const LlmRequest& request, const ProviderConfig& config,
                                          const std::string& credential) const {
  json body;
  body["model"] = config.model;
  body["temperature"] = config.temperature;
  body["max_tokens"] = config.max_tokens;
  body["messages"] = json::array();
  if (!request.system_prompt.empty()) {
    body["messages"].push_back({{"role", "system"}, {"content", request.system_prompt}});
  }
  body["messages"].push_back({{"role", "user"}, {"content", request.user_prompt}});

  HttpRequest http;
  const std::string base = config.base_url.empty() ? "https://api.openai.com" : config.base_url;
  http.url = base + "/v1/chat/completions";
  http.headers.emplace_back("Authorization", "Bearer " + credential);
  http.headers.emplace_back("Content-Type", "application/json");
  http.body = body.dump();
  http.timeout_seconds = config.timeout_seconds;
  return http;
}

bool OpenAiProvider::parse_response(const HttpResponse& response, ModelResponse& out) const {
  out.http_status = response.status;
  if (!response.transport_error.empty()) {
    out.error = response.transport_error;
    return false;
  }
  if (response.status < 200 || response.status >= 300) {
    out.error = describe_http_error(response.status, response.body);
    return false;
  }
  if (response.body.empty()) {
    out.error = "empty response body";
    return false;
  }

  const json parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    out.error = "response is not a JSON object";
    return false;
  }
  if (parsed.contains("error") && !parsed["error"].is_null()) {
    const auto& err = parsed["error"];
    std::string message = "unknown";
    if (!err.is_object() || !fields::read(err, "message", message)) {
      message = err.dump();
    }
    out.error = "OpenAI error: " + message;
    return false;
  }
  const auto choices = parsed.find("choices");
  if (choices == parsed.end() || !choices->is_array() || choices->empty()) {
    out.error = "response has no choices";
    return false;
  }
  const json& choice = (*choices)[0];
  const auto message = choice.is_object() ? choice.find("message") : choice.end();
  if (!choice.is_object() || message == choice.end() || !message->is_object() || !message->contains("content") ||
      !(*message)["content"].is_string()) {
    out.error = "response choice has no message content";
    return false;
  }
  out.content = (*message)["content"].get<std::string>();
  if (out.content.empty()) {
    out.error = "response content is empty";
    return false;
  }
  const auto usage = parsed.find("usage");
  if (usage != parsed.end() && !fields::read(*usage, "total_tokens", out.tokens_used)) {
    log::warn("openai usage.total_tokens is not a number, token count dropped");
    out.tokens_used = 0;
  }
  return true;
}

} // namespace wgen::llm
