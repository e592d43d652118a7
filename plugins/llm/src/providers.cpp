#include "wgen_llm/providers.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace wgen::llm {

std::unique_ptr<ILlmProvider> make_provider(const std::string& name) {
  if (name == "openai") {
    return std::make_unique<OpenAiProvider>();
  }
  if (name == "anthropic" || name == "claude") {
    return std::make_unique<AnthropicProvider>();
  }
  return nullptr;
}

std::string describe_http_error(int status, const std::string& body) {
  std::ostringstream oss;
  if (status == 401 || status == 403) {
    oss << "authentication failed (HTTP " << status << ")";
  } else if (status == 429) {
    oss << "rate limit or quota exceeded (HTTP 429)";
  } else if (status == 400) {
    oss << "invalid request (HTTP 400)";
  } else if (status >= 500) {
    oss << "provider unavailable (HTTP " << status << ")";
  } else {
    oss << "http error (" << status << ")";
  }
  const auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
    const auto& err = parsed["error"];
    std::string message;
    if (err.is_object()) {
      message = err.value("message", "");
    } else if (err.is_string()) {
      message = err.get<std::string>();
    }
    if (!message.empty()) {
      oss << ": " << message;
    }
  } else {
    const std::string excerpt = body.substr(0, 200);
    if (!excerpt.empty()) {
      oss << ": " << excerpt;
    }
  }
  return oss.str();
}

} // namespace wgen::llm
