#pragma once

#include "wgen_llm/llm.h"

#include <string>

namespace wgen::llm {

class OpenAiProvider final : public ILlmProvider {
 public:
  const char* name() const override { return "openai"; }
  HttpRequest build_request(const LlmRequest& request, const ProviderConfig& config,
                            const std::string& credential) const override;
  bool parse_response(const HttpResponse& response, ModelResponse& out) const override;
};

class AnthropicProvider final : public ILlmProvider {
 public:
  const char* name() const override { return "anthropic"; }
  HttpRequest build_request(const LlmRequest& request, const ProviderConfig& config,
                            const std::string& credential) const override;
  bool parse_response(const HttpResponse& response, ModelResponse& out) const override;
};

// Status-specific message for a non-2xx reply, with the provider's
// error.message appended when the body carries one.
std::string describe_http_error(int status, const std::string& body);

} // namespace wgen::llm
