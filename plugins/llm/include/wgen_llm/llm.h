#pragma once

#include "wgen/world_types.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wgen::llm {

struct LlmRequest {
  std::string system_prompt;
  std::string user_prompt;
};

struct ModelResponse {
  bool ok = false;
  std::string content;
  int tokens_used = 0;
  std::string error;
  int attempts = 0;
  int http_status = 0;
};

// Send() blocks the caller until the response (or a terminal error) is known.
class IModelClient {
 public:
  virtual ~IModelClient() = default;
  virtual bool initialize(const ProviderConfig& config, const std::string& credential, std::string& error) = 0;
  virtual ModelResponse send(const std::string& prompt, const std::string& system_prompt) = 0;
};

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  int timeout_seconds = 120;
};

struct HttpResponse {
  int status = 0;
  std::string body;
  // Set when no HTTP exchange happened (DNS, TLS, timeout, ...).
  std::string transport_error;
};

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse post(const HttpRequest& request) = 0;
};

// One implementation per provider API. Queueing, rate limiting and retries
// live in the client and are shared by every provider.
class ILlmProvider {
 public:
  virtual ~ILlmProvider() = default;
  virtual const char* name() const = 0;
  virtual HttpRequest build_request(const LlmRequest& request, const ProviderConfig& config,
                                    const std::string& credential) const = 0;
  // Fills content/tokens_used on success, error otherwise.
  virtual bool parse_response(const HttpResponse& response, ModelResponse& out) const = 0;
};

// "openai" or "anthropic"; nullptr for anything else.
std::unique_ptr<ILlmProvider> make_provider(const std::string& name);

} // namespace wgen::llm
