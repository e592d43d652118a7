#include "wgen_llm/model_client.h"

#include "wgen/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace wgen::llm {

QueuedModelClient::QueuedModelClient(std::shared_ptr<IHttpTransport> transport)
    : transport_(std::move(transport)) {
  worker_ = std::thread([this]() { worker_loop(); });
}

QueuedModelClient::~QueuedModelClient() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  for (auto& item : queue_) {
    ModelResponse resp;
    resp.error = "client shut down";
    item.promise.set_value(resp);
  }
  queue_.clear();
}

bool QueuedModelClient::initialize(const ProviderConfig& config, const std::string& credential,
                                   std::string& error) {
  auto provider = make_provider(config.provider);
  if (!provider) {
    error = "unknown provider: " + config.provider;
    return false;
  }
  if (!transport_) {
    error = "no HTTP transport";
    return false;
  }
  if (credential.empty()) {
    error = "credential missing for provider " + config.provider;
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  provider_ = std::move(provider);
  config_ = config;
  credential_ = credential;
  log::info("model client ready: " + config.provider + " / " + config.model);
  return true;
}

ModelResponse QueuedModelClient::send(const std::string& prompt, const std::string& system_prompt) {
  if (!initialized()) {
    ModelResponse resp;
    resp.error = "model client not initialized";
    return resp;
  }
  return enqueue(LlmRequest{system_prompt, prompt}).get();
}

std::future<ModelResponse> QueuedModelClient::enqueue(LlmRequest request) {
  std::promise<ModelResponse> promise;
  auto future = promise.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      ModelResponse resp;
      resp.error = "client shut down";
      promise.set_value(resp);
      return future;
    }
    queue_.push_back(Pending{std::move(request), std::move(promise)});
  }
  cv_.notify_all();
  return future;
}

void QueuedModelClient::set_observer(Observer observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

bool QueuedModelClient::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return provider_ != nullptr;
}

void QueuedModelClient::worker_loop() {
  for (;;) {
    Pending item;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    ModelResponse response = dispatch(item.request);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      has_returned_ = true;
      last_return_ = std::chrono::steady_clock::now();
    }
    item.promise.set_value(std::move(response));
  }
}

bool QueuedModelClient::pause_until(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_until(lock, deadline, [this]() { return stopping_; });
  return !stopping_;
}

void QueuedModelClient::notify(const std::string& status) {
  Observer observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(status);
  }
}

ModelResponse QueuedModelClient::dispatch(const LlmRequest& request) {
  ModelResponse result;
  ProviderConfig config;
  std::string credential;
  const ILlmProvider* provider = nullptr;
  std::chrono::steady_clock::time_point earliest{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config = config_;
    credential = credential_;
    provider = provider_.get();
    if (has_returned_) {
      earliest = last_return_ + std::chrono::milliseconds(std::max(0, config.request_delay_ms));
    }
  }
  if (!provider) {
    result.error = "model client not initialized";
    return result;
  }

  // The next request starts no sooner than request_delay_ms after the previous
  // one returned. Retries inside one request use retry_delay_ms instead.
  if (earliest > std::chrono::steady_clock::now() && !pause_until(earliest)) {
    result.error = "client shut down";
    return result;
  }

  const int max_attempts = std::max(1, config.max_retries);
  const HttpRequest http = provider->build_request(request, config, credential);
  std::string last_error;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    result.attempts = attempt;
    notify("sending request (attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) + ")");

    const HttpResponse response = transport_->post(http);
    ModelResponse parsed;
    bool accepted = false;
    try {
      accepted = provider->parse_response(response, parsed);
    } catch (const nlohmann::json::exception& e) {
      parsed.error = std::string("unexpected payload shape: ") + e.what();
    }
    if (accepted) {
      result.ok = true;
      result.content = std::move(parsed.content);
      result.tokens_used = parsed.tokens_used;
      result.http_status = parsed.http_status;
      result.error.clear();
      return result;
    }
    last_error = parsed.error.empty() ? "unexpected response" : parsed.error;
    result.http_status = parsed.http_status;

    std::ostringstream oss;
    oss << provider->name() << " attempt " << attempt << "/" << max_attempts << " failed: " << last_error;
    log::warn(oss.str());
    notify(oss.str());

    if (attempt < max_attempts) {
      const auto deadline =
          std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, config.retry_delay_ms));
      if (!pause_until(deadline)) {
        result.error = "client shut down";
        return result;
      }
    }
  }

  result.ok = false;
  result.error = "request failed after " + std::to_string(max_attempts) + " attempts: " + last_error;
  log::error(result.error);
  return result;
}

} // namespace wgen::llm
