#pragma once

#include "wgen_llm/llm.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace wgen::llm {

// Single-consumer request queue in front of one provider. A worker thread
// dispatches one request at a time, starts each request request_delay_ms after
// the previous one returned and retries failed attempts up to max_retries times.
class QueuedModelClient final : public IModelClient {
 public:
  using Observer = std::function<void(const std::string& status)>;

  explicit QueuedModelClient(std::shared_ptr<IHttpTransport> transport);
  ~QueuedModelClient() override;

  QueuedModelClient(const QueuedModelClient&) = delete;
  QueuedModelClient& operator=(const QueuedModelClient&) = delete;

  bool initialize(const ProviderConfig& config, const std::string& credential, std::string& error) override;
  ModelResponse send(const std::string& prompt, const std::string& system_prompt) override;

  // Non-blocking variant of send(); the future resolves on the worker thread.
  std::future<ModelResponse> enqueue(LlmRequest request);

  // Called on the worker thread for dispatch and retry notices.
  void set_observer(Observer observer);

  bool initialized() const;

 private:
  struct Pending {
    LlmRequest request;
    std::promise<ModelResponse> promise;
  };

  void worker_loop();
  ModelResponse dispatch(const LlmRequest& request);
  // Returns false when the client is stopping.
  bool pause_until(std::chrono::steady_clock::time_point deadline);
  void notify(const std::string& status);

  std::shared_ptr<IHttpTransport> transport_;
  std::unique_ptr<ILlmProvider> provider_;
  ProviderConfig config_;
  std::string credential_;
  Observer observer_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Pending> queue_;
  bool stopping_ = false;
  bool has_returned_ = false;
  std::chrono::steady_clock::time_point last_return_{};
  std::thread worker_;
};

} // namespace wgen::llm
