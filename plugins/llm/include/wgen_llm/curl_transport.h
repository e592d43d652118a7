#pragma once

#include "wgen_llm/llm.h"

namespace wgen::llm {

// Blocking HTTPS POST over libcurl's easy interface.
class CurlHttpTransport final : public IHttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse post(const HttpRequest& request) override;
};

} // namespace wgen::llm
