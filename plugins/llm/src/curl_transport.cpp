#include "wgen_llm/curl_transport.h"

#include <curl/curl.h>

namespace wgen::llm {

CurlHttpTransport::CurlHttpTransport() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpTransport::~CurlHttpTransport() {
  curl_global_cleanup();
}

HttpResponse CurlHttpTransport::post(const HttpRequest& request) {
  HttpResponse response;
  CURL* curl = curl_easy_init();
  if (!curl) {
    response.transport_error = "curl init failed";
    return response;
  }

  struct curl_slist* headers = nullptr;
  for (const auto& header : request.headers) {
    const std::string line = header.first + ": " + header.second;
    headers = curl_slist_append(headers, line.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION,
                   +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                     auto* out = static_cast<std::string*>(userdata);
                     out->append(ptr, size * nmemb);
                     return size * nmemb;
                   });
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  response.status = static_cast<int>(status);
  if (res != CURLE_OK) {
    response.transport_error = std::string("curl error: ") + curl_easy_strerror(res);
  }
  return response;
}

} // namespace wgen::llm
