#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <curl/curl.h>

namespace regbot {

using HttpParams = std::vector<std::pair<std::string, std::string>>;

// Transport failure that survived the bounded retry
class NetworkError : public std::runtime_error {
public:
  explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpResponse {
  bool success = false;     // transport ok and 2xx status
  long status_code = 0;
  std::string body;         // raw bytes
  std::string content_type;
  std::string error;        // curl or HTTP error description
};

struct HttpFilePart {
  std::string field_name;
  std::string file_name;
  std::string content_type;
  std::vector<uint8_t> data;
};

struct HttpClientOptions {
  int timeout_sec = 30;
  int max_tries = 3;
  int backoff_min_ms = 1000;
  int backoff_max_ms = 10000;
  std::string user_agent =
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/124 Safari/537.36";
  bool share_cookies = true;  // one cookie jar across all requests of this client
};

/**
 * HttpClient - libcurl wrapper used by the site gateway, the solver and the bot
 *
 * Every request uses its own easy handle, so a client may be used from several
 * threads at once. Cookies live in a curl share handle owned by the client,
 * whose lock callbacks serialise access. One client is one site session.
 */
class HttpClient {
public:
  explicit HttpClient(const HttpClientOptions& options = HttpClientOptions());
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Process-wide curl init/cleanup, call once from main
  static void GlobalInit();
  static void GlobalCleanup();

  // Single attempt requests, never throw
  HttpResponse Get(const std::string& url, const HttpParams& params = HttpParams());
  HttpResponse PostForm(const std::string& url, const HttpParams& fields);
  HttpResponse PostMultipart(const std::string& url,
                             const HttpParams& fields,
                             const HttpFilePart& file);

  // GET with bounded exponential backoff on transport errors and non-2xx
  // statuses. Throws NetworkError after the last attempt.
  HttpResponse GetWithRetry(const std::string& url, const HttpParams& params = HttpParams());

  const HttpClientOptions& GetOptions() const { return options_; }

  // application/x-www-form-urlencoded encoding of params
  static std::string BuildQuery(const HttpParams& params);
  static std::string UrlEncode(const std::string& value);

private:
  enum class Method { GET, POST_FORM, POST_MULTIPART };

  HttpResponse Perform(Method method, const std::string& url,
                       const HttpParams& params, const HttpFilePart* file);

  static void LockShare(CURL* handle, curl_lock_data data,
                        curl_lock_access access, void* userptr);
  static void UnlockShare(CURL* handle, curl_lock_data data, void* userptr);
  std::mutex* MutexFor(curl_lock_data data);

  HttpClientOptions options_;
  CURLSH* share_ = nullptr;
  std::mutex cookie_mutex_;
  std::mutex dns_mutex_;
  std::mutex ssl_mutex_;
};

}  // namespace regbot
