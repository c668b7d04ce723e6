#include "regbot_http_client.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace regbot {

// Callback for curl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

void HttpClient::GlobalInit() {
  CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    LOG_ERROR("HttpClient", "curl_global_init failed: " + std::string(curl_easy_strerror(rc)));
  }
}

void HttpClient::GlobalCleanup() {
  curl_global_cleanup();
}

HttpClient::HttpClient(const HttpClientOptions& options)
    : options_(options) {
  if (options_.share_cookies) {
    share_ = curl_share_init();
    if (share_) {
      curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &HttpClient::LockShare);
      curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &HttpClient::UnlockShare);
      curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    } else {
      LOG_WARN("HttpClient", "curl_share_init failed, cookies will not persist between requests");
    }
  }
}

HttpClient::~HttpClient() {
  if (share_) {
    curl_share_cleanup(share_);
  }
}

std::mutex* HttpClient::MutexFor(curl_lock_data data) {
  switch (data) {
    case CURL_LOCK_DATA_COOKIE:      return &cookie_mutex_;
    case CURL_LOCK_DATA_DNS:         return &dns_mutex_;
    case CURL_LOCK_DATA_SSL_SESSION: return &ssl_mutex_;
    default:                         return nullptr;
  }
}

void HttpClient::LockShare(CURL* /*handle*/, curl_lock_data data,
                           curl_lock_access /*access*/, void* userptr) {
  std::mutex* m = static_cast<HttpClient*>(userptr)->MutexFor(data);
  if (m) m->lock();
}

void HttpClient::UnlockShare(CURL* /*handle*/, curl_lock_data data, void* userptr) {
  std::mutex* m = static_cast<HttpClient*>(userptr)->MutexFor(data);
  if (m) m->unlock();
}

std::string HttpClient::UrlEncode(const std::string& value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string HttpClient::BuildQuery(const HttpParams& params) {
  std::string query;
  for (const auto& [key, value] : params) {
    if (!query.empty()) query.push_back('&');
    query += UrlEncode(key);
    query.push_back('=');
    query += UrlEncode(value);
  }
  return query;
}

HttpResponse HttpClient::Perform(Method method, const std::string& url,
                                 const HttpParams& params, const HttpFilePart* file) {
  HttpResponse response;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  std::string full_url = url;
  std::string post_body;
  curl_mime* mime = nullptr;

  if (method == Method::GET && !params.empty()) {
    full_url += (url.find('?') == std::string::npos ? "?" : "&") + BuildQuery(params);
  }

  curl_easy_setopt(curl, CURLOPT_URL, full_url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_sec));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required for multi-threaded use
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  if (share_) {
    curl_easy_setopt(curl, CURLOPT_SHARE, share_);
    curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");  // Enable the cookie engine
  }

  if (method == Method::POST_FORM) {
    post_body = BuildQuery(params);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body.size()));
  } else if (method == Method::POST_MULTIPART && file) {
    mime = curl_mime_init(curl);
    for (const auto& [key, value] : params) {
      curl_mimepart* part = curl_mime_addpart(mime);
      curl_mime_name(part, key.c_str());
      curl_mime_data(part, value.c_str(), value.size());
    }
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, file->field_name.c_str());
    curl_mime_filename(part, file->file_name.c_str());
    curl_mime_type(part, file->content_type.c_str());
    curl_mime_data(part, reinterpret_cast<const char*>(file->data.data()), file->data.size());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  }

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    response.error = curl_easy_strerror(res);
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* content_type = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
      response.content_type = content_type;
    }
    response.success = response.status_code >= 200 && response.status_code < 300;
    if (!response.success) {
      response.error = "HTTP " + std::to_string(response.status_code);
    }
  }

  if (mime) {
    curl_mime_free(mime);
  }
  curl_easy_cleanup(curl);
  return response;
}

HttpResponse HttpClient::Get(const std::string& url, const HttpParams& params) {
  return Perform(Method::GET, url, params, nullptr);
}

HttpResponse HttpClient::PostForm(const std::string& url, const HttpParams& fields) {
  return Perform(Method::POST_FORM, url, fields, nullptr);
}

HttpResponse HttpClient::PostMultipart(const std::string& url,
                                       const HttpParams& fields,
                                       const HttpFilePart& file) {
  return Perform(Method::POST_MULTIPART, url, fields, &file);
}

HttpResponse HttpClient::GetWithRetry(const std::string& url, const HttpParams& params) {
  int tries = std::max(1, options_.max_tries);
  int delay_ms = options_.backoff_min_ms;
  HttpResponse response;

  for (int attempt = 1; attempt <= tries; ++attempt) {
    response = Get(url, params);
    if (response.success) {
      return response;
    }

    LOG_WARN("HttpClient", "GET " + url + " failed (" + response.error + "), attempt " +
             std::to_string(attempt) + "/" + std::to_string(tries));

    if (attempt < tries) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      delay_ms = std::min(delay_ms * 2, options_.backoff_max_ms);
    }
  }

  throw NetworkError("GET " + url + " failed after " + std::to_string(tries) +
                     " attempts: " + response.error);
}

}  // namespace regbot
