#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Retrying client of the platform's internal API

#include <chrono>
#include <thread>
#include <memory>
#include <string>
#include <optional>
#include <functional>
#include <httplib.h>
#include <spdlog/spdlog.h>

#define ENUM_VERB_ \
  X(GET, Get) \
  X(POST, Post) \
  X(PUT, Put)
enum class Verb {
#define X(name, func) name,
  ENUM_VERB_
#undef X
};

namespace http_utils {

const char* VerbName(Verb);
bool IsSuccess(int code);
// client errors other than timeouts and throttling are not retried
bool IsFinal(int code);
std::string EncodePath(const std::string& str, bool keep_slash);
std::string DescribeResult(const httplib::Result& res);

} // namespace http_utils

class ApiClient {
  std::string base_url_, key_;
  int attempts_;
  std::chrono::milliseconds pause_;

  httplib::Headers Headers_() const {
    return {{"Authorization", "Bearer " + key_}};
  }

  // attempt(cli, headers) issues one request
  template <class Attempt>
  httplib::Result Retry_(Verb verb, const std::string& endpoint, Attempt&& attempt) {
    std::unique_ptr<httplib::Result> last_res;
    for (int i = 0; i < attempts_; i++) {
      httplib::Client cli(base_url_);
      spdlog::debug("{} {} attempt {}", http_utils::VerbName(verb), endpoint, i + 1);
      last_res = std::make_unique<httplib::Result>(attempt(cli, Headers_()));
      if (*last_res && (http_utils::IsSuccess((*last_res)->status) ||
                        http_utils::IsFinal((*last_res)->status))) {
        return std::move(*last_res);
      }
      spdlog::debug("{} {}: {}", http_utils::VerbName(verb), endpoint,
                    http_utils::DescribeResult(*last_res));
      if (i + 1 < attempts_) std::this_thread::sleep_for(pause_);
    }
    spdlog::warn("{} {} failed after {} attempts", http_utils::VerbName(verb), endpoint, attempts_);
    return std::move(*last_res);
  }

  // false on 404 when missing_ok; StorageError on other failures
  bool Check_(Verb verb, const std::string& endpoint, const httplib::Result& res, bool missing_ok);

 public:
  ApiClient(const std::string& base_url, const std::string& key, int attempts = 5,
            std::chrono::milliseconds pause = std::chrono::seconds(1));

  // nullopt on 404
  std::optional<std::string> Get(const std::string& endpoint);
  // reset runs before every attempt; false on 404
  bool Stream(const std::string& endpoint, const std::function<void()>& reset,
              httplib::ResponseHandler on_response, httplib::ContentReceiver receiver);
  void Send(Verb verb, const std::string& endpoint, const std::string& body,
            const std::string& content_type);
};

#endif  // HTTP_UTILS_H_
