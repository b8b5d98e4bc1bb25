#include "http_utils.h"

#include <cctype>
#include <fmt/core.h>
#include <arbiter/errors.h>

namespace http_utils {

const char* VerbName(Verb verb) {
  switch (verb) {
#define X(name, func) case Verb::name: return #name;
    ENUM_VERB_
#undef X
  }
  __builtin_unreachable();
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

bool IsFinal(int code) {
  return code >= 400 && code < 500 && code != 408 && code != 429;
}

std::string EncodePath(const std::string& str, bool keep_slash) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string ret;
  for (unsigned char c : str) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
      ret += c;
    } else {
      ret += '%';
      ret += kHex[c >> 4];
      ret += kHex[c & 15];
    }
  }
  return ret;
}

std::string DescribeResult(const httplib::Result& res) {
  if (!res) return httplib::to_string(res.error());
  return fmt::format("status {}", res->status);
}

} // namespace http_utils

ApiClient::ApiClient(const std::string& base_url, const std::string& key, int attempts,
                     std::chrono::milliseconds pause) :
    base_url_(base_url), key_(key), attempts_(attempts), pause_(pause) {}

bool ApiClient::Check_(Verb verb, const std::string& endpoint, const httplib::Result& res,
                       bool missing_ok) {
  if (res && res->status == 404 && missing_ok) return false;
  if (!res || !http_utils::IsSuccess(res->status)) {
    throw StorageError(fmt::format("{} {} failed: {}", http_utils::VerbName(verb), endpoint,
                                   http_utils::DescribeResult(res)));
  }
  return true;
}

std::optional<std::string> ApiClient::Get(const std::string& endpoint) {
  auto res = Retry_(Verb::GET, endpoint, [&](httplib::Client& cli, const httplib::Headers& headers) {
    return cli.Get(endpoint, headers);
  });
  if (!Check_(Verb::GET, endpoint, res, true)) return std::nullopt;
  return std::move(res->body);
}

bool ApiClient::Stream(const std::string& endpoint, const std::function<void()>& reset,
                       httplib::ResponseHandler on_response, httplib::ContentReceiver receiver) {
  auto res = Retry_(Verb::GET, endpoint, [&](httplib::Client& cli, const httplib::Headers& headers) {
    reset();
    return cli.Get(endpoint, headers, on_response, receiver);
  });
  return Check_(Verb::GET, endpoint, res, true);
}

void ApiClient::Send(Verb verb, const std::string& endpoint, const std::string& body,
                     const std::string& content_type) {
  auto res = Retry_(verb, endpoint, [&](httplib::Client& cli, const httplib::Headers& headers) {
    if (verb == Verb::PUT) return cli.Put(endpoint, headers, body, content_type);
    return cli.Post(endpoint, headers, body, content_type);
  });
  Check_(verb, endpoint, res, false);
}
