#ifndef SANDCELL_HTTP_UTILS_H_
#define SANDCELL_HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <utility>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

} // namespace http_utils

bool IsSuccess(const httplib::Result& res);

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPDelete {
  constexpr static char method_name[] = "DELETE";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Delete(endpoint, std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  httplib::Result res = Method()(cli, endpoint, std::forward<T>(params)...);
  if (res) {
    spdlog::debug("{} {} -> {}", Method::method_name, endpoint, res->status);
  } else {
    spdlog::debug("{} {} -> error {}", Method::method_name, endpoint, httplib::to_string(res.error()));
  }
  return res;
}

#endif  // SANDCELL_HTTP_UTILS_H_
