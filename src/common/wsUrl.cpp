#include "wsUrl.hpp"

#include <cctype>
#include <cstdlib>

namespace {

const std::string WS_SCHEME = "ws://";

bool valid_port(const std::string &txt) {
  if (txt.empty() || txt.size() > 5) {
    return false;
  }
  for (char c : txt) {
    if (!std::isdigit((unsigned char)c)) {
      return false;
    }
  }
  long port = strtol(txt.c_str(), nullptr, 10);
  return port >= 1 && port <= ((1 << 16) - 1);
}

} // namespace

bool parse_ws_url(const std::string &url, WsUrl &out) {
  if (url.compare(0, WS_SCHEME.size(), WS_SCHEME) != 0) {
    return false;
  }
  std::string rest = url.substr(WS_SCHEME.size());
  rest = rest.substr(0, rest.find('#'));

  size_t path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  WsUrl parsed;
  if (path_start != std::string::npos) {
    parsed.path = rest.substr(path_start);
    if (parsed.path[0] == '?') {
      parsed.path = "/" + parsed.path;
    }
  }

  if (authority.empty() || authority.find('@') != std::string::npos) {
    return false;
  }

  std::string port_txt;
  if (authority[0] == '[') {
    size_t closing = authority.find(']');
    if (closing == std::string::npos) {
      return false;
    }
    parsed.host = authority.substr(1, closing - 1);
    std::string remain = authority.substr(closing + 1);
    if (!remain.empty()) {
      if (remain[0] != ':') {
        return false;
      }
      port_txt = remain.substr(1);
    }
  } else {
    size_t colon = authority.find(':');
    parsed.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_txt = authority.substr(colon + 1);
    }
  }

  if (parsed.host.empty()) {
    return false;
  }
  if (!port_txt.empty() || authority.back() == ':') {
    if (!valid_port(port_txt)) {
      return false;
    }
    parsed.port = port_txt;
  }

  out = parsed;
  return true;
}
