#pragma once
#include <string>

struct WsUrl {
  std::string host;
  std::string port = "80";
  std::string path = "/";
};

// returns true if ok, only the ws:// scheme is accepted
bool parse_ws_url(const std::string &url, WsUrl &out);
