#pragma once

#include <string>

namespace call_core::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

// Joins a base path and a request path with exactly one slash between them.
std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);

}
