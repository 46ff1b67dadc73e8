#pragma once

#include <map>
#include <string>

namespace voice_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Splits "/a/b?x=1&y=2" into the path and decoded query parameters.
std::string split_resource(const std::string& resource,
                           std::map<std::string, std::string>& query);

}
