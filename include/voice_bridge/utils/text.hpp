#pragma once

#include <string>
#include <vector>

namespace voice_bridge::utils {

std::string remove_emojis(const std::string& text);
std::string trim(std::string value);
std::string to_lower(std::string value);
std::string to_upper(std::string value);
std::string join(const std::vector<std::string>& items, const std::string& separator);

}
