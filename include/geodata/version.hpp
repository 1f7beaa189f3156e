#pragma once
#include <string_view>

namespace geodata {

constexpr std::string_view LIBRARY_VERSION  = "0.1.0";
constexpr std::string_view DEFAULT_BASE_URL = "http://api.simplegeo.com/0.1";
constexpr std::string_view USER_AGENT       = "geodata-cpp/0.1.0";

} // namespace geodata
