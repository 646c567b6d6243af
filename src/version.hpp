#pragma once

#include <string>

namespace camper {

inline const std::string kVersion   = "0.1.0";
inline const std::string kUserAgent = "camper/" + kVersion;

} // namespace camper
