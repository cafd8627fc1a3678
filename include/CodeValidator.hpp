#pragma once
#include <string>

namespace olc {

bool isValid(const std::string& code);
bool isShort(const std::string& code);
bool isFull(const std::string& code);

}  // namespace olc
