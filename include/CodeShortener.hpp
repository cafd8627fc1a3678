#pragma once
#include <string>
#include "OlcError.hpp"

namespace olc {

// Removes four, six or eight leading digits from a full code when the
// reference location is close enough to the code's center.
Result<std::string> tryShorten(const std::string& code, double latitude, double longitude);
std::string shorten(const std::string& code, double latitude, double longitude);

// Restores the full code nearest to the reference location. Full codes are
// returned uppercased and otherwise untouched.
Result<std::string> tryRecoverNearest(const std::string& shortCode, double latitude, double longitude);
std::string recoverNearest(const std::string& shortCode, double latitude, double longitude);

}  // namespace olc
