#pragma once
#include <string>
#include "CodeAlphabet.hpp"
#include "CodeArea.hpp"
#include "OlcError.hpp"

namespace olc {

Result<std::string> tryEncode(double latitude, double longitude, int codeLength = PAIR_CODE_LENGTH);
std::string encode(double latitude, double longitude, int codeLength = PAIR_CODE_LENGTH);

Result<CodeArea> tryDecode(const std::string& code);
CodeArea decode(const std::string& code);

// Cell size in degrees of a code with `codeLength` significant digits.
double precisionByLength(int codeLength);

double clipLatitude(double latitude);
double normalizeLongitude(double longitude);

}  // namespace olc
