#include "CodeValidator.hpp"
#include "CodeAlphabet.hpp"
#include <algorithm>

namespace olc {

static bool has_valid_length(const std::string& code) {
    if (code.size() < 2 + 1) return false;
    size_t sep = code.rfind(SEPARATOR);
    size_t tail = sep == std::string::npos ? code.size() : code.size() - sep - 1;
    // A single digit after the separator is never a complete grid refinement.
    return tail != 1;
}

static bool has_valid_separator(const std::string& code) {
    if (std::count(code.begin(), code.end(), SEPARATOR) != 1) return false;
    size_t sep = code.find(SEPARATOR);
    return sep <= static_cast<size_t>(SEPARATOR_POSITION) && sep % 2 == 0;
}

static bool has_valid_padding(const std::string& code) {
    size_t first = code.find(PADDING_CHARACTER);
    if (first == std::string::npos) return true;

    if (code.find(SEPARATOR) < static_cast<size_t>(SEPARATOR_POSITION)) return false;
    if (first == 0) return false;
    if (code[code.size() - 2] != PADDING_CHARACTER || code.back() != SEPARATOR) {
        return false;
    }

    size_t last = code.find_first_not_of(PADDING_CHARACTER, first);
    size_t runLength = (last == std::string::npos ? code.size() : last) - first;
    if (last != std::string::npos && code.find(PADDING_CHARACTER, last) != std::string::npos) {
        return false;
    }
    if (runLength % 2 != 0) return false;
    return runLength <= static_cast<size_t>(SEPARATOR_POSITION - 2);
}

static bool has_valid_characters(const std::string& code) {
    std::string digits = significantDigits(code);
    return std::all_of(digits.begin(), digits.end(), isCodeDigit);
}

bool isValid(const std::string& code) {
    return has_valid_length(code) && has_valid_separator(code) &&
        has_valid_padding(code) && has_valid_characters(code);
}

bool isShort(const std::string& code) {
    return isValid(code) && code.find(SEPARATOR) < static_cast<size_t>(SEPARATOR_POSITION);
}

bool isFull(const std::string& code) {
    return isValid(code) && !isShort(code);
}

}  // namespace olc
