#include "CodeAlphabet.hpp"
#include <cctype>

namespace olc {

static constexpr DigitTable DIGIT_TABLE = makeDigitTable();

static_assert(sizeof(CODE_ALPHABET) - 1 == ENCODING_BASE, "alphabet must hold one symbol per digit");
static_assert(GRID_ROWS * GRID_COLUMNS == ENCODING_BASE, "grid cell must map onto one digit");

const DigitTable& digitTable() {
    return DIGIT_TABLE;
}

int digitValue(char symbol) {
    return DIGIT_TABLE[static_cast<unsigned char>(symbol)];
}

bool isCodeDigit(char symbol) {
    return digitValue(symbol) >= 0;
}

char digitSymbol(int digit) {
    return CODE_ALPHABET[digit];
}

std::string significantDigits(const std::string& code) {
    std::string digits;
    digits.reserve(code.size());
    for (char c : code) {
        if (c == SEPARATOR || c == PADDING_CHARACTER) continue;
        digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return digits;
}

}  // namespace olc
