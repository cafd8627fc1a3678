#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace olc {

constexpr char CODE_ALPHABET[] = "23456789CFGHJMPQRVWX";
constexpr int ENCODING_BASE = 20;

constexpr char PADDING_CHARACTER = '0';
constexpr char SEPARATOR = '+';
constexpr int SEPARATOR_POSITION = 8;

constexpr int MAX_CODE_LENGTH = 15;
constexpr int PAIR_CODE_LENGTH = 10;
constexpr int GRID_CODE_LENGTH = MAX_CODE_LENGTH - PAIR_CODE_LENGTH;

// Inverse of the cell size (in degrees) after the last pair digit.
constexpr int64_t PAIR_CODE_PRECISION = 8000;

constexpr int GRID_ROWS = 5;
constexpr int GRID_COLUMNS = 4;
constexpr int64_t LAT_GRID_PRECISION = 3125;  // GRID_ROWS ^ GRID_CODE_LENGTH
constexpr int64_t LNG_GRID_PRECISION = 1024;  // GRID_COLUMNS ^ GRID_CODE_LENGTH

constexpr double LATITUDE_MAX = 90.0;
constexpr double LONGITUDE_MAX = 180.0;

constexpr int PADDING_OR_SEPARATOR_DIGIT = -1;
constexpr int NOT_A_DIGIT = -2;

using DigitTable = std::array<int8_t, 256>;

constexpr DigitTable makeDigitTable() {
    DigitTable table{};
    for (auto& value : table) {
        value = static_cast<int8_t>(NOT_A_DIGIT);
    }
    for (int digit = 0; digit < ENCODING_BASE; ++digit) {
        char symbol = CODE_ALPHABET[digit];
        table[static_cast<unsigned char>(symbol)] = static_cast<int8_t>(digit);
        if (symbol >= 'A' && symbol <= 'Z') {
            table[static_cast<unsigned char>(symbol - 'A' + 'a')] = static_cast<int8_t>(digit);
        }
    }
    table[static_cast<unsigned char>(PADDING_CHARACTER)] = static_cast<int8_t>(PADDING_OR_SEPARATOR_DIGIT);
    table[static_cast<unsigned char>(SEPARATOR)] = static_cast<int8_t>(PADDING_OR_SEPARATOR_DIGIT);
    return table;
}

const DigitTable& digitTable();

int digitValue(char symbol);
bool isCodeDigit(char symbol);
char digitSymbol(int digit);

// Drops the separator and every padding character and uppercases the rest.
std::string significantDigits(const std::string& code);

}  // namespace olc
