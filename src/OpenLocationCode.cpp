#include "OpenLocationCode.hpp"
#include "CodeValidator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace olc {

static int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static int64_t floor_mod(int64_t a, int64_t b) {
    return a - floor_div(a, b) * b;
}

static bool is_invalid_length(int codeLength) {
    if (codeLength < 2) return true;
    return codeLength < PAIR_CODE_LENGTH && codeLength % 2 == 1;
}

double precisionByLength(int codeLength) {
    if (codeLength <= PAIR_CODE_LENGTH) {
        return std::pow(ENCODING_BASE, static_cast<double>(floor_div(codeLength, -2) + 2));
    }
    return 1.0 / (std::pow(ENCODING_BASE, 3.0) * std::pow(GRID_ROWS, codeLength - PAIR_CODE_LENGTH));
}

double clipLatitude(double latitude) {
    return std::min(LATITUDE_MAX, std::max(-LATITUDE_MAX, latitude));
}

double normalizeLongitude(double longitude) {
    const double circle = 2 * LONGITUDE_MAX;
    if (std::abs(longitude) > 4 * circle) {
        longitude = std::fmod(longitude, circle);
    }
    while (longitude >= LONGITUDE_MAX) longitude -= circle;
    while (longitude < -LONGITUDE_MAX) longitude += circle;
    return longitude;
}

// Pads or truncates the 15-digit form down to the requested length.
static std::string format_code(const std::string& code, int codeLength) {
    if (codeLength >= SEPARATOR_POSITION) {
        return code.substr(0, codeLength + 1);
    }
    std::string result = code.substr(0, codeLength);
    result.append(SEPARATOR_POSITION - codeLength, PADDING_CHARACTER);
    result.push_back(SEPARATOR);
    return result;
}

Result<std::string> tryEncode(double latitude, double longitude, int codeLength) {
    if (is_invalid_length(codeLength)) {
        return Result<std::string>::failure(ErrorKind::InvalidLength,
            "Invalid Open Location Code length: " + std::to_string(codeLength));
    }
    if (!std::isfinite(latitude) || !std::isfinite(longitude)) {
        return Result<std::string>::failure(ErrorKind::InvalidCoordinate,
            "Coordinates must be finite numbers");
    }

    codeLength = std::min(codeLength, MAX_CODE_LENGTH);
    latitude = clipLatitude(latitude);
    longitude = normalizeLongitude(longitude);

    // The north pole belongs to the last row of cells, not to a row above it.
    if (latitude == LATITUDE_MAX) {
        latitude -= precisionByLength(codeLength);
    }

    double latScaled = LATITUDE_MAX * PAIR_CODE_PRECISION * LAT_GRID_PRECISION;
    latScaled += latitude * PAIR_CODE_PRECISION * LAT_GRID_PRECISION;
    double lngScaled = LONGITUDE_MAX * PAIR_CODE_PRECISION * LNG_GRID_PRECISION;
    lngScaled += longitude * PAIR_CODE_PRECISION * LNG_GRID_PRECISION;

    int64_t latVal = static_cast<int64_t>(std::floor(latScaled));
    int64_t lngVal = static_cast<int64_t>(std::floor(lngScaled));

    // Digits are produced least significant first and reversed at the end.
    std::string reversed;
    reversed.reserve(MAX_CODE_LENGTH + 1);

    if (codeLength > PAIR_CODE_LENGTH) {
        for (int i = 0; i < GRID_CODE_LENGTH; ++i) {
            int64_t row = floor_mod(latVal, GRID_ROWS);
            int64_t column = floor_mod(lngVal, GRID_COLUMNS);
            reversed.push_back(digitSymbol(static_cast<int>(row * GRID_COLUMNS + column)));
            latVal = floor_div(latVal, GRID_ROWS);
            lngVal = floor_div(lngVal, GRID_COLUMNS);
        }
    } else {
        latVal = floor_div(latVal, LAT_GRID_PRECISION);
        lngVal = floor_div(lngVal, LNG_GRID_PRECISION);
    }

    for (int i = 0; i < PAIR_CODE_LENGTH / 2; ++i) {
        reversed.push_back(digitSymbol(static_cast<int>(floor_mod(lngVal, ENCODING_BASE))));
        reversed.push_back(digitSymbol(static_cast<int>(floor_mod(latVal, ENCODING_BASE))));
        latVal = floor_div(latVal, ENCODING_BASE);
        lngVal = floor_div(lngVal, ENCODING_BASE);
        if (i == 0) {
            reversed.push_back(SEPARATOR);
        }
    }

    std::string code(reversed.rbegin(), reversed.rend());
    return Result<std::string>::success(format_code(code, codeLength));
}

std::string encode(double latitude, double longitude, int codeLength) {
    return tryEncode(latitude, longitude, codeLength).valueOrThrow();
}

Result<CodeArea> tryDecode(const std::string& code) {
    if (!isFull(code)) {
        return Result<CodeArea>::failure(ErrorKind::NotFullCode,
            "Open Location Code is not a valid full code: " + code);
    }

    std::string digits = significantDigits(code);
    int codeLength = std::min(static_cast<int>(digits.size()), MAX_CODE_LENGTH);

    double southLatitude = -LATITUDE_MAX;
    double westLongitude = -LONGITUDE_MAX;
    // One step above the first pair digit, so the first division yields 20 degrees.
    double latResolution = ENCODING_BASE * ENCODING_BASE;
    double lngResolution = ENCODING_BASE * ENCODING_BASE;

    int digit = 0;
    int pairLength = std::min(codeLength, PAIR_CODE_LENGTH);
    while (digit + 1 < pairLength) {
        latResolution /= ENCODING_BASE;
        lngResolution /= ENCODING_BASE;
        southLatitude += latResolution * digitValue(digits[digit]);
        westLongitude += lngResolution * digitValue(digits[digit + 1]);
        digit += 2;
    }

    while (digit < codeLength) {
        latResolution /= GRID_ROWS;
        lngResolution /= GRID_COLUMNS;
        int value = digitValue(digits[digit]);
        southLatitude += latResolution * (value / GRID_COLUMNS);
        westLongitude += lngResolution * (value % GRID_COLUMNS);
        ++digit;
    }

    CodeArea area;
    area.southLatitude = southLatitude;
    area.westLongitude = westLongitude;
    area.latitudeHeight = latResolution;
    area.longitudeWidth = lngResolution;
    area.latitudeCenter = southLatitude + latResolution / 2.0;
    area.longitudeCenter = westLongitude + lngResolution / 2.0;
    area.codeLength = digit;
    return Result<CodeArea>::success(area);
}

CodeArea decode(const std::string& code) {
    return tryDecode(code).valueOrThrow();
}

}  // namespace olc
