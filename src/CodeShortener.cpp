#include "CodeShortener.hpp"
#include "CodeAlphabet.hpp"
#include "CodeValidator.hpp"
#include "OpenLocationCode.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace olc {

static constexpr int REMOVAL_LENGTHS[] = {8, 6, 4};
static constexpr double SHORTEN_AREA_FACTOR = 0.3;

static std::string to_upper(std::string code) {
    std::transform(code.begin(), code.end(), code.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

static bool is_finite_reference(double latitude, double longitude) {
    return std::isfinite(latitude) && std::isfinite(longitude);
}

// First `prefixLength` digits of the code of the cell holding the reference
// point. The point is snapped down to the cell corner and then encoded from
// the cell middle, so a corner that rounds to just below a multiple of the
// precision still lands in the same cell.
static Result<std::string> prefix_by_reference(double latitude, double longitude, int prefixLength) {
    double precision = precisionByLength(prefixLength);
    double roundedLatitude = std::floor(latitude / precision) * precision;
    double roundedLongitude = std::floor(longitude / precision) * precision;

    auto code = tryEncode(roundedLatitude + precision / 2, roundedLongitude + precision / 2);
    if (!code.ok()) return code;
    return Result<std::string>::success(code.value->substr(0, prefixLength));
}

Result<std::string> tryShorten(const std::string& code, double latitude, double longitude) {
    if (!isFull(code)) {
        return Result<std::string>::failure(ErrorKind::NotFullCode,
            "Open Location Code is not a valid full code: " + code);
    }
    if (code.find(PADDING_CHARACTER) != std::string::npos) {
        return Result<std::string>::failure(ErrorKind::PaddedCode,
            "Cannot shorten padded codes: " + code);
    }
    if (!is_finite_reference(latitude, longitude)) {
        return Result<std::string>::failure(ErrorKind::InvalidCoordinate,
            "Reference location must be finite numbers");
    }

    auto area = tryDecode(code);
    if (!area.ok()) return Result<std::string>::failure(area);

    double latDiff = std::abs(latitude - area.value->latitudeCenter);
    double lngDiff = std::abs(longitude - area.value->longitudeCenter);
    double maxDiff = std::max(latDiff, lngDiff);

    for (int removalLength : REMOVAL_LENGTHS) {
        double areaEdge = precisionByLength(removalLength) * SHORTEN_AREA_FACTOR;
        if (maxDiff < areaEdge) {
            return Result<std::string>::success(to_upper(code.substr(removalLength)));
        }
    }
    return Result<std::string>::success(to_upper(code));
}

std::string shorten(const std::string& code, double latitude, double longitude) {
    return tryShorten(code, latitude, longitude).valueOrThrow();
}

Result<std::string> tryRecoverNearest(const std::string& shortCode, double latitude, double longitude) {
    if (isFull(shortCode)) {
        return Result<std::string>::success(to_upper(shortCode));
    }
    if (!isShort(shortCode)) {
        return Result<std::string>::failure(ErrorKind::NotValidShortCode,
            "Open Location Code is not valid: " + shortCode);
    }
    if (!is_finite_reference(latitude, longitude)) {
        return Result<std::string>::failure(ErrorKind::InvalidCoordinate,
            "Reference location must be finite numbers");
    }

    double referenceLatitude = clipLatitude(latitude);
    double referenceLongitude = normalizeLongitude(longitude);

    int prefixLength = SEPARATOR_POSITION - static_cast<int>(shortCode.find(SEPARATOR));
    auto prefix = prefix_by_reference(referenceLatitude, referenceLongitude, prefixLength);
    if (!prefix.ok()) return prefix;

    std::string code = *prefix.value + shortCode;
    auto area = tryDecode(code);
    if (!area.ok()) return Result<std::string>::failure(area);

    // The candidate may sit in a neighbouring cell; move it to the cell whose
    // center is within half a cell of the reference.
    double resolution = precisionByLength(prefixLength);
    double halfResolution = resolution / 2;

    double candidateLatitude = area.value->latitudeCenter;
    if (referenceLatitude + halfResolution < candidateLatitude &&
        candidateLatitude - resolution >= -LATITUDE_MAX) {
        candidateLatitude -= resolution;
    } else if (referenceLatitude - halfResolution > candidateLatitude &&
               candidateLatitude + resolution <= LATITUDE_MAX) {
        candidateLatitude += resolution;
    }

    // Longitude wraps, so it never needs the pole guard.
    double candidateLongitude = area.value->longitudeCenter;
    if (referenceLongitude + halfResolution < candidateLongitude) {
        candidateLongitude -= resolution;
    } else if (referenceLongitude - halfResolution > candidateLongitude) {
        candidateLongitude += resolution;
    }

    return tryEncode(candidateLatitude, candidateLongitude, static_cast<int>(code.size()) - 1);
}

std::string recoverNearest(const std::string& shortCode, double latitude, double longitude) {
    return tryRecoverNearest(shortCode, latitude, longitude).valueOrThrow();
}

}  // namespace olc
