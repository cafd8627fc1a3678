#pragma once

namespace olc {

// Bounding box of a decoded code. Longitudes are not re-wrapped, so a cell
// touching the antimeridian may report an east edge past 180.
struct CodeArea {
    double southLatitude;
    double westLongitude;
    double latitudeHeight;
    double longitudeWidth;
    double latitudeCenter;
    double longitudeCenter;
    int codeLength;

    double northLatitude() const { return southLatitude + latitudeHeight; }
    double eastLongitude() const { return westLongitude + longitudeWidth; }
};

}  // namespace olc
