//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see http://www.gnu.org/licenses/.
//

/*!
 * @file GeohashDistance.cc
 */

#include <GeographicLib/Geodesic.hpp>
#include <GeographicLib/Math.hpp>
#include "geohash_proj/distance/GeohashDistance.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include <algorithm>
#include <cmath>

using namespace geohash_proj;

const double GeohashDistance::EARTH_RADIUS = 6371000.0;
const size_t GeohashDistance::MAX_MATCHING_LENGTH;

namespace {

//! Error típico en metros según la longitud del prefijo común.
const double PRECISION_ERROR[GeohashDistance::MAX_MATCHING_LENGTH + 1] = {
        20000000, 5003530, 625441, 123264, 19545, 3803, 610, 118, 19, 3.71,
        0.6 };

}    // namespace

double GeohashDistance::approximateDistance(const std::string &geohash1,
        const std::string &geohash2) {
    std::string a = GeohashCodec::normalize(geohash1);
    std::string b = GeohashCodec::normalize(geohash2);

    size_t length = std::min(a.length(), b.length());
    size_t matching = std::mismatch(a.begin(), a.begin() + length, b.begin()).first
            - a.begin();

    return PRECISION_ERROR[std::min(matching, MAX_MATCHING_LENGTH)];
}

double GeohashDistance::haversineDistance(const std::string &geohash1,
        const std::string &geohash2) {
    LatLong p1 = GeohashCodec::decode(geohash1);
    LatLong p2 = GeohashCodec::decode(geohash2);

    return haversine(p1.latitude, p1.longitude, p2.latitude, p2.longitude);
}

double GeohashDistance::geodesicDistance(const std::string &geohash1,
        const std::string &geohash2) {
    LatLong p1 = GeohashCodec::decode(geohash1);
    LatLong p2 = GeohashCodec::decode(geohash2);

    const GeographicLib::Geodesic &geod = GeographicLib::Geodesic::WGS84();

    double distance;

    geod.Inverse(p1.latitude, p1.longitude, p2.latitude, p2.longitude,
            distance);

    return distance;
}

double GeohashDistance::haversine(double lat1, double lon1, double lat2,
        double lon2) {
    double phi1 = lat1 * GeographicLib::Math::degree();
    double phi2 = lat2 * GeographicLib::Math::degree();
    double dPhi = (lat2 - lat1) * GeographicLib::Math::degree();
    double dLambda = (lon2 - lon1) * GeographicLib::Math::degree();

    double a = std::sin(dPhi / 2) * std::sin(dPhi / 2)
            + std::cos(phi1) * std::cos(phi2) * std::sin(dLambda / 2)
                    * std::sin(dLambda / 2);
    // Errores de redondeo pueden dejar a ligeramente fuera de [0, 1].
    a = std::min(1.0, std::max(0.0, a));

    return 2 * EARTH_RADIUS * std::atan2(std::sqrt(a), std::sqrt(1 - a));
}
