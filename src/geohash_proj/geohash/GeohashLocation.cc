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
 * @file GeohashLocation.cc
 */

#include <GeographicLib/Geodesic.hpp>
#include <GeographicLib/Math.hpp>
#include "geohash_proj/geohash/GeohashLocation.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <sstream>

using namespace geohash_proj;

/*
 * Contructores.
 */

GeohashLocation::GeohashLocation() :
        location(), bounds() {
    bits = 0;
}

GeohashLocation::GeohashLocation(const GeographicLib::GeoCoords &location,
        size_t geohashLength) {
    geohash = GeohashCodec::encode(location.Latitude(), location.Longitude(),
            geohashLength);
    bits = GeohashCodec::toBits(geohash);
    bounds = GeohashCodec::decodeBounds(geohash);
    this->location = location;
}

GeohashLocation::GeohashLocation(const std::string &geohash) {
    setGeohash(geohash);
}

GeohashLocation::GeohashLocation(uint64_t bits, size_t geohashLength) {
    setGeohash(GeohashCodec::fromBits(bits, geohashLength));
}

/*
 * Modificación de atributos.
 */

void GeohashLocation::setLocation(const GeographicLib::GeoCoords &location) {
    size_t geohashLength =
            isNull() ?
                    GeohashCodec::DEFAULT_GEOHASH_LENGTH : geohash.length();
    *this = GeohashLocation(location, geohashLength);
}

/*!
 * @brief Modificar el código Geohash.
 *
 * La ubicación geográfica pasa a ser el centro de la región.
 *
 * @param geohash [in] Nuevo código Geohash.
 */
void GeohashLocation::setGeohash(const std::string &geohash) {
    std::string normalized = GeohashCodec::normalize(geohash);

    bounds = GeohashCodec::decodeBounds(normalized);
    bits = GeohashCodec::toBits(normalized);
    location = bounds.getCenter();
    this->geohash = normalized;
}

void GeohashLocation::setBits(uint64_t bits) {
    if (isNull())
        throw InvalidLengthError("Null geohash location has no length");

    setGeohash(GeohashCodec::fromBits(bits, geohash.length()));
}

/*
 * Ubicación Geohash nula.
 */

void GeohashLocation::setNull() {
    geohash.clear();
    bits = 0;
    location.Reset(GeographicLib::Math::NaN(), GeographicLib::Math::NaN());
    bounds.setBounds(90, 180, -90, -180);
}

/*
 * Operaciones geográficas.
 */

double GeohashLocation::getDistance(
        const GeographicLib::GeoCoords &location) const {
    const GeographicLib::Geodesic &geod = GeographicLib::Geodesic::WGS84();

    double distance;

    geod.Inverse(this->location.Latitude(), this->location.Longitude(),
            location.Latitude(), location.Longitude(), distance);

    return distance;
}

bool GeohashLocation::contains(const GeohashLocation &geohashLocation) const {
    return !isNull() && !geohashLocation.isNull()
            && geohashLocation.geohash.compare(0, geohash.length(), geohash)
                    == 0;
}

GeohashLocation GeohashLocation::getAdjacentGeohashRegion(
        Adjacency adjacency) const {
    return GeohashLocation(GeohashAdjacency::getAdjacent(geohash, adjacency));
}

std::string GeohashLocation::str() const {
    if (isNull())
        return "null";

    std::ostringstream out;
    out << geohash << " " << bounds.str();
    return out.str();
}
