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
 * @file GeohashBoundingBox.cc
 */

#include "geohash_proj/geohash/GeohashBoundingBox.h"
#include "geohash_proj/geohash/GeohashAdjacency.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include <algorithm>

using namespace geohash_proj;

const size_t GeohashBoundingBox::DEFAULT_COVER_LENGTH;

Bounds GeohashBoundingBox::getBoundingBox(const std::string &geohash) {
    return GeohashCodec::decodeBounds(geohash);
}

bool GeohashBoundingBox::isPointInGeohash(double lat, double lon,
        const std::string &geohash) {
    return getBoundingBox(geohash).contains(lat, lon);
}

std::vector<std::string> GeohashBoundingBox::geohashesInBox(
        const Bounds &bounds, size_t geohashLength) {
    GeohashCodec::checkGeohashLength(geohashLength);

    std::vector<std::string> geohashes;

    /*
     * La región de la fila que toca el límite norte, o la de la columna
     * que toca el límite este, es la última; así nunca se cruza un polo
     * ni el antimeridiano.
     */
    std::string row = GeohashCodec::encode(bounds.getSouth(), bounds.getWest(),
            geohashLength);
    while (true) {
        std::string cell = row;
        while (true) {
            geohashes.push_back(cell);
            if (getBoundingBox(cell).getEast() >= bounds.getEast())
                break;
            cell = GeohashAdjacency::getAdjacent(cell, GeohashAdjacency::EAST);
        }

        if (getBoundingBox(row).getNorth() >= bounds.getNorth())
            break;
        row = GeohashAdjacency::getAdjacent(row, GeohashAdjacency::NORTH);
    }

    std::sort(geohashes.begin(), geohashes.end());
    geohashes.erase(std::unique(geohashes.begin(), geohashes.end()),
            geohashes.end());
    return geohashes;
}
