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
 * @file LocationEncoder.cc
 */

#include "geohash_proj/mobility/LocationEncoder.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <omnetpp.h>

using namespace geohash_proj;

/*!
 * @brief Construir un codificador.
 *
 * @param geohashLength  [in] Longitud del código Geohash.
 * @param strictEncoding [in] Rechazar coordenadas fuera de rango.
 */
LocationEncoder::LocationEncoder(size_t geohashLength, bool strictEncoding) :
        geohashLength(geohashLength), strictEncoding(strictEncoding) {
    GeohashCodec::checkGeohashLength(geohashLength);
}

/*!
 * @brief Codificar una ubicación geográfica.
 *
 * @param latitude  [in] Latitud.
 * @param longitude [in] Longitud.
 * @return Ubicación Geohash con la ubicación original si está en rango,
 * o con el centro de la región si se corrigió.
 */
GeohashLocation LocationEncoder::encode(double latitude,
        double longitude) const {
    if (-90.0 <= latitude && latitude <= 90.0 && -180.0 <= longitude
            && longitude <= 180.0)
        return GeohashLocation(GeographicLib::GeoCoords(latitude, longitude),
                geohashLength);

    try {
        std::string geohash =
                strictEncoding ?
                        GeohashCodec::encodeStrictly(latitude, longitude,
                                geohashLength) :
                        GeohashCodec::encode(latitude, longitude,
                                geohashLength);
        return GeohashLocation(geohash);

    } catch (const GeohashError &error) {
        throw omnetpp::cRuntimeError("Cannot encode (%g, %g): %s", latitude,
                longitude, error.what());
    }
}
