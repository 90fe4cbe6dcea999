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
 * @file LocationEncoder.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include "geohash_proj/geohash/GeohashLocation.h"

namespace geohash_proj {

/*!
 * @brief Codificador de ubicaciones geográficas de *hosts*.
 *
 * Si la ubicación está en rango se conserva junto con su región Geohash.
 * Si está fuera de rango, en modo estricto se rechaza y en modo normal
 * se corrige y se toma el centro de la región resultante.
 */
class GEOHASH_PROJ_API LocationEncoder {

private:

    //! Longitud del código Geohash.
    size_t geohashLength;
    //! Rechazar coordenadas fuera de rango en lugar de corregirlas.
    bool strictEncoding;

public:

    /*!
     * @param geohashLength  [in] Longitud del código Geohash.
     * @param strictEncoding [in] Rechazar coordenadas fuera de rango.
     * @throw InvalidLengthError Longitud fuera de rango (1, 12).
     */
    LocationEncoder(size_t geohashLength, bool strictEncoding = false);

    size_t getGeohashLength() const {
        return geohashLength;
    }
    bool isStrict() const {
        return strictEncoding;
    }

    /*!
     * @brief Codificar una ubicación geográfica.
     *
     * @param latitude  [in] Latitud.
     * @param longitude [in] Longitud.
     * @return Ubicación Geohash.
     * @throw omnetpp::cRuntimeError Coordenadas no codificables.
     */
    GeohashLocation encode(double latitude, double longitude) const;
};

}    // namespace geohash_proj
