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
 * @file GeohashBoundingBox.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include "geohash_proj/geohash/Bounds.h"
#include <string>
#include <vector>

namespace geohash_proj {

/*!
 * @brief Operaciones sobre cajas delimitadoras de regiones Geohash.
 */
class GEOHASH_PROJ_API GeohashBoundingBox {

public:

    //! Longitud por omisión de los códigos que cubren una caja.
    static const size_t DEFAULT_COVER_LENGTH = 6;

    /*!
     * @brief Obtener la caja delimitadora de un código Geohash.
     *
     * @param geohash [in] Código Geohash.
     * @return Límites de la región.
     */
    static Bounds getBoundingBox(const std::string &geohash);
    /*!
     * @brief Verificar si una ubicación está dentro de una región Geohash.
     *
     * Los bordes de la región se consideran dentro.
     *
     * @param lat     [in] Latitud.
     * @param lon     [in] Longitud.
     * @param geohash [in] Código Geohash.
     * @return `true` si la ubicación está dentro de la región.
     */
    static bool isPointInGeohash(double lat, double lon,
            const std::string &geohash);
    static bool doBoxesIntersect(const Bounds &a, const Bounds &b) {
        return a.intersects(b);
    }
    /*!
     * @brief Obtener los códigos Geohash que cubren una caja.
     *
     * Se parte de la región que contiene la esquina suroeste y se recorre
     * hacia el este hasta cubrir el límite este, y luego hacia el norte
     * hasta cubrir el límite norte.
     *
     * @param bounds        [in] Caja a cubrir.
     * @param geohashLength [in] Longitud de los códigos (1 a 12).
     * @return Códigos Geohash ordenados y sin repetir.
     * @throw InvalidLengthError Longitud fuera de rango.
     */
    static std::vector<std::string> geohashesInBox(const Bounds &bounds,
            size_t geohashLength = DEFAULT_COVER_LENGTH);
};

}    // namespace geohash_proj
