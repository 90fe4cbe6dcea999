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
 * @file GeohashDistance.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <string>

namespace geohash_proj {

/*!
 * @brief Medidas de distancia entre regiones Geohash.
 */
class GEOHASH_PROJ_API GeohashDistance {

public:

    //! Radio medio de la Tierra en metros.
    static const double EARTH_RADIUS;
    //! Máximo prefijo común que se considera en la distancia aproximada.
    static const size_t MAX_MATCHING_LENGTH = 10;

    /*!
     * @brief Calcular la distancia aproximada entre dos códigos Geohash.
     *
     * Ambos códigos se recortan a la longitud del más corto y se cuenta
     * el prefijo común, hasta un máximo de 10 símbolos. La distancia es
     * el error típico de una región de esa longitud.
     *
     * @param geohash1 [in] Primer código Geohash.
     * @param geohash2 [in] Segundo código Geohash.
     * @return Distancia aproximada en metros.
     * @throw InvalidLengthError    Código vacío o demasiado largo.
     * @throw InvalidCharacterError Símbolo fuera del alfabeto.
     */
    static double approximateDistance(const std::string &geohash1,
            const std::string &geohash2);
    /*!
     * @brief Calcular la distancia de círculo máximo entre los centros
     * de dos regiones Geohash.
     *
     * @param geohash1 [in] Primer código Geohash.
     * @param geohash2 [in] Segundo código Geohash.
     * @return Distancia en metros sobre una esfera de radio #EARTH_RADIUS.
     */
    static double haversineDistance(const std::string &geohash1,
            const std::string &geohash2);
    /*!
     * @brief Calcular la distancia geodésica entre los centros de dos
     * regiones Geohash.
     *
     * @param geohash1 [in] Primer código Geohash.
     * @param geohash2 [in] Segundo código Geohash.
     * @return Distancia en metros sobre el elipsoide WGS84.
     */
    static double geodesicDistance(const std::string &geohash1,
            const std::string &geohash2);
    //! Distancia de círculo máximo entre dos ubicaciones, en metros.
    static double haversine(double lat1, double lon1, double lat2,
            double lon2);
};

}    // namespace geohash_proj
