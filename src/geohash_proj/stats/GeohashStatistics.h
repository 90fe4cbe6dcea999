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
 * @file GeohashStatistics.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include <string>
#include <vector>

namespace geohash_proj {

/*!
 * @brief Estadísticas sobre un conjunto de códigos Geohash.
 *
 * Cada código se representa por el centro de su región. Todas las
 * operaciones fallan con InvalidLengthError si el conjunto está vacío.
 */
class GEOHASH_PROJ_API GeohashStatistics {

public:

    /*!
     * @brief Obtener la ubicación media del conjunto.
     *
     * @param geohashes     [in] Códigos Geohash.
     * @param geohashLength [in] Longitud del código resultante.
     * @return Código Geohash de la media aritmética de los centros.
     */
    static std::string mean(const std::vector<std::string> &geohashes,
            size_t geohashLength = GeohashCodec::DEFAULT_GEOHASH_LENGTH);
    /*!
     * @brief Obtener la ubicación más al norte del conjunto.
     *
     * En caso de empate gana el primero.
     *
     * @param geohashes [in] Códigos Geohash.
     * @return Centro de mayor latitud, codificado con longitud 12.
     */
    static std::string northern(const std::vector<std::string> &geohashes);
    //! Centro de menor latitud, codificado con longitud 12.
    static std::string southern(const std::vector<std::string> &geohashes);
    //! Centro de mayor longitud, codificado con longitud 12.
    static std::string eastern(const std::vector<std::string> &geohashes);
    //! Centro de menor longitud, codificado con longitud 12.
    static std::string western(const std::vector<std::string> &geohashes);
    /*!
     * @brief Calcular la varianza espacial del conjunto.
     *
     * @param geohashes [in] Códigos Geohash.
     * @return Media de los cuadrados de las distancias de Haversine
     * a la ubicación media, en metros cuadrados.
     */
    static double variance(const std::vector<std::string> &geohashes);
    //! Raíz cuadrada de la varianza, en metros.
    static double standardDeviation(const std::vector<std::string> &geohashes);

private:

    static std::vector<LatLong> decodeAll(
            const std::vector<std::string> &geohashes);
};

}    // namespace geohash_proj
