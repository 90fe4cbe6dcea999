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
 * @file GeohashAdjacency.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <string>

namespace geohash_proj {

/*!
 * @brief Navegación entre regiones Geohash adyacentes.
 *
 * La región adyacente se obtiene manipulando directamente los símbolos
 * del código, sin decodificar coordenadas. Para cada dirección y cada
 * paridad de la longitud del código hay una tabla de bordes, que indica
 * si un símbolo está en el borde de la región padre, y una tabla de
 * vecinos, que indica el símbolo de la subregión adyacente dentro de la
 * región padre.
 *
 * Al cruzar el antimeridiano la región adyacente da la vuelta al mundo.
 * Más allá de los polos no existe región adyacente.
 */
class GEOHASH_PROJ_API GeohashAdjacency {

public:

    /*!
     * Tipos de adyacencia entre regiones Geohash.
     */
    enum Direction : int {
        //! Adyacencia al norte (`top`).
        NORTH = 0,
        //! Adyacencia al este (`right`).
        EAST = 1,
        //! Adyacencia al sur (`bottom`).
        SOUTH = 2,
        //! Adyacencia al oeste (`left`).
        WEST = 3,
    };
    //! Número de direcciones.
    static const unsigned int NUM_DIRECTIONS = 4;

    /*!
     * @brief Obtener el código Geohash de la región adyacente.
     *
     * @param geohash   [in] Código Geohash.
     * @param direction [in] Dirección de la adyacencia.
     * @return Código Geohash de la región adyacente, en minúsculas
     * y de la misma longitud.
     * @throw InvalidDirectionError Dirección desconocida.
     * @throw InvalidLengthError    Código vacío o demasiado largo.
     * @throw InvalidCharacterError Símbolo fuera del alfabeto.
     * @throw NoAdjacentRegionError La región adyacente está más allá
     * de un polo.
     */
    static std::string getAdjacent(const std::string &geohash,
            Direction direction);
    /*!
     * @brief Obtener el código Geohash de la región adyacente.
     *
     * @param geohash       [in] Código Geohash.
     * @param directionName [in] `top`, `right`, `bottom`, `left`,
     * o `north`, `east`, `south`, `west`.
     * @return Código Geohash de la región adyacente.
     */
    static std::string getAdjacent(const std::string &geohash,
            const std::string &directionName);
    //! Obtener la dirección opuesta.
    static Direction getOpposite(Direction direction);
    /*!
     * @brief Interpretar el nombre de una dirección.
     *
     * @param directionName [in] Nombre, sin distinguir mayúsculas.
     * @return Dirección.
     * @throw InvalidDirectionError Nombre desconocido.
     */
    static Direction parseDirection(const std::string &directionName);
    //! Nombre de una dirección (`top`, `right`, `bottom` o `left`).
    static const char* directionName(Direction direction);

    /*
     * Tablas.
     */
    /*!
     * @brief Verificar si un símbolo está en el borde de su región padre.
     *
     * @param symbol    [in] Valor del símbolo (0 a 31).
     * @param direction [in] Dirección.
     * @param oddLength [in] `true` si el símbolo es el último de un código
     * de longitud impar.
     */
    static bool isBorder(unsigned int symbol, Direction direction,
            bool oddLength);
    /*!
     * @brief Obtener el símbolo vecino dentro de la región padre.
     *
     * @param symbol    [in] Valor del símbolo (0 a 31).
     * @param direction [in] Dirección.
     * @param oddLength [in] `true` si el símbolo es el último de un código
     * de longitud impar.
     * @return Valor del símbolo vecino.
     */
    static unsigned int getNeighbour(unsigned int symbol, Direction direction,
            bool oddLength);

private:

    static void checkDirection(Direction direction);
    static std::string adjacent(const std::string &geohash,
            Direction direction);
};

}    // namespace geohash_proj
