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
 * @file Base32.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <string>

namespace geohash_proj {

/*!
 * @brief Alfabeto base 32 con el que se forman los códigos Geohash.
 *
 * No incluye los símbolos `a`, `i`, `l` ni `o`. La decodificación
 * no distingue mayúsculas de minúsculas; la codificación siempre
 * produce minúsculas.
 */
class GEOHASH_PROJ_API Base32 {

public:

    //! Número de símbolos del alfabeto.
    static const unsigned int SIZE = 32;
    //! Número de bits que representa cada símbolo.
    static const unsigned int BITS_PER_SYMBOL = 5;
    //! Símbolos en orden de valor.
    static const char ALPHABET[SIZE + 1];

    /*!
     * @brief Obtener el símbolo de un valor.
     *
     * @param value [in] Valor de 0 a 31.
     * @return Símbolo en minúscula.
     */
    static char encode(unsigned int value);
    /*!
     * @brief Obtener el valor de un símbolo.
     *
     * @param symbol [in] Símbolo, en mayúscula o minúscula.
     * @return Valor de 0 a 31, o -1 si el símbolo no pertenece al alfabeto.
     */
    static int decode(char symbol);
    /*!
     * @brief Verificar si un símbolo pertenece al alfabeto.
     *
     * @param symbol [in] Símbolo.
     * @return `true` si pertenece al alfabeto.
     */
    static bool isValid(char symbol) {
        return decode(symbol) >= 0;
    }
};

}    // namespace geohash_proj
