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
 * @file GeohashErrors.h
 */

#pragma once

#include <GeographicLib/Constants.hpp>
#include "geohash_proj/geohash_proj.h"
#include <string>

namespace geohash_proj {

/*!
 * @brief Error base de las operaciones Geohash.
 *
 * Todos los errores se detectan antes de realizar cualquier
 * cálculo sobre los intervalos.
 */
class GEOHASH_PROJ_API GeohashError: public GeographicLib::GeographicErr {
public:
    GeohashError(const std::string &message) :
            GeographicLib::GeographicErr(message) {
    }
};

//! Símbolo fuera del alfabeto base 32 de Geohash.
class GEOHASH_PROJ_API InvalidCharacterError: public GeohashError {
public:
    InvalidCharacterError(const std::string &message) :
            GeohashError(message) {
    }
};

//! Código Geohash vacío o demasiado largo, o longitud fuera de 1 a 12.
class GEOHASH_PROJ_API InvalidLengthError: public GeohashError {
public:
    InvalidLengthError(const std::string &message) :
            GeohashError(message) {
    }
};

//! Latitud o longitud fuera de rango.
class GEOHASH_PROJ_API InvalidCoordinateError: public GeohashError {
public:
    InvalidCoordinateError(const std::string &message) :
            GeohashError(message) {
    }
};

//! Dirección de adyacencia desconocida.
class GEOHASH_PROJ_API InvalidDirectionError: public GeohashError {
public:
    InvalidDirectionError(const std::string &message) :
            GeohashError(message) {
    }
};

//! No existe región adyacente (más allá de un polo).
class GEOHASH_PROJ_API NoAdjacentRegionError: public GeohashError {
public:
    NoAdjacentRegionError(const std::string &message) :
            GeohashError(message) {
    }
};

}    // namespace geohash_proj
