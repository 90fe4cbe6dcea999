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
 * @file GeohashCodec.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include "geohash_proj/geohash/Bounds.h"
#include <cstdint>
#include <cstddef>
#include <string>

namespace geohash_proj {

/*!
 * @brief Coordenadas geográficas en grados.
 */
struct LatLong {
    //! Latitud.
    double latitude;
    //! Longitud.
    double longitude;
};

/*!
 * @brief Coordenadas geográficas con sus márgenes de error.
 *
 * Los márgenes de error son la mitad del ancho de los intervalos
 * finales de latitud y longitud, es decir, la máxima diferencia
 * posible entre el centro decodificado y el punto codificado.
 */
struct ExactLatLong {
    //! Latitud.
    double latitude;
    //! Longitud.
    double longitude;
    //! Margen de error de la latitud.
    double latitudeError;
    //! Margen de error de la longitud.
    double longitudeError;
};

/*!
 * @brief Codificación y decodificación de códigos Geohash.
 *
 * Cada bit del código divide a la mitad el intervalo de longitud
 * o de latitud, alternando y comenzando por la longitud. Cada cinco
 * bits forman un símbolo base 32, con el bit más significativo primero.
 *
 * Todas las operaciones son funciones puras.
 */
class GEOHASH_PROJ_API GeohashCodec {

public:

    /*
     * Constantes.
     */
    //! Longitud máxima del código Geohash.
    static const size_t MAX_GEOHASH_LENGTH = 12;
    //! Longitud por omisión del código Geohash.
    static const size_t DEFAULT_GEOHASH_LENGTH = 12;

    /*
     * Codificación.
     */
    /*!
     * @brief Codificar una ubicación geográfica.
     *
     * La latitud fuera de rango se recorta a [-90, 90] y la longitud
     * fuera de rango se reduce módulo 360 a [-180, 180].
     *
     * @param latitude      [in] Latitud.
     * @param longitude     [in] Longitud.
     * @param geohashLength [in] Longitud del código Geohash (1 a 12).
     * @return Código Geohash.
     * @throw InvalidLengthError     Longitud fuera de rango.
     * @throw InvalidCoordinateError Coordenada NaN.
     */
    static std::string encode(double latitude, double longitude,
            size_t geohashLength = DEFAULT_GEOHASH_LENGTH);
    /*!
     * @brief Codificar una ubicación geográfica sin corregir coordenadas.
     *
     * @param latitude      [in] Latitud.
     * @param longitude     [in] Longitud.
     * @param geohashLength [in] Longitud del código Geohash (1 a 12).
     * @return Código Geohash.
     * @throw InvalidLengthError     Longitud fuera de rango.
     * @throw InvalidCoordinateError Latitud o longitud fuera de rango.
     */
    static std::string encodeStrictly(double latitude, double longitude,
            size_t geohashLength = DEFAULT_GEOHASH_LENGTH);

    /*
     * Decodificación.
     */
    /*!
     * @brief Decodificar un código Geohash con sus márgenes de error.
     *
     * @param geohash [in] Código Geohash.
     * @return Centro de la región y márgenes de error.
     * @throw InvalidLengthError    Código vacío o demasiado largo.
     * @throw InvalidCharacterError Símbolo fuera del alfabeto.
     */
    static ExactLatLong decodeExactly(const std::string &geohash);
    /*!
     * @brief Decodificar un código Geohash.
     *
     * @param geohash [in] Código Geohash.
     * @return Centro de la región.
     */
    static LatLong decode(const std::string &geohash);
    /*!
     * @brief Obtener los límites de la región de un código Geohash.
     *
     * @param geohash [in] Código Geohash.
     * @return Límites de la región.
     */
    static Bounds decodeBounds(const std::string &geohash);

    /*
     * Cadenas de bits.
     */
    /*!
     * @brief Obtener la cadena de bits de un código Geohash.
     *
     * El primer bit del código queda en el bit 63.
     *
     * @param geohash [in] Código Geohash.
     * @return Cadena de bits alineada a la izquierda.
     */
    static uint64_t toBits(const std::string &geohash);
    /*!
     * @brief Obtener el código Geohash de una cadena de bits.
     *
     * @param bits          [in] Cadena de bits alineada a la izquierda.
     * @param geohashLength [in] Longitud del código Geohash.
     * @return Código Geohash.
     */
    static std::string fromBits(uint64_t bits, size_t geohashLength);
    /*!
     * @brief Separar los bits entrelazados de longitud y latitud.
     *
     * @param bits          [in]  Bits entrelazados, alineados a la derecha.
     * @param nBits         [in]  Número de bits entrelazados.
     * @param longitudeFirst [in] `true` si el bit más significativo
     * corresponde a la longitud.
     * @param lonBits       [out] Bits de longitud.
     * @param latBits       [out] Bits de latitud.
     */
    static void deinterleave(uint64_t bits, unsigned int nBits,
            bool longitudeFirst, uint32_t &lonBits, uint32_t &latBits);
    /*!
     * @brief Entrelazar bits de longitud y latitud.
     *
     * Operación inversa de #deinterleave.
     */
    static uint64_t interleave(uint32_t lonBits, uint32_t latBits,
            unsigned int nBits, bool longitudeFirst);

    /*
     * Validación.
     */
    /*!
     * @brief Validar un código Geohash y pasarlo a minúsculas.
     *
     * @param geohash [in] Código Geohash.
     * @return Código Geohash en minúsculas.
     * @throw InvalidLengthError    Código vacío o demasiado largo.
     * @throw InvalidCharacterError Símbolo fuera del alfabeto.
     */
    static std::string normalize(const std::string &geohash);
    //! Verificar si un código Geohash es válido.
    static bool isValid(const std::string &geohash);
    //! Validar la longitud de un código Geohash.
    static void checkGeohashLength(size_t geohashLength);

private:

    static std::string encodeNormalized(double latitude, double longitude,
            size_t geohashLength);
};

}    // namespace geohash_proj
