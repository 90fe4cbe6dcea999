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
 * @file GeohashCodec.cc
 */

#include <GeographicLib/Math.hpp>
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include "geohash_proj/geohash/Base32.h"
#include <algorithm>
#include <cmath>
#include <sstream>

using namespace geohash_proj;

const size_t GeohashCodec::MAX_GEOHASH_LENGTH;
const size_t GeohashCodec::DEFAULT_GEOHASH_LENGTH;

namespace {

//! Intervalo cerrado de latitud o longitud.
struct Interval {
    double min;
    double max;

    double mid() const {
        return (min + max) / 2.0;
    }
};

/*!
 * @brief Estado de la bisección entrelazada.
 *
 * Cada bit divide a la mitad el intervalo activo; el turno
 * alterna entre longitud y latitud, comenzando por la longitud.
 */
struct BisectionState {
    Interval lat = { -90.0, 90.0 };
    Interval lon = { -180.0, 180.0 };
    //! Mitad del ancho del intervalo de latitud.
    double latErr = 90.0;
    //! Mitad del ancho del intervalo de longitud.
    double lonErr = 180.0;
    bool longitudeTurn = true;

    void push(bool bit) {
        Interval &interval = longitudeTurn ? lon : lat;
        double &err = longitudeTurn ? lonErr : latErr;
        err /= 2.0;
        if (bit)
            interval.min = interval.mid();
        else
            interval.max = interval.mid();
        longitudeTurn = !longitudeTurn;
    }
};

BisectionState bisect(const std::string &geohash) {
    BisectionState state;
    for (char c : geohash) {
        unsigned int idx = Base32::decode(c);
        for (int i = Base32::BITS_PER_SYMBOL - 1; i >= 0; i--)
            state.push((idx >> i) & 1);
    }
    return state;
}

}    // namespace

/*
 * Codificación.
 */

/*!
 * @brief Codificar una ubicación geográfica.
 *
 * @param latitude      [in] Latitud.
 * @param longitude     [in] Longitud.
 * @param geohashLength [in] Longitud del código Geohash (1 a 12).
 * @return Código Geohash.
 */
std::string GeohashCodec::encode(double latitude, double longitude,
        size_t geohashLength) {
    checkGeohashLength(geohashLength);

    if (std::isnan(latitude) || std::isnan(longitude))
        throw InvalidCoordinateError("Coordinates must be numbers");

    latitude = std::max(-90.0, std::min(90.0, latitude));

    if (longitude < -180.0 || 180.0 < longitude) {
        if (std::isinf(longitude))
            throw InvalidCoordinateError("Longitude must be finite");
        double normalized = GeographicLib::Math::AngNormalize(longitude);
        /*
         * El signo de ±180 depende de la versión de GeographicLib;
         * se conserva el de la longitud original.
         */
        longitude = std::fabs(normalized) == 180.0 ?
                std::copysign(180.0, longitude) : normalized;
    }

    return encodeNormalized(latitude, longitude, geohashLength);
}

/*!
 * @brief Codificar una ubicación geográfica sin corregir coordenadas.
 *
 * @param latitude      [in] Latitud.
 * @param longitude     [in] Longitud.
 * @param geohashLength [in] Longitud del código Geohash (1 a 12).
 * @return Código Geohash.
 */
std::string GeohashCodec::encodeStrictly(double latitude, double longitude,
        size_t geohashLength) {
    checkGeohashLength(geohashLength);

    if (std::isnan(latitude) || latitude < -90.0 || 90.0 < latitude) {
        std::ostringstream message;
        message << "Latitude " << latitude << " out of range (-90, 90)";
        throw InvalidCoordinateError(message.str());
    }

    if (std::isnan(longitude) || longitude < -180.0 || 180.0 < longitude) {
        std::ostringstream message;
        message << "Longitude " << longitude << " out of range (-180, 180)";
        throw InvalidCoordinateError(message.str());
    }

    return encodeNormalized(latitude, longitude, geohashLength);
}

/*!
 * @brief Ciclo de codificación sobre coordenadas ya validadas.
 *
 * Los valores iguales al punto medio pasan a la mitad superior.
 */
std::string GeohashCodec::encodeNormalized(double latitude, double longitude,
        size_t geohashLength) {
    std::string geohash;
    geohash.reserve(geohashLength);

    BisectionState state;
    unsigned int idx = 0;
    unsigned int bit = 0;

    while (geohash.length() < geohashLength) {
        double value = state.longitudeTurn ? longitude : latitude;
        double mid = state.longitudeTurn ? state.lon.mid() : state.lat.mid();
        bool upper = value >= mid;

        idx = idx * 2 + (upper ? 1 : 0);
        state.push(upper);

        if (++bit == Base32::BITS_PER_SYMBOL) {
            geohash.push_back(Base32::encode(idx));
            bit = 0;
            idx = 0;
        }
    }

    return geohash;
}

/*
 * Decodificación.
 */

/*!
 * @brief Decodificar un código Geohash con sus márgenes de error.
 *
 * @param geohash [in] Código Geohash.
 * @return Centro de la región y mitad de su ancho en cada eje.
 */
ExactLatLong GeohashCodec::decodeExactly(const std::string &geohash) {
    BisectionState state = bisect(normalize(geohash));

    ExactLatLong result;
    result.latitude = state.lat.mid();
    result.longitude = state.lon.mid();
    result.latitudeError = state.latErr;
    result.longitudeError = state.lonErr;
    return result;
}

/*!
 * @brief Decodificar un código Geohash.
 *
 * @param geohash [in] Código Geohash.
 * @return Centro de la región.
 */
LatLong GeohashCodec::decode(const std::string &geohash) {
    ExactLatLong exact = decodeExactly(geohash);

    LatLong result;
    result.latitude = exact.latitude;
    result.longitude = exact.longitude;
    return result;
}

/*!
 * @brief Obtener los límites de la región de un código Geohash.
 *
 * @param geohash [in] Código Geohash.
 * @return Límites de la región.
 */
Bounds GeohashCodec::decodeBounds(const std::string &geohash) {
    BisectionState state = bisect(normalize(geohash));

    return Bounds(state.lat.max, state.lon.max, state.lat.min, state.lon.min);
}

/*
 * Cadenas de bits.
 */

/*!
 * @brief Obtener la cadena de bits de un código Geohash.
 *
 * Los bits quedan alineados a la izquierda de la palabra de 64 bits.
 *
 * @param geohash [in] Código Geohash.
 * @return Cadena de bits.
 */
uint64_t GeohashCodec::toBits(const std::string &geohash) {
    std::string normalized = normalize(geohash);

    uint64_t bits = 0;
    unsigned int shift = 64;
    for (char c : normalized) {
        shift -= Base32::BITS_PER_SYMBOL;
        bits |= static_cast<uint64_t>(Base32::decode(c)) << shift;
    }

    return bits;
}

/*!
 * @brief Obtener el código Geohash de una cadena de bits.
 *
 * @param bits          [in] Cadena de bits alineada a la izquierda.
 * @param geohashLength [in] Longitud del código Geohash.
 * @return Código Geohash.
 */
std::string GeohashCodec::fromBits(uint64_t bits, size_t geohashLength) {
    checkGeohashLength(geohashLength);

    std::string geohash;
    geohash.reserve(geohashLength);

    unsigned int shift = 64;
    for (size_t i = 0; i < geohashLength; i++) {
        shift -= Base32::BITS_PER_SYMBOL;
        geohash.push_back(Base32::encode((bits >> shift) & 0x1F));
    }

    return geohash;
}

/*!
 * @brief Separar los bits entrelazados de longitud y latitud.
 *
 * @param bits           [in]  Bits entrelazados, alineados a la derecha.
 * @param nBits          [in]  Número de bits.
 * @param longitudeFirst [in]  `true` si el primer bit es de longitud.
 * @param lonBits        [out] Bits de longitud.
 * @param latBits        [out] Bits de latitud.
 */
void GeohashCodec::deinterleave(uint64_t bits, unsigned int nBits,
        bool longitudeFirst, uint32_t &lonBits, uint32_t &latBits) {
    lonBits = 0;
    latBits = 0;
    bool isLongitude = longitudeFirst;

    for (int i = nBits - 1; i >= 0; i--) {
        uint32_t bit = (bits >> i) & 1;
        if (isLongitude)
            lonBits = lonBits << 1 | bit;
        else
            latBits = latBits << 1 | bit;
        isLongitude = !isLongitude;
    }
}

/*!
 * @brief Entrelazar bits de longitud y latitud.
 *
 * @param lonBits        [in] Bits de longitud.
 * @param latBits        [in] Bits de latitud.
 * @param nBits          [in] Número total de bits.
 * @param longitudeFirst [in] `true` si el primer bit es de longitud.
 * @return Bits entrelazados, alineados a la derecha.
 */
uint64_t GeohashCodec::interleave(uint32_t lonBits, uint32_t latBits,
        unsigned int nBits, bool longitudeFirst) {
    /*
     * Con un número impar de bits, el eje que comienza
     * tiene un bit más que el otro.
     */
    unsigned int nLonBits = longitudeFirst ? (nBits + 1) / 2 : nBits / 2;
    unsigned int nLatBits = nBits - nLonBits;

    uint64_t bits = 0;
    bool isLongitude = longitudeFirst;

    for (unsigned int i = 0; i < nBits; i++) {
        uint64_t bit;
        if (isLongitude)
            bit = (lonBits >> --nLonBits) & 1;
        else
            bit = (latBits >> --nLatBits) & 1;
        bits = bits << 1 | bit;
        isLongitude = !isLongitude;
    }

    return bits;
}

/*
 * Validación.
 */

/*!
 * @brief Validar un código Geohash y pasarlo a minúsculas.
 *
 * @param geohash [in] Código Geohash.
 * @return Código Geohash en minúsculas.
 */
std::string GeohashCodec::normalize(const std::string &geohash) {
    if (geohash.empty())
        throw InvalidLengthError("Geohash cannot be empty");

    if (geohash.length() > MAX_GEOHASH_LENGTH)
        throw InvalidLengthError("Geohash longer than 12 characters");

    std::string normalized;
    normalized.reserve(geohash.length());

    for (char c : geohash) {
        int idx = Base32::decode(c);
        if (idx < 0)
            throw InvalidCharacterError("Invalid character in geohash");
        normalized.push_back(Base32::ALPHABET[idx]);
    }

    return normalized;
}

/*!
 * @brief Verificar si un código Geohash es válido.
 *
 * @param geohash [in] Código Geohash.
 * @return `true` si no está vacío, no excede 12 símbolos y todos
 * pertenecen al alfabeto.
 */
bool GeohashCodec::isValid(const std::string &geohash) {
    return !geohash.empty() && geohash.length() <= MAX_GEOHASH_LENGTH
            && std::all_of(geohash.begin(), geohash.end(), Base32::isValid);
}

/*!
 * @brief Validar la longitud de un código Geohash.
 *
 * @param geohashLength [in] Longitud (1 a 12).
 */
void GeohashCodec::checkGeohashLength(size_t geohashLength) {
    if (geohashLength < 1 || geohashLength > MAX_GEOHASH_LENGTH)
        throw InvalidLengthError("Precision must be between 1 and 12");
}
