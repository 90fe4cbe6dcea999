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
 * @file GeohashLocation.h
 */

#pragma once

#include <GeographicLib/GeoCoords.hpp>
#include "geohash_proj/geohash_proj.h"
#include <omnetpp.h>
#include "geohash_proj/geohash/Bounds.h"
#include "geohash_proj/geohash/GeohashAdjacency.h"
#include <cstdint>
#include <string>

namespace geohash_proj {

/*!
 * @brief Clase que representa ubicaciones y regiones en codificación Geohash.
 *
 * Una ubicación construida a partir de una ubicación geográfica conserva
 * esa ubicación; una construida a partir de un código Geohash o de una
 * cadena de bits toma el centro de la región.
 */
class GEOHASH_PROJ_API GeohashLocation: public omnetpp::cObject {

public:

    //! Dirección de adyacencia entre regiones.
    typedef GeohashAdjacency::Direction Adjacency;

private:

    /*
     * Atributos.
     */
    //! Ubicación geográfica.
    GeographicLib::GeoCoords location;
    //! Código Geohash.
    std::string geohash;
    //! Cadena de bits del código Geohash.
    uint64_t bits;
    //! Límites de la región.
    Bounds bounds;

public:

    /*
     * Contructores.
     */
    /*!
     * @brief Contruir ubicación Geohash nula.
     */
    GeohashLocation();
    /*!
     * @brief Contruir ubicación Geohash a partir de una ubicación geográfica
     * y la longitud del código.
     *
     * @param location      [in] Ubicación geográfica.
     * @param geohashLength [in] Longitud del código Geohash (1 a 12).
     * @throw InvalidLengthError Longitud fuera de rango.
     */
    GeohashLocation(const GeographicLib::GeoCoords &location,
            size_t geohashLength);
    /*!
     * @brief Contruir ubicación Geohash a partir de un código Geohash.
     *
     * @param geohash [in] Código Geohash.
     * @throw InvalidLengthError    Código vacío o demasiado largo.
     * @throw InvalidCharacterError Símbolo fuera del alfabeto.
     */
    explicit GeohashLocation(const std::string &geohash);
    /*!
     * @brief Construir ubicación Geohash a partir de una cadena de bits
     * y la longitud del código.
     *
     * @param bits          [in] Cadena de bits alineada a la izquierda.
     * @param geohashLength [in] Longitud del código Geohash (1 a 12).
     */
    GeohashLocation(uint64_t bits, size_t geohashLength);

    /*
     * Sobrecarga de operadores.
     */
    bool operator ==(const GeohashLocation &other) const {
        return geohash == other.geohash;
    }
    bool operator !=(const GeohashLocation &other) const {
        return geohash != other.geohash;
    }

    /*
     * Acceso a los atributos.
     */
    const GeographicLib::GeoCoords& getLocation() const {
        return location;
    }
    //! Centro de la región Geohash.
    GeographicLib::GeoCoords getCenter() const {
        return bounds.getCenter();
    }
    const std::string& getGeohash() const {
        return geohash;
    }
    size_t getGeohashLength() const {
        return geohash.length();
    }
    uint64_t getBits() const {
        return bits;
    }
    const Bounds& getBounds() const {
        return bounds;
    }

    /*
     * Modificación de atributos.
     */
    /*!
     * @brief Modificar la ubicación geográfica.
     *
     * Se conserva la longitud del código Geohash. Si la ubicación Geohash
     * es nula se usa la longitud por omisión.
     *
     * @param location [in] Nueva ubicación geográfica.
     */
    void setLocation(const GeographicLib::GeoCoords &location);
    void setGeohash(const std::string &geohash);
    /*!
     * @brief Modificar la cadena de bits del código Geohash.
     *
     * Se conserva la longitud del código Geohash.
     *
     * @param bits [in] Nueva cadena de bits.
     * @throw InvalidLengthError La ubicación Geohash es nula.
     */
    void setBits(uint64_t bits);

    /*
     * Ubicación Geohash nula.
     */
    bool isNull() const {
        return geohash.empty();
    }
    void setNull();

    /*
     * Operaciones geográficas.
     */
    /*!
     * @brief Calcular distancia geodésica a una ubicación.
     *
     * @param location [in] Ubicación cuya distancia se busca.
     * @return Distancia en metros sobre el elipsoide WGS84.
     */
    double getDistance(const GeographicLib::GeoCoords &location) const;
    double getDistance(const GeohashLocation &geohashLocation) const {
        return getDistance(geohashLocation.getLocation());
    }
    bool contains(const GeographicLib::GeoCoords &location) const {
        return !isNull() && bounds.contains(location);
    }
    /*!
     * @brief Verificar si una región Geohash está dentro de la región.
     *
     * @param geohashLocation [in] Ubicación Geohash que se verifica.
     * @return `true` si el código de esta región es prefijo del otro.
     */
    bool contains(const GeohashLocation &geohashLocation) const;
    /*!
     * @brief Obtener una región Geohash adyacente.
     *
     * @param adjacency [in] Dirección de adyacencia.
     * @return Región Geohash adyacente, de la misma longitud.
     * @throw NoAdjacentRegionError La región adyacente está más allá
     * de un polo.
     */
    GeohashLocation getAdjacentGeohashRegion(Adjacency adjacency) const;

    virtual std::string str() const override;
};

}    // namespace geohash_proj
