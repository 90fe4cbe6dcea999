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
 * @file Bounds.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <GeographicLib/GeoCoords.hpp>
#include <omnetpp.h>
#include <string>

namespace geohash_proj {

/*!
 * @brief Clase que representa los límites de una región rectangular.
 *
 * Equivale a la caja delimitadora `(min_lat, min_lon, max_lat, max_lon)`,
 * donde `min_lat` es el sur, `min_lon` el oeste, `max_lat` el norte
 * y `max_lon` el este. Los límites son cerrados.
 */
class GEOHASH_PROJ_API Bounds: public omnetpp::cObject {

private:

    /*
     * Atributos
     */
    //! Latitud norte.
    double north;
    //! Longitud este
    double east;
    //! Latitud sur.
    double south;
    //! Longitud oeste.
    double west;

public:

    /*
     * Constructores.
     */
    /*!
     * @brief Crear una región que abarca el rango completo
     * de latitud y longitud.
     */
    Bounds();
    /*!
     * @brief Crea una región con los límites indicados.
     *
     * @param north [in] Latitud norte.
     * @param east  [in] Longitud este.
     * @param south [in] Latitud sur.
     * @param west  [in] Longitud oeste.
     */
    Bounds(double north, double east, double south, double west);

    /*
     * Acceso a los atributos.
     */
    double getNorth() const {
        return this->north;
    }
    double getEast() const {
        return this->east;
    }
    double getSouth() const {
        return this->south;
    }
    double getWest() const {
        return this->west;
    }
    //! Altura de la región en grados de latitud.
    double getHeight() const {
        return north - south;
    }
    //! Ancho de la región en grados de longitud.
    double getWidth() const {
        return east - west;
    }
    //! Centro de la región.
    GeographicLib::GeoCoords getCenter() const {
        return GeographicLib::GeoCoords((north + south) / 2.0,
                (east + west) / 2.0);
    }

    /*
     * Modificación de los atributos.
     */
    /*!
     * @brief Modificar los límites de la región.
     *
     * @param north [in] Latitud norte.
     * @param east  [in] Longitud este.
     * @param south [in] Latitud sur.
     * @param west  [in] Longitud oeste.
     */
    void setBounds(double north, double east, double south, double west);
    void setNorth(double north);
    void setEast(double east);
    void setSouth(double south);
    void setWest(double west);

    /*
     * Operaciones geográficas.
     */
    /*!
     * @brief Verificar si una ubicación geográfica está adentro de la región.
     *
     * @param lat [in] Latitud.
     * @param lon [in] Longitud.
     * @return `true` si la ubicación está adentro de la región.
     */
    bool contains(const double &lat, const double &lon) const;
    /*!
     * @brief Verificar si una ubicación geográfica está adentro de la región.
     *
     * @param location [in] Ubicación geográfica.
     * @return `true` si la ubicación está adentro de la región.
     */
    bool contains(const GeographicLib::GeoCoords &location) const {
        return contains(location.Latitude(), location.Longitude());
    }
    /*!
     * @brief Verificar si dos regiones se intersecan.
     *
     * Dos regiones que sólo comparten un borde se consideran
     * intersecadas.
     *
     * @param other [in] Región con la que se compara.
     * @return `true` si las regiones se intersecan.
     */
    bool intersects(const Bounds &other) const;

    bool operator ==(const Bounds &other) const {
        return north == other.north && east == other.east
                && south == other.south && west == other.west;
    }
    bool operator !=(const Bounds &other) const {
        return !(*this == other);
    }

    /*!
     * @brief Representación textual para el registro de eventos.
     *
     * @return Límites en el orden `(south, west, north, east)`.
     */
    virtual std::string str() const override;
};

}    // namespace geohash_proj
