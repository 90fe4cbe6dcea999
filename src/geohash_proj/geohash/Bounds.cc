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
 * @file Bounds.cc
 */

#include "geohash_proj/geohash/Bounds.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <cmath>
#include <sstream>
#include <iomanip>

using namespace geohash_proj;

/*
 * Constructores.
 */

/*!
 * @brief Construir una región que abarca el mundo entero.
 */
Bounds::Bounds() {
    north = 90.0;
    east = 180.0;
    south = -90.0;
    west = -180.0;
}

/*!
 * @brief Construir una región a partir de sus límites.
 *
 * @param north [in] Latitud norte.
 * @param east  [in] Longitud este.
 * @param south [in] Latitud sur.
 * @param west  [in] Longitud oeste.
 */
Bounds::Bounds(double north, double east, double south, double west) {
    this->setBounds(north, east, south, west);
}

/*
 * Modificación de los atributos.
 */

/*!
 * @brief Modificar los límites de la región.
 *
 * Primero se restablece el rango completo para que las validaciones
 * de cada límite no dependan de los límites anteriores.
 *
 * @param north [in] Latitud norte.
 * @param east  [in] Longitud este.
 * @param south [in] Latitud sur.
 * @param west  [in] Longitud oeste.
 */
void Bounds::setBounds(double north, double east, double south, double west) {
    this->north = 90.0;
    this->east = 180.0;
    this->south = -90.0;
    this->west = -180.0;
    setNorth(north);
    setEast(east);
    setSouth(south);
    setWest(west);
}

/*!
 * @brief Modificar la latitud norte.
 *
 * @param north [in] Latitud norte.
 */
void Bounds::setNorth(double north) {
    if (std::isnan(north) || north < -90.0 || 90.0 < north)
        throw InvalidCoordinateError("North latitude out of range (-90, 90)");

    if (north < this->south)
        throw InvalidCoordinateError("North less than south");

    this->north = north;
}

/*!
 * @brief Modificar la longitud este.
 *
 * @param east [in] Longitud este.
 */
void Bounds::setEast(double east) {
    if (std::isnan(east) || east < -180.0 || 180.0 < east)
        throw InvalidCoordinateError(
                "East longitude out of range (-180, 180)");

    if (east < this->west)
        throw InvalidCoordinateError("East less than west");

    this->east = east;
}

/*!
 * @brief Modificar la latitud sur.
 *
 * @param south [in] Latitud sur.
 */
void Bounds::setSouth(double south) {
    if (std::isnan(south) || south < -90.0 || 90.0 < south)
        throw InvalidCoordinateError("South latitude out of range (-90, 90)");

    if (south > this->north)
        throw InvalidCoordinateError("South greater than north");

    this->south = south;
}

/*!
 * @brief Modificar la longitud oeste.
 *
 * @param west [in] Longitud oeste.
 */
void Bounds::setWest(double west) {
    if (std::isnan(west) || west < -180.0 || 180.0 < west)
        throw InvalidCoordinateError(
                "West longitude out of range (-180, 180)");

    if (west > this->east)
        throw InvalidCoordinateError("West greater than east");

    this->west = west;
}

/*
 * Operaciones geográficas.
 */

/*!
 * @brief Verificar si la región contiene un punto.
 *
 * Los límites se consideran parte de la región.
 *
 * @param lat [in] Latitud.
 * @param lon [in] Longitud.
 * @return `true` si el punto está dentro de la región.
 */
bool Bounds::contains(const double &lat, const double &lon) const {
    return south <= lat && lat <= north && west <= lon && lon <= east;
}

/*!
 * @brief Verificar si dos regiones se intersecan.
 *
 * @param other [in] Otra región.
 * @return `true` si las regiones comparten al menos un punto.
 */
bool Bounds::intersects(const Bounds &other) const {
    return !(north < other.south || south > other.north || east < other.west
            || west > other.east);
}

/*!
 * @brief Representación textual de la región.
 *
 * @return `(sur, oeste, norte, este)`.
 */
std::string Bounds::str() const {
    std::ostringstream out;
    out << std::setprecision(12) << "(" << south << ", " << west << ", "
            << north << ", " << east << ")";
    return out.str();
}
