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
 * @file GeohashStationaryMobility.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <omnetpp.h>
#include "inet/mobility/static/StationaryMobility.h"
#include "inet/common/geometry/common/GeographicCoordinateSystem.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashLocation.h"
#include "geohash_proj/mobility/LocationEncoder.h"
#include "geohash_proj/locationservice/GeohashLocationTable.h"

namespace geohash_proj {

/*!
 * @brief Movilidad estacionaria de un *host* con ubicación Geohash.
 *
 * Convierte la posición del *host* en el lienzo a coordenadas geográficas,
 * la codifica y la registra en la tabla de ubicaciones.
 */
class GEOHASH_PROJ_API GeohashStationaryMobility: public inet::StationaryMobility {

private:

    /*
     * Contexto.
     */
    //! Sistema de coordenadas geográficas de la escena.
    inet::IGeographicCoordinateSystem *coordinateSystem = nullptr;
    //! Tabla de ubicaciones de *hosts*; nula si no se registra.
    GeohashLocationTable *locationTable = nullptr;

    /*
     * Parámetros.
     */
    //! Codificador configurado con `geohashLength` y `strictEncoding`.
    LocationEncoder locationEncoder { GeohashCodec::DEFAULT_GEOHASH_LENGTH };

    /*
     * Atributos.
     */
    //! Ubicación Geohash.
    GeohashLocation geohashLocation;

protected:

    /*
     * Interfaz del módulo.
     */
    virtual int numInitStages() const override {
        return inet::NUM_INIT_STAGES;
    }
    /*!
     * @brief Inicialización.
     *
     * @param stage [in] Etapa de inicialización.
     */
    virtual void initialize(int stage) override;

public:

    /*
     * Acceso a los atributos.
     */
    const GeohashLocation& getGeohashLocation() const {
        return geohashLocation;
    }

    /*!
     * @brief Codificar una ubicación geográfica según la configuración.
     *
     * @param latitude  [in] Latitud.
     * @param longitude [in] Longitud.
     * @return Ubicación Geohash.
     * @throw omnetpp::cRuntimeError Coordenadas no codificables.
     */
    GeohashLocation encodeLocation(double latitude, double longitude) const {
        return locationEncoder.encode(latitude, longitude);
    }
};

}    // namespace geohash_proj
