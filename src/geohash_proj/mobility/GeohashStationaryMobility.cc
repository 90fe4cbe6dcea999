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
 * @file GeohashStationaryMobility.cc
 */

#include "geohash_proj/mobility/GeohashStationaryMobility.h"
#include "inet/common/ModuleAccess.h"
#include "inet/common/geometry/common/Coord.h"

using namespace geohash_proj;

Define_Module(GeohashStationaryMobility);

/*
 * Interfaz del módulo.
 */

void GeohashStationaryMobility::initialize(int stage) {
    inet::StationaryMobility::initialize(stage);

    /*
     * Etapa de inicialización local.
     */
    if (stage == inet::INITSTAGE_LOCAL) {
        /*
         * Parámetros.
         */
        int length = par("geohashLength");
        if (length < 1
                || length > static_cast<int>(GeohashCodec::MAX_GEOHASH_LENGTH))
            throw omnetpp::cRuntimeError("Invalid geohashLength %d", length);
        locationEncoder = LocationEncoder(length,
                par("strictEncoding").boolValue());

        /*
         * Contexto.
         */
        omnetpp::cModule *module = getModuleByPath(
                par("coordinateSystemModule").stringValue());
        if (!module)
            throw omnetpp::cRuntimeError("No coordinate system module found");
        coordinateSystem = omnetpp::check_and_cast<
                inet::IGeographicCoordinateSystem*>(module);

        std::string tablePath = par("locationTableModule").stdstringValue();
        if (!tablePath.empty()) {
            module = getModuleByPath(tablePath.c_str());
            if (!module)
                throw omnetpp::cRuntimeError(
                        "No location table module found at %s",
                        tablePath.c_str());
            locationTable = omnetpp::check_and_cast<GeohashLocationTable*>(
                    module);
        }

        /*
         * Etapa de inicialización de movilidad.
         */
    } else if (stage == inet::INITSTAGE_SINGLE_MOBILITY) {
        /*
         * Se obtiene la ubicación geográfica a partir de la
         * ubicación en el lienzo.
         */
        inet::Coord position = getCurrentPosition();
        inet::GeoCoord inetLocation =
                coordinateSystem->computeGeographicCoordinate(position);
        geohashLocation = encodeLocation(inetLocation.latitude.get(),
                inetLocation.longitude.get());

        EV_INFO << "Geohash location: " << geohashLocation.getGeohash()
                       << std::endl;
        EV_INFO << "                : "
                       << geohashLocation.getBounds().str() << std::endl;

        if (locationTable)
            locationTable->registerHostLocation(
                    inet::getContainingNode(this)->getFullPath(), geohashLocation);
    }
}
