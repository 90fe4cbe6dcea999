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
 * @file GeohashLocationTable.cc
 */

#include "geohash_proj/locationservice/GeohashLocationTable.h"
#include "geohash_proj/stats/GeohashStatistics.h"

using namespace geohash_proj;

Define_Module(GeohashLocationTable);

/*
 * Interfaz del módulo.
 */

void GeohashLocationTable::initialize() {
    int length = par("centroidLength");
    if (length < 1
            || length > static_cast<int>(GeohashCodec::MAX_GEOHASH_LENGTH))
        throw omnetpp::cRuntimeError("Invalid centroidLength %d", length);
    centroidLength = length;
}

void GeohashLocationTable::handleMessage(omnetpp::cMessage *message) {
    throw omnetpp::cRuntimeError("This module does not process messages");
}

void GeohashLocationTable::finish() {
    recordScalar("registeredHosts",
            static_cast<double>(hostsLocation.size()));

    if (hostsLocation.empty())
        return;

    double dispersion = GeohashStatistics::standardDeviation(getGeohashes());

    EV_INFO << "Centroid: " << getCentroid() << std::endl;
    EV_INFO << "Dispersion: " << dispersion << " m" << std::endl;

    recordScalar("dispersion", dispersion, "m");
}

/*
 * Consultas.
 */

/*!
 * @brief Registrar la ubicación de un *host*.
 *
 * @param hostPath        [in] Ruta completa del *host*.
 * @param geohashLocation [in] Ubicación Geohash del *host*.
 */
void GeohashLocationTable::registerHostLocation(const std::string &hostPath,
        const GeohashLocation &geohashLocation) {
    EV_DEBUG << "Registering " << hostPath << " at "
                    << geohashLocation.str() << std::endl;

    hostsLocation.registerHostLocation(hostPath, geohashLocation);
}

/*!
 * @brief Obtener los *hosts* que se encuentran en una región adyacente.
 *
 * @param geohash   [in] Código Geohash de la región.
 * @param direction [in] Dirección de la adyacencia.
 * @return Rutas de los *hosts*.
 */
std::vector<std::string> GeohashLocationTable::getHostsInAdjacentRegion(
        const std::string &geohash,
        GeohashAdjacency::Direction direction) const {
    std::vector<std::string> hosts = hostsLocation.getHostsInAdjacentRegion(
            geohash, direction);

    EV_DEBUG << hosts.size() << " hosts " << GeohashAdjacency::directionName(
            direction) << " of " << geohash << std::endl;

    return hosts;
}
