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
 * @file HostsLocationMap.cc
 */

#include "geohash_proj/locationservice/HostsLocationMap.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include "geohash_proj/stats/GeohashStatistics.h"
#include <omnetpp.h>

using namespace geohash_proj;

/*
 * Registro.
 */

/*!
 * @brief Registrar la ubicación de un *host*.
 *
 * @param hostPath        [in] Ruta completa del *host*.
 * @param geohashLocation [in] Ubicación Geohash del *host*.
 */
void HostsLocationMap::registerHostLocation(const std::string &hostPath,
        const GeohashLocation &geohashLocation) {
    if (geohashLocation.isNull())
        throw omnetpp::cRuntimeError("Null geohash location for host %s",
                hostPath.c_str());

    hostsLocation[hostPath] = geohashLocation;
}

/*!
 * @brief Obtener ubicación de un *host*.
 *
 * @param hostPath [in] Ruta completa del *host*.
 * @return Ubicación Geohash del *host*.
 */
const GeohashLocation& HostsLocationMap::getHostLocation(
        const std::string &hostPath) const {
    LocationMap::const_iterator it = hostsLocation.find(hostPath);
    if (it == hostsLocation.end())
        throw omnetpp::cRuntimeError("No location registered for host %s",
                hostPath.c_str());

    return it->second;
}

/*
 * Consultas por región.
 */

/*!
 * @brief Obtener los *hosts* que se encuentran en una región Geohash.
 *
 * Un *host* está en la región si el código de la región es prefijo
 * del código del *host*.
 *
 * @param geohash [in] Código Geohash de la región.
 * @return Rutas de los *hosts*, en orden.
 */
std::vector<std::string> HostsLocationMap::getHostsInRegion(
        const std::string &geohash) const {
    GeohashLocation region(geohash);

    std::vector<std::string> hosts;
    for (const LocationMap::value_type &entry : hostsLocation)
        if (region.contains(entry.second))
            hosts.push_back(entry.first);

    return hosts;
}

/*!
 * @brief Obtener los *hosts* que se encuentran en una región adyacente.
 *
 * @param geohash   [in] Código Geohash de la región.
 * @param direction [in] Dirección de la adyacencia.
 * @return Rutas de los *hosts*, en orden.
 */
std::vector<std::string> HostsLocationMap::getHostsInAdjacentRegion(
        const std::string &geohash,
        GeohashAdjacency::Direction direction) const {
    std::string adjacentGeohash;
    try {
        adjacentGeohash = GeohashAdjacency::getAdjacent(geohash, direction);
    } catch (const NoAdjacentRegionError&) {
        return std::vector<std::string>();
    }

    return getHostsInRegion(adjacentGeohash);
}

/*
 * Estadísticas.
 */

/*!
 * @brief Obtener el centroide de los *hosts* registrados.
 *
 * @param geohashLength [in] Longitud del código resultante.
 * @return Código Geohash de la media de los centros de las regiones.
 */
std::string HostsLocationMap::getCentroid(size_t geohashLength) const {
    if (hostsLocation.empty())
        throw omnetpp::cRuntimeError("No hosts registered");

    return GeohashStatistics::mean(getGeohashes(), geohashLength);
}

std::vector<std::string> HostsLocationMap::getGeohashes() const {
    std::vector<std::string> geohashes;
    geohashes.reserve(hostsLocation.size());
    for (const LocationMap::value_type &entry : hostsLocation)
        geohashes.push_back(entry.second.getGeohash());
    return geohashes;
}
