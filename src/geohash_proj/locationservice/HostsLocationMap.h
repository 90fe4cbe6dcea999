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
 * @file HostsLocationMap.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include "geohash_proj/geohash/GeohashAdjacency.h"
#include "geohash_proj/geohash/GeohashLocation.h"
#include <map>
#include <string>
#include <vector>

namespace geohash_proj {

/*!
 * @brief Diccionario de ubicaciones Geohash de *hosts*.
 *
 * Contiene las consultas de la tabla de ubicaciones sin depender
 * del núcleo de simulación. Los *hosts* se identifican por su ruta
 * completa y se recorren en orden de ruta.
 */
class GEOHASH_PROJ_API HostsLocationMap {

private:

    typedef std::map<std::string, GeohashLocation> LocationMap;
    //! Ubicación de cada *host*.
    LocationMap hostsLocation;

public:

    /*!
     * @brief Registrar la ubicación de un *host*.
     *
     * Si el *host* ya estaba registrado, se reemplaza su ubicación.
     *
     * @param hostPath        [in] Ruta completa del *host*.
     * @param geohashLocation [in] Ubicación Geohash del *host*.
     * @throw omnetpp::cRuntimeError La ubicación es nula.
     */
    void registerHostLocation(const std::string &hostPath,
            const GeohashLocation &geohashLocation);
    /*!
     * @brief Obtener ubicación de un *host*.
     *
     * @param hostPath [in] Ruta completa del *host*.
     * @return Ubicación Geohash del *host*.
     * @throw omnetpp::cRuntimeError El *host* no está registrado.
     */
    const GeohashLocation& getHostLocation(const std::string &hostPath) const;
    bool hasHostLocation(const std::string &hostPath) const {
        return hostsLocation.find(hostPath) != hostsLocation.end();
    }
    size_t size() const {
        return hostsLocation.size();
    }
    bool empty() const {
        return hostsLocation.empty();
    }

    /*!
     * @brief Obtener los *hosts* que se encuentran en una región Geohash.
     *
     * @param geohash [in] Código Geohash de la región.
     * @return Rutas de los *hosts* cuyo código Geohash empieza
     * por el de la región.
     */
    std::vector<std::string> getHostsInRegion(const std::string &geohash) const;
    /*!
     * @brief Obtener los *hosts* que se encuentran en una región adyacente.
     *
     * @param geohash   [in] Código Geohash de la región.
     * @param direction [in] Dirección de la adyacencia.
     * @return Rutas de los *hosts*; vacío si la región adyacente está
     * más allá de un polo.
     */
    std::vector<std::string> getHostsInAdjacentRegion(
            const std::string &geohash,
            GeohashAdjacency::Direction direction) const;
    /*!
     * @brief Obtener el centroide de los *hosts* registrados.
     *
     * @param geohashLength [in] Longitud del código resultante.
     * @return Código Geohash de la ubicación media.
     * @throw omnetpp::cRuntimeError No hay *hosts* registrados.
     */
    std::string getCentroid(size_t geohashLength) const;
    //! Códigos Geohash de todos los *hosts*, en orden de ruta.
    std::vector<std::string> getGeohashes() const;
};

}    // namespace geohash_proj
