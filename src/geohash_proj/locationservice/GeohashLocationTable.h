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
 * @file GeohashLocationTable.h
 */

#pragma once

#include "geohash_proj/geohash_proj.h"
#include <omnetpp.h>
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashLocation.h"
#include "geohash_proj/locationservice/HostsLocationMap.h"
#include <string>
#include <vector>

namespace geohash_proj {

/*!
 * @brief Módulo global que contiene las ubicaciones Geohash de los *hosts*.
 *
 * Cumple la función de servicio de localización: cada *host* registra
 * su ubicación durante la inicialización y los demás módulos la
 * consultan por la ruta completa del *host*.
 */
class GEOHASH_PROJ_API GeohashLocationTable: public omnetpp::cSimpleModule {

private:

    //! Tabla de ubicaciones de *hosts*.
    HostsLocationMap hostsLocation;
    //! Longitud del código Geohash del centroide.
    size_t centroidLength = GeohashCodec::DEFAULT_GEOHASH_LENGTH;

protected:

    /*
     * Interfaz del módulo.
     */
    virtual void initialize() override;
    /*!
     * @brief Manejo de mensajes.
     *
     * Este módulo no recibe ningún mensaje.
     *
     * @param message [in] Mensaje a procesar.
     */
    virtual void handleMessage(omnetpp::cMessage *message) override;
    /*!
     * @brief Finalización.
     *
     * Registra el número de *hosts* y su dispersión alrededor
     * del centroide.
     */
    virtual void finish() override;

public:

    /*!
     * @brief Registrar la ubicación de un *host*.
     *
     * Si el *host* ya estaba registrado, se reemplaza su ubicación.
     *
     * @param hostPath        [in] Ruta completa del *host*.
     * @param geohashLocation [in] Ubicación Geohash del *host*.
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
    const GeohashLocation& getHostLocation(const std::string &hostPath) const {
        return hostsLocation.getHostLocation(hostPath);
    }
    bool hasHostLocation(const std::string &hostPath) const {
        return hostsLocation.hasHostLocation(hostPath);
    }
    size_t getNumHosts() const {
        return hostsLocation.size();
    }
    /*!
     * @brief Obtener los *hosts* que se encuentran en una región Geohash.
     *
     * @param geohash [in] Código Geohash de la región.
     * @return Rutas de los *hosts* cuyo código Geohash empieza
     * por el de la región, en orden.
     */
    std::vector<std::string> getHostsInRegion(const std::string &geohash) const {
        return hostsLocation.getHostsInRegion(geohash);
    }
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
     * @return Código Geohash de la ubicación media, con la longitud
     * del parámetro `centroidLength`.
     * @throw omnetpp::cRuntimeError No hay *hosts* registrados.
     */
    std::string getCentroid() const {
        return hostsLocation.getCentroid(centroidLength);
    }
    //! Códigos Geohash de todos los *hosts*, en orden de ruta.
    std::vector<std::string> getGeohashes() const {
        return hostsLocation.getGeohashes();
    }
};

}    // namespace geohash_proj
