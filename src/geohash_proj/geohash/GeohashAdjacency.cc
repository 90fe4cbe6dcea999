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
 * @file GeohashAdjacency.cc
 */

#include "geohash_proj/geohash/GeohashAdjacency.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include "geohash_proj/geohash/Base32.h"
#include <algorithm>
#include <cctype>

using namespace geohash_proj;

const unsigned int GeohashAdjacency::NUM_DIRECTIONS;

namespace {

/*!
 * @brief Tablas de bordes y de vecinos.
 *
 * Se indexan por dirección, paridad (1 si la longitud del código
 * es impar) y valor del símbolo.
 */
struct AdjacencyTables {
    bool border[GeohashAdjacency::NUM_DIRECTIONS][2][Base32::SIZE];
    unsigned char neighbour[GeohashAdjacency::NUM_DIRECTIONS][2][Base32::SIZE];
};

//! Desplazamiento en columnas (longitud) de cada dirección.
const int DX[GeohashAdjacency::NUM_DIRECTIONS] = { 0, 1, 0, -1 };
//! Desplazamiento en filas (latitud) de cada dirección.
const int DY[GeohashAdjacency::NUM_DIRECTIONS] = { 1, 0, -1, 0 };

/*!
 * @brief Generar las tablas.
 *
 * Cada símbolo identifica una subregión de su región padre. En un código
 * de longitud impar el último símbolo tiene 3 bits de longitud y 2 de
 * latitud (8 columnas por 4 filas); en uno de longitud par, 2 y 3
 * (4 columnas por 8 filas). La subregión vecina se obtiene desplazando
 * la columna o la fila; si el desplazamiento sale de la región padre,
 * el símbolo es de borde y la subregión da la vuelta.
 */
AdjacencyTables buildAdjacencyTables() {
    AdjacencyTables tables;

    for (unsigned int d = 0; d < GeohashAdjacency::NUM_DIRECTIONS; d++) {
        for (unsigned int odd = 0; odd < 2; odd++) {
            bool longitudeFirst = odd == 1;
            int nColumns = longitudeFirst ? 8 : 4;
            int nRows = longitudeFirst ? 4 : 8;

            for (unsigned int symbol = 0; symbol < Base32::SIZE; symbol++) {
                uint32_t lonBits, latBits;
                GeohashCodec::deinterleave(symbol, Base32::BITS_PER_SYMBOL,
                        longitudeFirst, lonBits, latBits);

                int column = static_cast<int>(lonBits) + DX[d];
                int row = static_cast<int>(latBits) + DY[d];

                tables.border[d][odd][symbol] = column < 0
                        || column >= nColumns || row < 0 || row >= nRows;

                column = (column + nColumns) % nColumns;
                row = (row + nRows) % nRows;

                tables.neighbour[d][odd][symbol] =
                        static_cast<unsigned char>(GeohashCodec::interleave(
                                column, row, Base32::BITS_PER_SYMBOL,
                                longitudeFirst));
            }
        }
    }

    return tables;
}

const AdjacencyTables& adjacencyTables() {
    static const AdjacencyTables tables = buildAdjacencyTables();
    return tables;
}

}    // namespace

/*
 * Adyacencia.
 */

/*!
 * @brief Obtener el código Geohash de la región adyacente.
 *
 * @param geohash   [in] Código Geohash.
 * @param direction [in] Dirección de la adyacencia.
 * @return Código Geohash de la región adyacente.
 */
std::string GeohashAdjacency::getAdjacent(const std::string &geohash,
        Direction direction) {
    checkDirection(direction);

    return adjacent(GeohashCodec::normalize(geohash), direction);
}

/*!
 * @brief Obtener el código Geohash de la región adyacente.
 *
 * @param geohash       [in] Código Geohash.
 * @param directionName [in] Nombre de la dirección.
 * @return Código Geohash de la región adyacente.
 */
std::string GeohashAdjacency::getAdjacent(const std::string &geohash,
        const std::string &directionName) {
    Direction direction = parseDirection(directionName);

    return adjacent(GeohashCodec::normalize(geohash), direction);
}

/*!
 * @brief Obtener la región adyacente de un código ya normalizado.
 *
 * Si el último símbolo está en el borde de la región padre, primero
 * se obtiene la región adyacente de la región padre. Al llegar al primer
 * símbolo no hay región padre: en dirección este u oeste se da la vuelta
 * al mundo, y en dirección norte o sur no hay región adyacente.
 *
 * @param geohash   [in] Código Geohash normalizado.
 * @param direction [in] Dirección.
 * @return Código Geohash de la región adyacente.
 */
std::string GeohashAdjacency::adjacent(const std::string &geohash,
        Direction direction) {
    const AdjacencyTables &tables = adjacencyTables();

    unsigned int odd = geohash.length() % 2;
    unsigned int symbol = Base32::decode(geohash.back());
    std::string parent = geohash.substr(0, geohash.length() - 1);

    if (tables.border[direction][odd][symbol]) {
        if (!parent.empty())
            parent = adjacent(parent, direction);
        else if (direction == NORTH || direction == SOUTH)
            throw NoAdjacentRegionError(
                    std::string("No adjacent region ") + directionName(direction)
                            + " of " + geohash);
    }

    parent.push_back(
            Base32::ALPHABET[tables.neighbour[direction][odd][symbol]]);
    return parent;
}

/*!
 * @brief Obtener la dirección opuesta.
 *
 * @param direction [in] Dirección.
 * @return Dirección opuesta.
 */
GeohashAdjacency::Direction GeohashAdjacency::getOpposite(Direction direction) {
    checkDirection(direction);

    return static_cast<Direction>((direction + 2) % NUM_DIRECTIONS);
}

/*
 * Direcciones.
 */

/*!
 * @brief Interpretar el nombre de una dirección.
 *
 * @param directionName [in] Nombre, sin distinguir mayúsculas.
 * @return Dirección.
 */
GeohashAdjacency::Direction GeohashAdjacency::parseDirection(
        const std::string &directionName) {
    std::string name(directionName);
    std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) {return std::tolower(c);});

    if (name == "top" || name == "north")
        return NORTH;
    if (name == "right" || name == "east")
        return EAST;
    if (name == "bottom" || name == "south")
        return SOUTH;
    if (name == "left" || name == "west")
        return WEST;

    throw InvalidDirectionError("Invalid direction: " + directionName);
}

/*!
 * @brief Nombre de una dirección.
 *
 * @param direction [in] Dirección.
 * @return `top`, `right`, `bottom` o `left`.
 */
const char* GeohashAdjacency::directionName(Direction direction) {
    switch (direction) {
    case NORTH:
        return "top";
    case EAST:
        return "right";
    case SOUTH:
        return "bottom";
    case WEST:
        return "left";
    }
    throw InvalidDirectionError("Invalid direction");
}

/*!
 * @brief Validar una dirección.
 *
 * @param direction [in] Dirección.
 */
void GeohashAdjacency::checkDirection(Direction direction) {
    if (direction < NORTH || direction > WEST)
        throw InvalidDirectionError("Invalid direction");
}

/*
 * Tablas.
 */

/*!
 * @brief Verificar si un símbolo está en el borde de su región padre.
 *
 * @param symbol    [in] Valor del símbolo (0 a 31).
 * @param direction [in] Dirección.
 * @param oddLength [in] `true` si la longitud del código es impar.
 * @return `true` si el símbolo está en el borde.
 */
bool GeohashAdjacency::isBorder(unsigned int symbol, Direction direction,
        bool oddLength) {
    checkDirection(direction);
    if (symbol >= Base32::SIZE)
        throw InvalidCharacterError("Base 32 value out of range (0, 31)");

    return adjacencyTables().border[direction][oddLength ? 1 : 0][symbol];
}

/*!
 * @brief Obtener el símbolo vecino dentro de la región padre.
 *
 * @param symbol    [in] Valor del símbolo (0 a 31).
 * @param direction [in] Dirección.
 * @param oddLength [in] `true` si la longitud del código es impar.
 * @return Valor del símbolo vecino.
 */
unsigned int GeohashAdjacency::getNeighbour(unsigned int symbol,
        Direction direction, bool oddLength) {
    checkDirection(direction);
    if (symbol >= Base32::SIZE)
        throw InvalidCharacterError("Base 32 value out of range (0, 31)");

    return adjacencyTables().neighbour[direction][oddLength ? 1 : 0][symbol];
}
