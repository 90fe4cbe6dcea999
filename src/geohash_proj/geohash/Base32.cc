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
 * @file Base32.cc
 */

#include "geohash_proj/geohash/Base32.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <array>
#include <cctype>

using namespace geohash_proj;

const unsigned int Base32::SIZE;
const unsigned int Base32::BITS_PER_SYMBOL;

const char Base32::ALPHABET[Base32::SIZE + 1] =
        "0123456789bcdefghjkmnpqrstuvwxyz";

namespace {

//! Tabla de decodificación indexada por código ASCII.
typedef std::array<signed char, 128> DecodeTable;

DecodeTable buildDecodeTable() {
    DecodeTable table;
    table.fill(-1);
    for (unsigned int i = 0; i < Base32::SIZE; i++) {
        unsigned char symbol = Base32::ALPHABET[i];
        table[symbol] = i;
        table[std::toupper(symbol)] = i;
    }
    return table;
}

const DecodeTable& decodeTable() {
    static const DecodeTable table = buildDecodeTable();
    return table;
}

}    // namespace

char Base32::encode(unsigned int value) {
    if (value >= SIZE)
        throw InvalidCharacterError("Base 32 value out of range (0, 31)");

    return ALPHABET[value];
}

int Base32::decode(char symbol) {
    unsigned char code = static_cast<unsigned char>(symbol);
    if (code >= 128)
        return -1;

    return decodeTable()[code];
}
