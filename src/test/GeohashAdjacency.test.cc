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
 * @file GeohashAdjacency.test.cc
 */

#include <boost/test/unit_test.hpp>
#include "geohash_proj/geohash/GeohashAdjacency.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include "geohash_proj/geohash/Base32.h"
#include <cmath>
#include <string>

using namespace geohash_proj;

namespace {

typedef GeohashAdjacency Adj;

/*
 * Tablas clásicas, indexadas por dirección y por paridad (0 para
 * longitud par). El símbolo vecino de c es ALPHABET[tabla.find(c)].
 */
const char *const CLASSIC_NEIGHBOUR[4][2] = {
        { "p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx" },
        { "bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy" },
        { "14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp" },
        { "238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb" } };

const char *const CLASSIC_BORDER[4][2] = {
        { "prxz", "bcfguvyz" },
        { "bcfguvyz", "prxz" },
        { "028b", "0145hjnp" },
        { "0145hjnp", "028b" } };

}    // namespace

BOOST_AUTO_TEST_SUITE(geohash_adjacency)

BOOST_AUTO_TEST_CASE(tables_match_classic_tables) {
    for (unsigned int d = 0; d < Adj::NUM_DIRECTIONS; d++) {
        Adj::Direction direction = static_cast<Adj::Direction>(d);
        for (unsigned int odd = 0; odd < 2; odd++) {
            std::string neighbours(CLASSIC_NEIGHBOUR[d][odd]);
            std::string borders(CLASSIC_BORDER[d][odd]);
            for (unsigned int symbol = 0; symbol < Base32::SIZE; symbol++) {
                char c = Base32::ALPHABET[symbol];
                BOOST_TEST(Adj::getNeighbour(symbol, direction, odd == 1)
                        == neighbours.find(c));
                BOOST_TEST(Adj::isBorder(symbol, direction, odd == 1)
                        == (borders.find(c) != std::string::npos));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(adjacent_regions) {
    BOOST_TEST(Adj::getAdjacent("gbsuv", "right") == "gbsuy");
    BOOST_TEST(Adj::getAdjacent("gbsuv", "left") == "gbsuu");
    BOOST_TEST(Adj::getAdjacent("gbsuv", "top") == "gbsvj");
    BOOST_TEST(Adj::getAdjacent("gbsuv", "bottom") == "gbsut");

    BOOST_TEST(Adj::getAdjacent("u00000", "right") == "u00002");
    BOOST_TEST(Adj::getAdjacent("u00000", "left") == "gbpbpb");
    BOOST_TEST(Adj::getAdjacent("u00000", "top") == "u00001");
    BOOST_TEST(Adj::getAdjacent("u00000", "bottom") == "spbpbp");

    BOOST_TEST(Adj::getAdjacent("kd3ybyu", Adj::EAST) == "kd3ybyv");
    BOOST_TEST(Adj::getAdjacent("kd3ybyu", Adj::WEST) == "kd3ybyg");
    BOOST_TEST(Adj::getAdjacent("kd3ybyu", Adj::NORTH) == "kd3ybzh");
    BOOST_TEST(Adj::getAdjacent("kd3ybyu", Adj::SOUTH) == "kd3ybys");

    BOOST_TEST(Adj::getAdjacent("k0000000", Adj::EAST) == "k0000002");
    BOOST_TEST(Adj::getAdjacent("k0000000", Adj::WEST) == "7bpbpbpb");
    BOOST_TEST(Adj::getAdjacent("k0000000", Adj::NORTH) == "k0000001");
    BOOST_TEST(Adj::getAdjacent("k0000000", Adj::SOUTH) == "hpbpbpbp");
}

BOOST_AUTO_TEST_CASE(poles_have_no_adjacent_region) {
    BOOST_TEST(Adj::getAdjacent("gzzzzz", "right") == "upbpbp");
    BOOST_TEST(Adj::getAdjacent("gzzzzz", "left") == "gzzzzx");
    BOOST_TEST(Adj::getAdjacent("gzzzzz", "bottom") == "gzzzzy");
    BOOST_CHECK_THROW(Adj::getAdjacent("gzzzzz", "top"), NoAdjacentRegionError);

    BOOST_TEST(Adj::getAdjacent("5bpbpbh", "right") == "5bpbpbj");
    BOOST_TEST(Adj::getAdjacent("5bpbpbh", "left") == "5bpbpb5");
    BOOST_TEST(Adj::getAdjacent("5bpbpbh", "top") == "5bpbpbk");
    BOOST_CHECK_THROW(Adj::getAdjacent("5bpbpbh", "bottom"), NoAdjacentRegionError);

    BOOST_CHECK_THROW(Adj::getAdjacent("z", Adj::NORTH), NoAdjacentRegionError);
    BOOST_CHECK_THROW(Adj::getAdjacent("0", Adj::SOUTH), NoAdjacentRegionError);
}

BOOST_AUTO_TEST_CASE(antimeridian_wraps) {
    BOOST_TEST(Adj::getAdjacent("z", Adj::EAST) == "b");
    BOOST_TEST(Adj::getAdjacent("b", Adj::WEST) == "z");
    BOOST_TEST(Adj::getAdjacent("zzzz", Adj::EAST) == "bpbp");
    BOOST_TEST(Adj::getAdjacent("bpbp", Adj::WEST) == "zzzz");
}

BOOST_AUTO_TEST_CASE(direction_names) {
    BOOST_TEST(Adj::parseDirection("top") == Adj::NORTH);
    BOOST_TEST(Adj::parseDirection("North") == Adj::NORTH);
    BOOST_TEST(Adj::parseDirection("RIGHT") == Adj::EAST);
    BOOST_TEST(Adj::parseDirection("east") == Adj::EAST);
    BOOST_TEST(Adj::parseDirection("bottom") == Adj::SOUTH);
    BOOST_TEST(Adj::parseDirection("south") == Adj::SOUTH);
    BOOST_TEST(Adj::parseDirection("Left") == Adj::WEST);
    BOOST_TEST(Adj::parseDirection("west") == Adj::WEST);
    BOOST_TEST(std::string(Adj::directionName(Adj::SOUTH)) == "bottom");
    BOOST_TEST(Adj::getOpposite(Adj::NORTH) == Adj::SOUTH);
    BOOST_TEST(Adj::getOpposite(Adj::WEST) == Adj::EAST);

    BOOST_CHECK_THROW(Adj::parseDirection("up"), InvalidDirectionError);
    BOOST_CHECK_THROW(Adj::parseDirection(""), InvalidDirectionError);
    BOOST_CHECK_THROW(Adj::getAdjacent("ezs42", static_cast<Adj::Direction>(7)),
            InvalidDirectionError);
}

BOOST_AUTO_TEST_CASE(input_validation) {
    BOOST_TEST(Adj::getAdjacent("GBSUV", "right") == "gbsuy");

    BOOST_CHECK_THROW(Adj::getAdjacent("abc", "up"), InvalidDirectionError);
    BOOST_CHECK_THROW(Adj::getAdjacent("abc", "top"), InvalidCharacterError);
    BOOST_CHECK_THROW(Adj::getAdjacent("", "top"), InvalidLengthError);
    BOOST_CHECK_THROW(Adj::getAdjacent("ezs42e44yx96z", Adj::EAST), InvalidLengthError);
}

BOOST_AUTO_TEST_CASE(opposite_steps_cancel) {
    for (double lat = -88.3; lat < 90; lat += 4.1) {
        for (double lon = -179.7; lon < 180; lon += 6.7) {
            for (size_t length = 1; length <= GeohashCodec::MAX_GEOHASH_LENGTH;
                    length += 3) {
                std::string geohash = GeohashCodec::encode(lat, lon, length);

                BOOST_TEST(Adj::getAdjacent(Adj::getAdjacent(geohash, Adj::EAST),
                        Adj::WEST) == geohash);
                BOOST_TEST(Adj::getAdjacent(Adj::getAdjacent(geohash, Adj::WEST),
                        Adj::EAST) == geohash);

                Bounds bounds = GeohashCodec::decodeBounds(geohash);
                if (bounds.getNorth() < 90) {
                    BOOST_TEST(Adj::getAdjacent(Adj::getAdjacent(geohash, Adj::NORTH),
                            Adj::SOUTH) == geohash);
                }
                if (bounds.getSouth() > -90) {
                    BOOST_TEST(Adj::getAdjacent(Adj::getAdjacent(geohash, Adj::SOUTH),
                            Adj::NORTH) == geohash);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(adjacent_region_shares_border) {
    std::string geohash = GeohashCodec::encode(42.6, -5.6, 7);
    Bounds bounds = GeohashCodec::decodeBounds(geohash);

    Bounds north = GeohashCodec::decodeBounds(Adj::getAdjacent(geohash, Adj::NORTH));
    BOOST_TEST(north.getSouth() == bounds.getNorth());
    BOOST_TEST(north.getWest() == bounds.getWest());

    Bounds east = GeohashCodec::decodeBounds(Adj::getAdjacent(geohash, Adj::EAST));
    BOOST_TEST(east.getWest() == bounds.getEast());
    BOOST_TEST(east.getSouth() == bounds.getSouth());

    Bounds south = GeohashCodec::decodeBounds(Adj::getAdjacent(geohash, Adj::SOUTH));
    BOOST_TEST(south.getNorth() == bounds.getSouth());

    Bounds west = GeohashCodec::decodeBounds(Adj::getAdjacent(geohash, Adj::WEST));
    BOOST_TEST(west.getEast() == bounds.getWest());
}

BOOST_AUTO_TEST_SUITE_END()
