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
 * @file GeohashDistance.test.cc
 */

#include <boost/test/unit_test.hpp>
#include <boost/math/constants/constants.hpp>
#include "geohash_proj/distance/GeohashDistance.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"

using namespace geohash_proj;
namespace tt = boost::test_tools;

BOOST_AUTO_TEST_SUITE(geohash_distance)

BOOST_AUTO_TEST_CASE(approximate_distance) {
    BOOST_TEST(GeohashDistance::approximateDistance("bcd3u", "bc83n") == 625441.0);
    BOOST_TEST(GeohashDistance::approximateDistance("bcd3uasd", "bcd3n") == 19545.0);
    BOOST_TEST(GeohashDistance::approximateDistance("bcd3u", "bcd3uasd") == 3803.0);
    BOOST_TEST(GeohashDistance::approximateDistance("bcd3ua", "bcd3uasdub") == 610.0);
    BOOST_TEST(GeohashDistance::approximateDistance("u", "b") == 20000000.0);
    BOOST_TEST(GeohashDistance::approximateDistance("ezs42e44yx96", "ezs42e44yx96") == 0.6);
    BOOST_TEST(GeohashDistance::approximateDistance("EZS42", "ezs42") == 3803.0);

    BOOST_CHECK_THROW(GeohashDistance::approximateDistance("", "ezs42"), InvalidLengthError);
    BOOST_CHECK_THROW(GeohashDistance::approximateDistance("ezs42", "ezsa2"),
            InvalidCharacterError);
}

BOOST_AUTO_TEST_CASE(haversine_distance) {
    BOOST_TEST(GeohashDistance::haversineDistance("testxyz", "testwxy") == 5888.614420771857,
            tt::tolerance(1e-9));
    BOOST_TEST(GeohashDistance::haversineDistance("ezs42", "ezs42") == 0.0);

    std::string paris = GeohashCodec::encode(48.8566, 2.3522);
    std::string london = GeohashCodec::encode(51.5074, -0.1278);
    BOOST_TEST(GeohashDistance::haversineDistance(paris, london) == 343556.0,
            tt::tolerance(1e-5));
    BOOST_TEST(GeohashDistance::haversineDistance(paris, london)
            == GeohashDistance::haversineDistance(london, paris), tt::tolerance(1e-12));
}

BOOST_AUTO_TEST_CASE(haversine_antipodes) {
    double halfCircumference = GeohashDistance::EARTH_RADIUS
            * boost::math::constants::pi<double>();

    BOOST_TEST(GeohashDistance::haversine(0, 0, 0, 180) == halfCircumference,
            tt::tolerance(1e-9));
    BOOST_TEST(GeohashDistance::haversine(90, 0, -90, 0) == halfCircumference,
            tt::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(geodesic_distance) {
    std::string paris = GeohashCodec::encode(48.8566, 2.3522);
    std::string london = GeohashCodec::encode(51.5074, -0.1278);

    double distance = GeohashDistance::geodesicDistance(paris, london);
    BOOST_TEST(distance > 343000.0);
    BOOST_TEST(distance < 345000.0);
    BOOST_TEST(GeohashDistance::geodesicDistance("ezs42", "ezs42") == 0.0);
    BOOST_CHECK_THROW(GeohashDistance::geodesicDistance("ezs42", "!"), InvalidCharacterError);
}

BOOST_AUTO_TEST_SUITE_END()
