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
 * @file LocationEncoder.test.cc
 */

#include <boost/test/unit_test.hpp>
#include "geohash_proj/mobility/LocationEncoder.h"
#include "geohash_proj/geohash/GeohashCodec.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <GeographicLib/Math.hpp>
#include <limits>
#include <omnetpp.h>

using namespace geohash_proj;
namespace tt = boost::test_tools;

BOOST_AUTO_TEST_SUITE(location_encoder)

BOOST_AUTO_TEST_CASE(configuration) {
    LocationEncoder encoder(7, true);

    BOOST_TEST(encoder.getGeohashLength() == 7u);
    BOOST_TEST(encoder.isStrict());
    BOOST_TEST(!LocationEncoder(7).isStrict());

    BOOST_CHECK_THROW(LocationEncoder(0), InvalidLengthError);
    BOOST_CHECK_THROW(LocationEncoder(13), InvalidLengthError);
}

BOOST_AUTO_TEST_CASE(in_range_location_is_kept) {
    for (bool strict : { false, true }) {
        GeohashLocation location = LocationEncoder(5, strict).encode(42.6, -5.6);

        BOOST_TEST(location.getGeohash() == "ezs42");
        BOOST_TEST(location.getLocation().Latitude() == 42.6, tt::tolerance(1e-12));
        BOOST_TEST(location.getLocation().Longitude() == -5.6, tt::tolerance(1e-12));
    }
}

BOOST_AUTO_TEST_CASE(polar_edges_are_kept) {
    LocationEncoder encoder(3);

    GeohashLocation location = encoder.encode(90, 10);
    BOOST_TEST(location.getGeohash() == GeohashCodec::encode(90, 10, 3));
    BOOST_TEST(location.getLocation().Latitude() == 90.0);

    location = encoder.encode(-90, -170);
    BOOST_TEST(location.getGeohash() == GeohashCodec::encode(-90, -170, 3));
    BOOST_TEST(location.getLocation().Latitude() == -90.0);
}

BOOST_AUTO_TEST_CASE(clamped_latitude_takes_cell_center) {
    LocationEncoder encoder(6);
    GeohashLocation location = encoder.encode(95, 0);
    LatLong center = GeohashCodec::decode(GeohashCodec::encode(95, 0, 6));

    BOOST_TEST((location == GeohashLocation(GeohashCodec::encode(95, 0, 6))));
    BOOST_TEST(location.getLocation().Latitude() == center.latitude, tt::tolerance(1e-12));
    BOOST_TEST(location.getLocation().Longitude() == center.longitude, tt::tolerance(1e-12));
    BOOST_TEST(location.getLocation().Latitude() < 90.0);
}

BOOST_AUTO_TEST_CASE(wrapped_longitude_takes_cell_center) {
    LocationEncoder encoder(6);
    GeohashLocation location = encoder.encode(0, 190);

    BOOST_TEST(location.getGeohash() == GeohashCodec::encode(0, -170, 6));
    BOOST_TEST(location.getLocation().Longitude()
            == GeohashCodec::decode(location.getGeohash()).longitude,
            tt::tolerance(1e-12));
}

BOOST_AUTO_TEST_CASE(strict_encoding_rejects_out_of_range) {
    LocationEncoder encoder(6, true);

    BOOST_CHECK_THROW(encoder.encode(95, 0), omnetpp::cRuntimeError);
    BOOST_CHECK_THROW(encoder.encode(0, 190), omnetpp::cRuntimeError);
    BOOST_CHECK_NO_THROW(encoder.encode(-90, -170));
}

BOOST_AUTO_TEST_CASE(invalid_coordinates_are_runtime_errors) {
    double nan = GeographicLib::Math::NaN();
    double inf = std::numeric_limits<double>::infinity();

    for (bool strict : { false, true }) {
        LocationEncoder encoder(6, strict);

        BOOST_CHECK_THROW(encoder.encode(nan, 0), omnetpp::cRuntimeError);
        BOOST_CHECK_THROW(encoder.encode(0, nan), omnetpp::cRuntimeError);
        BOOST_CHECK_THROW(encoder.encode(0, inf), omnetpp::cRuntimeError);
    }
}

BOOST_AUTO_TEST_SUITE_END()
