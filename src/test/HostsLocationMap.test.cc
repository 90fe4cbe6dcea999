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
 * @file HostsLocationMap.test.cc
 */

#include <boost/test/unit_test.hpp>
#include "geohash_proj/locationservice/HostsLocationMap.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <omnetpp.h>

using namespace geohash_proj;

namespace {

typedef std::vector<std::string> Hosts;

struct HostsFixture {
    HostsLocationMap hosts;

    HostsFixture() {
        hosts.registerHostLocation("net.host[0]", GeohashLocation("ezs42e"));
        hosts.registerHostLocation("net.host[1]", GeohashLocation("ezs42g"));
        hosts.registerHostLocation("net.host[2]", GeohashLocation("ezs4bq"));
        hosts.registerHostLocation("net.host[3]", GeohashLocation("u4pruy"));
        hosts.registerHostLocation("net.polar", GeohashLocation("gzzzzz"));
    }
};

}    // namespace

BOOST_FIXTURE_TEST_SUITE(hosts_location_map, HostsFixture)

BOOST_AUTO_TEST_CASE(register_and_lookup) {
    BOOST_TEST(hosts.size() == 5u);
    BOOST_TEST(!hosts.empty());
    BOOST_TEST(hosts.hasHostLocation("net.host[2]"));
    BOOST_TEST(!hosts.hasHostLocation("net.host[9]"));
    BOOST_TEST(hosts.getHostLocation("net.host[3]").getGeohash() == "u4pruy");
}

BOOST_AUTO_TEST_CASE(register_replaces_location) {
    hosts.registerHostLocation("net.host[0]", GeohashLocation("u4pruy"));

    BOOST_TEST(hosts.size() == 5u);
    BOOST_TEST(hosts.getHostLocation("net.host[0]").getGeohash() == "u4pruy");
}

BOOST_AUTO_TEST_CASE(register_rejects_null_location) {
    BOOST_CHECK_THROW(hosts.registerHostLocation("net.host[4]",
            GeohashLocation()), omnetpp::cRuntimeError);
    BOOST_TEST(!hosts.hasHostLocation("net.host[4]"));
}

BOOST_AUTO_TEST_CASE(unknown_host) {
    BOOST_CHECK_THROW(hosts.getHostLocation("net.host[9]"),
            omnetpp::cRuntimeError);
}

BOOST_AUTO_TEST_CASE(hosts_in_region_match_by_prefix) {
    BOOST_TEST(hosts.getHostsInRegion("ezs42") == Hosts( { "net.host[0]", "net.host[1]" }),
            boost::test_tools::per_element());
    BOOST_TEST(hosts.getHostsInRegion("EZS4") == Hosts( { "net.host[0]", "net.host[1]", "net.host[2]" }),
            boost::test_tools::per_element());
    BOOST_TEST(hosts.getHostsInRegion("ezs42e") == Hosts( { "net.host[0]" }),
            boost::test_tools::per_element());
    BOOST_TEST(hosts.getHostsInRegion("ezs43").empty());
    BOOST_TEST(hosts.getHostsInRegion("u").size() == 1u);
    BOOST_CHECK_THROW(hosts.getHostsInRegion(""), InvalidLengthError);
}

BOOST_AUTO_TEST_CASE(hosts_in_adjacent_region) {
    // ezs42e está al norte de ezs42d y al oeste de ezs42g.
    BOOST_TEST(hosts.getHostsInAdjacentRegion("ezs42d",
            GeohashAdjacency::NORTH) == Hosts( { "net.host[0]" }),
            boost::test_tools::per_element());
    BOOST_TEST(hosts.getHostsInAdjacentRegion("ezs42e",
            GeohashAdjacency::EAST) == Hosts( { "net.host[1]" }),
            boost::test_tools::per_element());
    BOOST_TEST(hosts.getHostsInAdjacentRegion("ezs42e",
            GeohashAdjacency::SOUTH).empty());
}

BOOST_AUTO_TEST_CASE(no_hosts_beyond_the_poles) {
    BOOST_TEST(hosts.getHostsInAdjacentRegion("gzzzzz",
            GeohashAdjacency::NORTH).empty());
    BOOST_TEST(hosts.getHostsInAdjacentRegion("gzzzzx",
            GeohashAdjacency::NORTH).empty());
    BOOST_TEST(hosts.getHostsInAdjacentRegion("gzzzzy",
            GeohashAdjacency::NORTH) == Hosts( { "net.polar" }),
            boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(centroid) {
    HostsLocationMap single;
    single.registerHostLocation("net.host[0]", GeohashLocation("ezs42e"));

    BOOST_TEST(single.getCentroid(6) == "ezs42e");
    BOOST_TEST(single.getCentroid(3) == "ezs");
    BOOST_TEST(hosts.getCentroid(12).length() == 12u);
}

BOOST_AUTO_TEST_CASE(centroid_of_empty_map) {
    HostsLocationMap empty;

    BOOST_TEST(empty.empty());
    BOOST_TEST(empty.getGeohashes().empty());
    BOOST_CHECK_THROW(empty.getCentroid(6), omnetpp::cRuntimeError);
}

BOOST_AUTO_TEST_CASE(geohashes_in_path_order) {
    BOOST_TEST(hosts.getGeohashes() == Hosts( { "ezs42e", "ezs42g", "ezs4bq", "u4pruy", "gzzzzz" }),
            boost::test_tools::per_element());
}

BOOST_AUTO_TEST_SUITE_END()
