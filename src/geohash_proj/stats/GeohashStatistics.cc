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
 * @file GeohashStatistics.cc
 */

#include "geohash_proj/stats/GeohashStatistics.h"
#include "geohash_proj/distance/GeohashDistance.h"
#include "geohash_proj/geohash/GeohashErrors.h"
#include <algorithm>
#include <cmath>

using namespace geohash_proj;

namespace {

bool byLatitude(const LatLong &a, const LatLong &b) {
    return a.latitude < b.latitude;
}

bool byLongitude(const LatLong &a, const LatLong &b) {
    return a.longitude < b.longitude;
}

std::string encodeCenter(const LatLong &center) {
    return GeohashCodec::encode(center.latitude, center.longitude);
}

}    // namespace

std::vector<LatLong> GeohashStatistics::decodeAll(
        const std::vector<std::string> &geohashes) {
    if (geohashes.empty())
        throw InvalidLengthError("Geohash collection cannot be empty");

    std::vector<LatLong> centers;
    centers.reserve(geohashes.size());
    for (const std::string &geohash : geohashes)
        centers.push_back(GeohashCodec::decode(geohash));
    return centers;
}

std::string GeohashStatistics::mean(const std::vector<std::string> &geohashes,
        size_t geohashLength) {
    GeohashCodec::checkGeohashLength(geohashLength);
    std::vector<LatLong> centers = decodeAll(geohashes);

    double latitude = 0;
    double longitude = 0;
    for (const LatLong &center : centers) {
        latitude += center.latitude;
        longitude += center.longitude;
    }

    return GeohashCodec::encode(latitude / centers.size(),
            longitude / centers.size(), geohashLength);
}

/*
 * Extremos. std::max_element y std::min_element devuelven el primero
 * de los empatados.
 */

std::string GeohashStatistics::northern(
        const std::vector<std::string> &geohashes) {
    std::vector<LatLong> centers = decodeAll(geohashes);
    return encodeCenter(
            *std::max_element(centers.begin(), centers.end(), byLatitude));
}

std::string GeohashStatistics::southern(
        const std::vector<std::string> &geohashes) {
    std::vector<LatLong> centers = decodeAll(geohashes);
    return encodeCenter(
            *std::min_element(centers.begin(), centers.end(), byLatitude));
}

std::string GeohashStatistics::eastern(
        const std::vector<std::string> &geohashes) {
    std::vector<LatLong> centers = decodeAll(geohashes);
    return encodeCenter(
            *std::max_element(centers.begin(), centers.end(), byLongitude));
}

std::string GeohashStatistics::western(
        const std::vector<std::string> &geohashes) {
    std::vector<LatLong> centers = decodeAll(geohashes);
    return encodeCenter(
            *std::min_element(centers.begin(), centers.end(), byLongitude));
}

/*
 * Dispersión.
 */

double GeohashStatistics::variance(const std::vector<std::string> &geohashes) {
    std::string meanGeohash = mean(geohashes);

    double sum = 0;
    for (const std::string &geohash : geohashes) {
        double distance = GeohashDistance::haversineDistance(geohash,
                meanGeohash);
        sum += distance * distance;
    }

    return sum / geohashes.size();
}

double GeohashStatistics::standardDeviation(
        const std::vector<std::string> &geohashes) {
    return std::sqrt(variance(geohashes));
}
