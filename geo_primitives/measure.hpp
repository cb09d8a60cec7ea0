// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef GEO_PRIMITIVES_MEASURE_HPP_
#define GEO_PRIMITIVES_MEASURE_HPP_

#include <variant>  // for visit
#include <vector>   // for vector
#include "geometry.hpp"

using std::vector;

namespace measure {

const double EARTH_RADIUS_KM = 6371.0;  // spherical approximation
const double PI = 3.14159265358979323846;

namespace detail {
// leaf: a single coordinate
template <typename Fn>
void walk(const geometry::Coordinate& c, Fn& fn) { fn(c); }

// any nesting depth of coordinate sequences
template <typename T, typename Fn>
void walk(const vector<T>& items, Fn& fn) {
    for (const auto& item : items) walk(item, fn);
}
}  // namespace detail

// Calls fn on every coordinate of the geometry, whatever its kind or nesting depth
template <typename Fn>
void forEachCoordinate(const geometry::Geometry& geometry, Fn fn) {
    std::visit([&](const auto& shape) { detail::walk(shape.coordinates, fn); }, geometry);
}

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);

double distance(const geometry::Point& p1, const geometry::Point& p2);
double distanceKm(double lat1, double lon1, double lat2, double lon2);
bool withinRadius(const geometry::Point& point, const geometry::Point& center, double radiusKm);

geometry::Point centroid(const geometry::Polygon& polygon);

vector<geometry::Coordinate> flattenCoordinates(const geometry::Geometry& geometry);
geometry::BoundingBox boundingBox(const geometry::Geometry& geometry);
geometry::BoundingBox boundingBox(const geometry::FeatureCollection& collection);
bool inBoundingBox(const geometry::Point& point, const geometry::BoundingBox& box);

bool pointInPolygon(const geometry::Point& point, const geometry::Polygon& polygon);

bool isValidCoordinate(double lat, double lon);

}  // namespace measure

#endif  // GEO_PRIMITIVES_MEASURE_HPP_
