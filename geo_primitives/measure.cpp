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
#include "measure.hpp"
#include <cmath>    // for sin, cos, atan2, sqrt, isfinite, NAN
#include <cstddef>  // for size_t
#include <vector>   // for vector

using std::atan2;
using std::cos;
using std::isfinite;
using std::sin;
using std::sqrt;
using std::vector;

using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::FeatureCollection;
using geometry::Geometry;
using geometry::Point;
using geometry::Polygon;
using geometry::Ring;

namespace measure {
    double degreesToRadians(double degrees) {
        return degrees * (PI / 180.0);
    }

    double radiansToDegrees(double radians) {
        return radians * (180.0 / PI);
    }

    // Great-circle distance between two lat/lon positions (Haversine)
    //
    // Args:
    //    lat1, lon1: first position in degrees
    //    lat2, lon2: second position in degrees
    // Returns:
    //    distance in kilometres on a sphere of radius EARTH_RADIUS_KM
    double distanceKm(double lat1, double lon1, double lat2, double lon2) {
        const double dLat = degreesToRadians(lat2 - lat1);
        const double dLon = degreesToRadians(lon2 - lon1);
        const double a =
            sin(dLat / 2) * sin(dLat / 2) +
            cos(degreesToRadians(lat1)) * cos(degreesToRadians(lat2)) *
            sin(dLon / 2) * sin(dLon / 2);
        const double c = 2 * atan2(sqrt(a), sqrt(1 - a));
        return EARTH_RADIUS_KM * c;
    }

    // Great-circle distance in kilometres between two GeoJSON points
    double distance(const Point& p1, const Point& p2) {
        return distanceKm(p1.coordinates.lat, p1.coordinates.lon,
                          p2.coordinates.lat, p2.coordinates.lon);
    }

    // True if point lies no further than radiusKm from center
    bool withinRadius(const Point& point, const Point& center, double radiusKm) {
        return distance(point, center) <= radiusKm;
    }

    // Vertex-average centroid of the outer ring.
    //
    // This is the arithmetic mean of the ring vertices, not the area-weighted
    // centroid; it drifts toward densely sampled edges on elongated or concave
    // shapes.
    //
    // Args:
    //    polygon: polygon whose outer ring is closed (last point == first point)
    // Returns:
    //    mean of the ring's vertices, closing point excluded. A ring with fewer
    //    than two entries gives NaN coordinates.
    Point centroid(const Polygon& polygon) {
        if (polygon.coordinates.empty() || polygon.coordinates.front().size() < 2)
            return Point{Coordinate{NAN, NAN}};

        const Ring& ring = polygon.coordinates.front();
        const size_t n = ring.size() - 1;  // skip closing point
        double sumLon = 0, sumLat = 0;
        for (size_t i = 0; i < n; ++i) {
            sumLon += ring[i].lon;
            sumLat += ring[i].lat;
        }
        return Point{Coordinate{sumLon / n, sumLat / n}};
    }

    vector<Coordinate> flattenCoordinates(const Geometry& geometry) {
        vector<Coordinate> out;
        forEachCoordinate(geometry, [&](const Coordinate& c) { out.push_back(c); });
        return out;
    }

    // Axis-aligned bounding box of any geometry kind.
    //
    // Returns:
    //    box over every coordinate; empty() when the geometry has none
    BoundingBox boundingBox(const Geometry& geometry) {
        BoundingBox box;
        forEachCoordinate(geometry, [&](const Coordinate& c) { box.extend(c); });
        return box;
    }

    // Union of the bounding boxes of every feature in the collection
    BoundingBox boundingBox(const FeatureCollection& collection) {
        BoundingBox box;
        for (const auto& feature : collection.features) box.extend(boundingBox(feature.geometry));
        return box;
    }

    // Inclusive range check on both axes
    bool inBoundingBox(const Point& point, const BoundingBox& box) {
        const Coordinate& c = point.coordinates;
        return c.lon >= box.minLon && c.lon <= box.maxLon &&
               c.lat >= box.minLat && c.lat <= box.maxLat;
    }

    // Ray casting (even-odd) test against the outer ring.
    // Points exactly on an edge may go either way.
    //
    // Args:
    //     point: the point lon/lat to test
    //     polygon: polygon whose outer ring is tested; holes are ignored
    // Returns:
    //     true if the ray from point crosses the ring an odd number of times
    bool pointInPolygon(const Point& point, const Polygon& polygon) {
        if (polygon.coordinates.empty()) return false;
        const Ring& ring = polygon.coordinates.front();
        const size_t n = ring.size();
        if (n == 0) return false;

        const double x = point.coordinates.lon;
        const double y = point.coordinates.lat;
        bool inside = false;
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const double xi = ring[i].lon, yi = ring[i].lat;
            const double xj = ring[j].lon, yj = ring[j].lat;
            const bool intersect = ((yi > y) != (yj > y)) &&
                (x < (xj - xi) * (y - yi) / (yj - yi) + xi);
            if (intersect) inside = !inside;
        }
        return inside;
    }

    // True if lat is in [-90, 90] and lon in [-180, 180]; NaN and inf are rejected
    bool isValidCoordinate(double lat, double lon) {
        if (!isfinite(lat) || !isfinite(lon)) return false;
        return lat >= -90 && lat <= 90 && lon >= -180 && lon <= 180;
    }
}  // namespace measure
