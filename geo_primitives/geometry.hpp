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
#ifndef GEO_PRIMITIVES_GEOMETRY_HPP_
#define GEO_PRIMITIVES_GEOMETRY_HPP_

#include <limits>                 // for numeric_limits
#include <nlohmann/json.hpp>      // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <variant>                // for variant
#include <vector>                 // for vector

using std::string;
using std::vector;
using json = nlohmann::json;

namespace geometry {
// -------------------------------------
// GeoJSON geometry structures
// all coordinates are (lon, lat)
// -------------------------------------

// lon/lat pair, GeoJSON order
struct Coordinate {
    double lon{}, lat{};
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
    return a.lon == b.lon && a.lat == b.lat;
}
inline bool operator!=(const Coordinate& a, const Coordinate& b) { return !(a == b); }

// ordered sequence of coordinates, closed when used as a polygon ring
using Ring = vector<Coordinate>;

struct Point {
    Coordinate coordinates;
};

struct LineString {
    vector<Coordinate> coordinates;
};

struct Polygon {
    // coordinates[0] = outer; coordinates[1..] = holes
    vector<Ring> coordinates;
};

struct MultiPoint {
    vector<Coordinate> coordinates;
};

struct MultiLineString {
    vector<vector<Coordinate>> coordinates;
};

struct MultiPolygon {
    vector<vector<Ring>> coordinates;
};

using Geometry = std::variant<Point, LineString, Polygon, MultiPoint, MultiLineString, MultiPolygon>;

// GeoJSON "type" member for the held geometry
string geometryType(const Geometry& geometry);

// string or numeric feature identifier
using FeatureId = std::variant<string, double>;

struct Feature {
    Geometry geometry;
    // open property bag, always a json object
    json properties = json::object();
    std::optional<FeatureId> id;
};

struct FeatureCollection {
    vector<Feature> features;
};

// human-facing lat/lng order, distinct from Coordinate
struct LatLng {
    double lat{}, lng{};
};

inline bool operator==(const LatLng& a, const LatLng& b) { return a.lat == b.lat && a.lng == b.lng; }

// axis-aligned box; min > max means nothing was folded in
struct BoundingBox {
    double minLon = std::numeric_limits<double>::infinity();
    double minLat = std::numeric_limits<double>::infinity();
    double maxLon = -std::numeric_limits<double>::infinity();
    double maxLat = -std::numeric_limits<double>::infinity();

    bool empty() const { return minLon > maxLon || minLat > maxLat; }

    // grow the box to include c
    void extend(const Coordinate& c) {
        if (c.lon < minLon) minLon = c.lon;
        if (c.lat < minLat) minLat = c.lat;
        if (c.lon > maxLon) maxLon = c.lon;
        if (c.lat > maxLat) maxLat = c.lat;
    }

    // grow the box to include other; empty boxes are ignored
    void extend(const BoundingBox& other) {
        if (other.empty()) return;
        extend(Coordinate{other.minLon, other.minLat});
        extend(Coordinate{other.maxLon, other.maxLat});
    }
};

}  // namespace geometry

#endif  // GEO_PRIMITIVES_GEOMETRY_HPP_
