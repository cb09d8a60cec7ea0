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
#include "constructors.hpp"
#include <algorithm>  // for sort, unique
#include <cstddef>    // for size_t
#include <optional>   // for optional
#include <sstream>    // for basic_ostringstream
#include <string>     // for string
#include <utility>    // for move
#include <vector>     // for vector
#include "measure.hpp"

using std::ostringstream;
using std::vector;

using geometry::Coordinate;
using geometry::Feature;
using geometry::FeatureCollection;
using geometry::FeatureId;
using geometry::Geometry;
using geometry::LineString;
using geometry::Point;
using geometry::Polygon;
using geometry::Ring;
using result::ErrorKind;
using result::GeometryError;
using result::Result;

namespace constructors {
    namespace {
        // Swaps human (lat, lon) pairs into GeoJSON (lon, lat) order
        vector<Coordinate> toCoordinates(const vector<LatLonPair>& coords) {
            vector<Coordinate> out;
            out.reserve(coords.size());
            for (const auto& c : coords) out.push_back(Coordinate{c.second, c.first});
            return out;
        }

        // Returns the index of the first out-of-range pair, or coords.size()
        size_t firstInvalid(const vector<LatLonPair>& coords) {
            for (size_t i = 0; i < coords.size(); ++i) {
                if (!measure::isValidCoordinate(coords[i].first, coords[i].second)) return i;
            }
            return coords.size();
        }

        // Number of distinct positions, so repeats and the closing point count once
        size_t distinctVertices(vector<LatLonPair> coords) {
            std::sort(coords.begin(), coords.end());
            return static_cast<size_t>(std::unique(coords.begin(), coords.end()) - coords.begin());
        }

        GeometryError invalidCoordinate(size_t index, const LatLonPair& c) {
            ostringstream oss;
            oss << "coordinate " << index << " out of range (lat " << c.first << ", lon " << c.second << ")";
            return GeometryError{ErrorKind::InvalidCoordinate, oss.str()};
        }

        GeometryError tooFewPoints(const char* kind, size_t got, size_t need) {
            ostringstream oss;
            oss << kind << " needs at least " << need << " points, got " << got;
            return GeometryError{ErrorKind::TooFewPoints, oss.str()};
        }
    }  // namespace

    // Creates a Point from latitude and longitude
    //
    // Args:
    //    lat: latitude in degrees
    //    lon: longitude in degrees
    // Returns:
    //    Point with coordinates stored as (lon, lat)
    Point makePoint(double lat, double lon) {
        return Point{Coordinate{lon, lat}};
    }

    // Creates a LineString from (lat, lon) pairs; length is not checked
    LineString makeLineString(const vector<LatLonPair>& coords) {
        return LineString{toCoordinates(coords)};
    }

    // Creates a single-ring Polygon from (lat, lon) pairs
    //
    // Args:
    //    coords: outer ring vertices, closed or open
    // Returns:
    //    Polygon whose only ring ends with a copy of its first coordinate.
    //    Empty input gives one empty ring.
    Polygon makePolygon(const vector<LatLonPair>& coords) {
        Ring ring = toCoordinates(coords);
        // close the ring
        if (!ring.empty() && ring.front() != ring.back()) {
            ring.push_back(ring.front());
        }
        Polygon poly;
        poly.coordinates.push_back(std::move(ring));
        return poly;
    }

    // Wraps a geometry with its properties; id is attached only when given
    Feature makeFeature(const Geometry& geometry, const json& properties, const std::optional<FeatureId>& id) {
        Feature feature;
        feature.geometry = geometry;
        feature.properties = properties;
        if (id) feature.id = *id;
        return feature;
    }

    FeatureCollection makeFeatureCollection(const vector<Feature>& features) {
        return FeatureCollection{features};
    }

    // Creates a Point, rejecting coordinates outside the WGS84 ranges
    Result<Point> tryMakePoint(double lat, double lon) {
        if (!measure::isValidCoordinate(lat, lon)) return invalidCoordinate(0, LatLonPair{lat, lon});
        return makePoint(lat, lon);
    }

    // Creates a LineString of at least two valid coordinates
    Result<LineString> tryMakeLineString(const vector<LatLonPair>& coords) {
        const size_t bad = firstInvalid(coords);
        if (bad != coords.size()) return invalidCoordinate(bad, coords[bad]);
        if (coords.size() < 2) return tooFewPoints("LineString", coords.size(), 2);
        return makeLineString(coords);
    }

    // Creates a Polygon of at least three distinct valid vertices
    //
    // Args:
    //    coords: outer ring vertices; repeated positions, the closing point
    //    included, count once
    // Returns:
    //    the closed Polygon, or the GeometryError describing the first problem found
    Result<Polygon> tryMakePolygon(const vector<LatLonPair>& coords) {
        const size_t bad = firstInvalid(coords);
        if (bad != coords.size()) return invalidCoordinate(bad, coords[bad]);

        const size_t vertices = distinctVertices(coords);
        if (vertices < 3) return tooFewPoints("Polygon", vertices, 3);
        return makePolygon(coords);
    }
}  // namespace constructors
