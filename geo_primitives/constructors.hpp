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
#ifndef GEO_PRIMITIVES_CONSTRUCTORS_HPP_
#define GEO_PRIMITIVES_CONSTRUCTORS_HPP_

#include <optional>  // for optional, nullopt
#include <utility>   // for pair
#include <vector>    // for vector
#include "geometry.hpp"
#include "result.hpp"

using std::vector;

namespace constructors {

// raw (lat, lon) input pair, human order
using LatLonPair = std::pair<double, double>;

// lenient constructors: never validate, never throw
geometry::Point makePoint(double lat, double lon);
geometry::LineString makeLineString(const vector<LatLonPair>& coords);
geometry::Polygon makePolygon(const vector<LatLonPair>& coords);
geometry::Feature makeFeature(
    const geometry::Geometry& geometry, const json& properties,
    const std::optional<geometry::FeatureId>& id = std::nullopt);
geometry::FeatureCollection makeFeatureCollection(const vector<geometry::Feature>& features);

// validating constructors
result::Result<geometry::Point> tryMakePoint(double lat, double lon);
result::Result<geometry::LineString> tryMakeLineString(const vector<LatLonPair>& coords);
result::Result<geometry::Polygon> tryMakePolygon(const vector<LatLonPair>& coords);

}  // namespace constructors

#endif  // GEO_PRIMITIVES_CONSTRUCTORS_HPP_
