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
#include "geometry.hpp"
#include <string>   // for string
#include <variant>  // for visit

namespace geometry {
    // Returns the GeoJSON "type" member for the held geometry kind
    string geometryType(const Geometry& geometry) {
        struct TypeName {
            string operator()(const Point&) const { return "Point"; }
            string operator()(const LineString&) const { return "LineString"; }
            string operator()(const Polygon&) const { return "Polygon"; }
            string operator()(const MultiPoint&) const { return "MultiPoint"; }
            string operator()(const MultiLineString&) const { return "MultiLineString"; }
            string operator()(const MultiPolygon&) const { return "MultiPolygon"; }
        };
        return std::visit(TypeName{}, geometry);
    }
}  // namespace geometry
