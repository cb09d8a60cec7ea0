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
#ifndef GEO_PRIMITIVES_CONVERT_HPP_
#define GEO_PRIMITIVES_CONVERT_HPP_

#include <optional>  // for optional
#include <string>    // for string
#include "geometry.hpp"

using std::string;

namespace convert {

geometry::LatLng pointToLatLng(const geometry::Point& point);
geometry::Point latLngToPoint(const geometry::LatLng& latlng);

std::optional<geometry::Point> wktPointToGeoJSON(const string& wkt);
string geoJSONPointToWkt(const geometry::Point& point);

std::optional<geometry::BoundingBox> parseBoundingBox(const string& text);
string formatDistance(double km);

}  // namespace convert

#endif  // GEO_PRIMITIVES_CONVERT_HPP_
