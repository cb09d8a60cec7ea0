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
#ifndef GEO_PRIMITIVES_REPORT_HPP_
#define GEO_PRIMITIVES_REPORT_HPP_

#include <cstddef>   // for size_t
#include <iosfwd>    // for ostream
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector
#include "geometry.hpp"

using std::optional;
using std::string;
using std::vector;

namespace report {

const char CSV_HEADER[] =
    "index,type,minLon,minLat,maxLon,maxLat,anchor,in_hanoi,center_km,contains_point,point_km";

// per-feature summary
struct FeatureReport {
    size_t index{};
    string type;
    geometry::BoundingBox bbox;
    // centroid for polygons, the point itself for points, bbox center otherwise
    optional<geometry::Point> anchor;
    bool inHanoi{};
    // distance from anchor to the Hanoi center
    optional<double> centerKm;
    // only set for area geometries when a query point was given
    optional<bool> containsPoint;
    optional<double> pointKm;
};

optional<geometry::Point> anchorPoint(const geometry::Geometry& geometry);
optional<bool> containsPoint(const geometry::Geometry& geometry, const geometry::Point& point);
FeatureReport reportFeature(
    size_t index, const geometry::Feature& feature, const optional<geometry::Point>& query);
vector<FeatureReport> reportCollection(
    const geometry::FeatureCollection& collection, const optional<geometry::Point>& query);

void printReport(std::ostream& os, const FeatureReport& row);
void writeCsv(std::ostream& os, const vector<FeatureReport>& rows);

}  // namespace report

#endif  // GEO_PRIMITIVES_REPORT_HPP_
