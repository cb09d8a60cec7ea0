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
#include "report.hpp"
#include <algorithm>  // for any_of
#include <cmath>      // for isnan
#include <ostream>    // for basic_ostream, operator<<
#include <variant>    // for get_if
#include "convert.hpp"
#include "measure.hpp"
#include "region.hpp"

using std::isnan;

using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::Feature;
using geometry::FeatureCollection;
using geometry::Geometry;
using geometry::MultiPolygon;
using geometry::Point;
using geometry::Polygon;

namespace report {
    // Picks the representative point used for distances
    //
    // Args:
    //    geometry: any geometry kind
    // Returns:
    //    the point itself, a polygon's vertex-average centroid, or the
    //    bounding box center; nullopt when the geometry has no usable coordinates
    optional<Point> anchorPoint(const Geometry& geometry) {
        if (const auto* point = std::get_if<Point>(&geometry)) return *point;
        if (const auto* poly = std::get_if<Polygon>(&geometry)) {
            const Point c = measure::centroid(*poly);
            if (isnan(c.coordinates.lon) || isnan(c.coordinates.lat)) return std::nullopt;
            return c;
        }
        const BoundingBox box = measure::boundingBox(geometry);
        if (box.empty()) return std::nullopt;
        return Point{Coordinate{(box.minLon + box.maxLon) / 2, (box.minLat + box.maxLat) / 2}};
    }

    // Point-in-polygon for area geometries; nullopt for points and lines
    optional<bool> containsPoint(const Geometry& geometry, const Point& point) {
        if (const auto* poly = std::get_if<Polygon>(&geometry)) return measure::pointInPolygon(point, *poly);
        if (const auto* multi = std::get_if<MultiPolygon>(&geometry)) {
            return std::any_of(
                multi->coordinates.begin(),
                multi->coordinates.end(),
                [&](const auto& rings) {
                    return measure::pointInPolygon(point, Polygon{rings});
                });
        }
        return std::nullopt;
    }

    FeatureReport reportFeature(size_t index, const Feature& feature, const optional<Point>& query) {
        FeatureReport row;
        row.index = index;
        row.type = geometry::geometryType(feature.geometry);
        row.bbox = measure::boundingBox(feature.geometry);
        row.anchor = anchorPoint(feature.geometry);
        if (row.anchor) {
            row.inHanoi = region::isInHanoi(*row.anchor);
            row.centerKm = measure::distance(*row.anchor, region::HANOI_CENTER);
        }
        if (query) {
            row.containsPoint = containsPoint(feature.geometry, *query);
            if (row.anchor) row.pointKm = measure::distance(*query, *row.anchor);
        }
        return row;
    }

    vector<FeatureReport> reportCollection(const FeatureCollection& collection, const optional<Point>& query) {
        vector<FeatureReport> rows;
        rows.reserve(collection.features.size());
        for (size_t i = 0; i < collection.features.size(); ++i) {
            rows.push_back(reportFeature(i, collection.features[i], query));
        }
        return rows;
    }

    // One human-readable line per feature
    void printReport(std::ostream& os, const FeatureReport& row) {
        os << "#" << row.index << " " << row.type;
        if (row.bbox.empty()) {
            os << " (no coordinates)\n";
            return;
        }
        const auto precision = os.precision(15);
        os << " bbox [" << row.bbox.minLon << "," << row.bbox.minLat << ","
           << row.bbox.maxLon << "," << row.bbox.maxLat << "]";
        if (row.anchor) {
            os << " anchor " << convert::geoJSONPointToWkt(*row.anchor)
               << (row.inHanoi ? " in " : " outside ") << region::HANOI.name;
        }
        if (row.centerKm) os << ", " << convert::formatDistance(*row.centerKm) << " from center";
        if (row.containsPoint) os << (*row.containsPoint ? ", contains point" : ", does not contain point");
        if (row.pointKm) os << ", " << convert::formatDistance(*row.pointKm) << " from point";
        os << "\n";
        os.precision(precision);
    }

    // Writes rows as CSV; missing values are left blank. The stream's
    // precision is restored afterwards.
    void writeCsv(std::ostream& os, const vector<FeatureReport>& rows) {
        const auto precision = os.precision(15);
        os << CSV_HEADER << "\n";
        for (const auto& row : rows) {
            os << row.index << "," << row.type << ",";
            if (!row.bbox.empty()) {
                os << row.bbox.minLon << "," << row.bbox.minLat << ","
                   << row.bbox.maxLon << "," << row.bbox.maxLat << ",";
            } else {
                os << ",,,,";
            }
            // Quote WKT, it holds a space
            if (row.anchor) os << "\"" << convert::geoJSONPointToWkt(*row.anchor) << "\"";
            os << "," << (row.inHanoi ? "true" : "false") << ",";
            if (row.centerKm) os << *row.centerKm;
            os << ",";
            if (row.containsPoint) os << (*row.containsPoint ? "true" : "false");
            os << ",";
            if (row.pointKm) os << *row.pointKm;
            os << "\n";
        }
        os.precision(precision);
    }
}  // namespace report
