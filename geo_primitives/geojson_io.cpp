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
#include "geojson_io.hpp"
#include <cmath>                  // for floor, fabs
#include <cstddef>                // for size_t
#include <cstdint>                // for int64_t
#include <fstream>                // for basic_ifstream
#include <iostream>               // for cerr
#include <nlohmann/json.hpp>      // for basic_json
#include <stdexcept>              // for runtime_error
#include <string>                 // for string
#include <utility>                // for move
#include <variant>                // for visit, get_if
#include <vector>                 // for vector

using std::cerr;
using std::ifstream;
using std::runtime_error;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace geometry {
    namespace {
        // ensure closed rings, centroid and ray casting rely on it
        void closeRing(Ring* ring) {
            if (!ring->empty() && ring->front() != ring->back()) ring->push_back(ring->front());
        }

        vector<Ring> readRings(const json& j) {
            auto rings = j.get<vector<Ring>>();
            for (auto& ring : rings) closeRing(&ring);
            return rings;
        }
    }  // namespace

    void to_json(json& j, const Coordinate& c) {
        j = json::array({c.lon, c.lat});
    }

    // Reads a GeoJSON position; any altitude beyond lon/lat is dropped
    void from_json(const json& j, Coordinate& c) {
        if (!j.is_array() || j.size() < 2)
            throw runtime_error("GeoJSON position needs at least two numbers: " + j.dump());
        c.lon = j.at(0).get<double>();
        c.lat = j.at(1).get<double>();
    }

    void to_json(json& j, const Geometry& geometry) {
        j = json::object();
        j["type"] = geometryType(geometry);
        std::visit([&](const auto& shape) { j["coordinates"] = shape.coordinates; }, geometry);
    }

    // Reads a GeoJSON geometry object; polygon rings come back closed
    //
    // Args:
    //    j: object with string "type" and a "coordinates" member
    //    geometry: set to the parsed geometry
    // Throws:
    //    runtime_error for unsupported types or missing members
    void from_json(const json& j, Geometry& geometry) {
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
            throw runtime_error("GeoJSON geometry has no string 'type' field");
        const auto type = j["type"].get<string>();
        if (!j.contains("coordinates"))
            throw runtime_error("GeoJSON " + type + " has no 'coordinates'");
        const auto& coords = j["coordinates"];

        if (type == "Point") {
            geometry = Point{coords.get<Coordinate>()};
        } else if (type == "LineString") {
            geometry = LineString{coords.get<vector<Coordinate>>()};
        } else if (type == "Polygon") {
            geometry = Polygon{readRings(coords)};
        } else if (type == "MultiPoint") {
            geometry = MultiPoint{coords.get<vector<Coordinate>>()};
        } else if (type == "MultiLineString") {
            geometry = MultiLineString{coords.get<vector<vector<Coordinate>>>()};
        } else if (type == "MultiPolygon") {
            MultiPolygon multi;
            if (!coords.is_array())
                throw runtime_error("GeoJSON MultiPolygon 'coordinates' must be an array");
            for (const auto& polygon : coords) multi.coordinates.push_back(readRings(polygon));
            geometry = std::move(multi);
        } else {
            throw runtime_error("Unsupported GeoJSON geometry type: " + type);
        }
    }

    void to_json(json& j, const Feature& feature) {
        j = json::object();
        j["type"] = "Feature";
        j["geometry"] = feature.geometry;
        j["properties"] = feature.properties;
        if (!feature.id) return;
        if (const auto* s = std::get_if<string>(&*feature.id)) {
            j["id"] = *s;
            return;
        }
        // integral ids are written without a fraction
        const double n = std::get<double>(*feature.id);
        if (std::floor(n) == n && std::fabs(n) < 9.0e15) {
            j["id"] = static_cast<std::int64_t>(n);
        } else {
            j["id"] = n;
        }
    }

    void from_json(const json& j, Feature& feature) {
        if (!j.is_object())
            throw runtime_error("GeoJSON feature must be an object");
        if (!j.contains("geometry") || j["geometry"].is_null())
            throw runtime_error("GeoJSON feature has no geometry");
        feature.geometry = j["geometry"].get<Geometry>();

        feature.properties = json::object();
        if (j.contains("properties") && !j["properties"].is_null()) {
            if (!j["properties"].is_object())
                throw runtime_error("GeoJSON feature 'properties' must be an object");
            feature.properties = j["properties"];
        }

        feature.id.reset();
        if (j.contains("id")) {
            const auto& id = j["id"];
            if (id.is_string()) {
                feature.id = FeatureId{id.get<string>()};
            } else if (id.is_number()) {
                feature.id = FeatureId{id.get<double>()};
            } else {
                throw runtime_error("GeoJSON feature 'id' must be a string or number");
            }
        }
    }

    void to_json(json& j, const FeatureCollection& collection) {
        j = json::object();
        j["type"] = "FeatureCollection";
        j["features"] = collection.features;
    }

    // Reads a FeatureCollection; features with a null or missing geometry are
    // skipped with a warning on stderr
    void from_json(const json& j, FeatureCollection& collection) {
        if (!j.is_object() || !j.contains("features") || !j["features"].is_array())
            throw runtime_error("Invalid GeoJSON (no features array)");
        const auto& features = j["features"];
        collection.features.clear();
        collection.features.reserve(features.size());
        for (size_t i = 0; i < features.size(); ++i) {
            const auto& feat = features[i];
            if (feat.is_object() && (!feat.contains("geometry") || feat["geometry"].is_null())) {
                cerr << "[warn] Skipping feature " << i << " with no geometry\n";
                continue;
            }
            collection.features.push_back(feat.get<Feature>());
        }
    }
}  // namespace geometry

using geometry::Feature;
using geometry::FeatureCollection;
using geometry::Geometry;

namespace geojson_io {
    // Builds a FeatureCollection from any GeoJSON object.
    //
    // A FeatureCollection is read as is, a bare Feature or geometry becomes a
    // one-feature collection. Features with a null geometry are skipped.
    //
    // Args:
    //    gj: parsed GeoJSON document
    // Returns:
    //    the collection in document order
    FeatureCollection parseFeatureCollection(const json& gj) {
        if (!gj.is_object() || !gj.contains("type") || !gj["type"].is_string())
            throw runtime_error("GeoJSON top-level object has no string 'type' field");

        const auto type = gj["type"].get<string>();
        FeatureCollection collection;
        if (type == "Feature") {
            collection.features.push_back(gj.get<Feature>());
            return collection;
        }
        if (type != "FeatureCollection") {
            Feature feature;
            feature.geometry = gj.get<Geometry>();
            collection.features.push_back(std::move(feature));
            return collection;
        }
        return gj.get<FeatureCollection>();
    }

    // Loads a GeoJSON file into a FeatureCollection
    //
    // Args:
    //    path: A const reference to the GeoJSON file path
    // Returns:
    //    the features found in the file
    // Throws:
    //    runtime_error when the file can't be opened or isn't valid GeoJSON
    FeatureCollection loadFeatureCollection(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open GeoJSON: " + path);
        try {
            json gj;
            in >> gj;
            return parseFeatureCollection(gj);
        } catch (const json::exception& e) {
            throw runtime_error("Invalid GeoJSON in " + path + ": " + e.what());
        }
    }

    string dumpFeatureCollection(const FeatureCollection& collection) {
        const json j = collection;
        return j.dump();
    }
}  // namespace geojson_io
