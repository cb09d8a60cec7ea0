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
#ifndef GEO_PRIMITIVES_GEOJSON_IO_HPP_
#define GEO_PRIMITIVES_GEOJSON_IO_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include "geometry.hpp"

using std::string;
using json = nlohmann::json;

namespace geometry {

// nlohmann::json hooks, found by ADL
void to_json(json& j, const Coordinate& c);
void from_json(const json& j, Coordinate& c);
void to_json(json& j, const Geometry& geometry);
void from_json(const json& j, Geometry& geometry);
void to_json(json& j, const Feature& feature);
void from_json(const json& j, Feature& feature);
void to_json(json& j, const FeatureCollection& collection);
void from_json(const json& j, FeatureCollection& collection);

}  // namespace geometry

namespace geojson_io {

geometry::FeatureCollection parseFeatureCollection(const json& gj);
geometry::FeatureCollection loadFeatureCollection(const string& path);
string dumpFeatureCollection(const geometry::FeatureCollection& collection);

}  // namespace geojson_io

#endif  // GEO_PRIMITIVES_GEOJSON_IO_HPP_
