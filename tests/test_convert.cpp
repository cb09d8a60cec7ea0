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
#include <doctest/doctest.h>
#include <cmath>
#include <string>
#include <vector>
#include "../geo_primitives/convert.hpp"

using std::isnan;
using std::string;
using std::vector;

using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::LatLng;
using geometry::Point;

using convert::formatDistance;
using convert::geoJSONPointToWkt;
using convert::latLngToPoint;
using convert::parseBoundingBox;
using convert::pointToLatLng;
using convert::wktPointToGeoJSON;

// -----------------------------------------------------------------------------
// Tests for LatLng <-> Point
// -----------------------------------------------------------------------------

TEST_CASE("pointToLatLng swaps into lat, lng order") {
    const LatLng ll = pointToLatLng(Point{Coordinate{105.8542, 21.0285}});

    CHECK(ll.lat == doctest::Approx(21.0285));
    CHECK(ll.lng == doctest::Approx(105.8542));
}

TEST_CASE("latLngToPoint and pointToLatLng are exact inverses") {
    const vector<LatLng> samples{
        {21.0285, 105.8542}, {-37.8136, 144.9631}, {90, -180}, {0, 0}, {-0.000001, 179.999999}
    };
    for (const auto& ll : samples) {
        CHECK(pointToLatLng(latLngToPoint(ll)) == ll);
        const Point p = latLngToPoint(ll);
        CHECK(p.coordinates.lon == ll.lng);
        CHECK(p.coordinates.lat == ll.lat);
    }
}

// -----------------------------------------------------------------------------
// Tests for wktPointToGeoJSON
// -----------------------------------------------------------------------------

TEST_CASE("wktPointToGeoJSON parses a WKT point") {
    const auto p = wktPointToGeoJSON("POINT(105.8542 21.0285)");

    REQUIRE(p.has_value());
    CHECK(p->coordinates.lon == doctest::Approx(105.8542));
    CHECK(p->coordinates.lat == doctest::Approx(21.0285));
}

TEST_CASE("wktPointToGeoJSON is case-insensitive and whitespace tolerant") {
    const auto p = wktPointToGeoJSON("point ( -1.5    -2.25 )");

    REQUIRE(p.has_value());
    CHECK(p->coordinates.lon == doctest::Approx(-1.5));
    CHECK(p->coordinates.lat == doctest::Approx(-2.25));
}

TEST_CASE("wktPointToGeoJSON finds a point inside longer text") {
    const auto p = wktPointToGeoJSON("SRID=4326;POINT(105 21)");

    REQUIRE(p.has_value());
    CHECK(p->coordinates.lon == doctest::Approx(105.0));
    CHECK(p->coordinates.lat == doctest::Approx(21.0));
}

TEST_CASE("wktPointToGeoJSON returns nullopt for anything else") {
    CHECK_FALSE(wktPointToGeoJSON("NOT A POINT").has_value());
    CHECK_FALSE(wktPointToGeoJSON("").has_value());
    CHECK_FALSE(wktPointToGeoJSON("POINT(105.8542)").has_value());
    CHECK_FALSE(wktPointToGeoJSON("POINT(105.8542,21.0285)").has_value());
    CHECK_FALSE(wktPointToGeoJSON("LINESTRING(0 0, 1 1)").has_value());
    CHECK_FALSE(wktPointToGeoJSON("POINT(1e5 2)").has_value());
}

TEST_CASE("wktPointToGeoJSON reads the numeric prefix of odd captures") {
    const auto dotted = wktPointToGeoJSON("POINT(1.2.3 4)");
    REQUIRE(dotted.has_value());
    CHECK(dotted->coordinates.lon == doctest::Approx(1.2));

    const auto dash = wktPointToGeoJSON("POINT(- 4)");
    REQUIRE(dash.has_value());
    CHECK(isnan(dash->coordinates.lon));
    CHECK(dash->coordinates.lat == doctest::Approx(4.0));
}

// -----------------------------------------------------------------------------
// Tests for geoJSONPointToWkt
// -----------------------------------------------------------------------------

TEST_CASE("geoJSONPointToWkt formats without trailing zeros") {
    CHECK(geoJSONPointToWkt(Point{Coordinate{105.8542, 21.0285}}) == "POINT(105.8542 21.0285)");
    CHECK(geoJSONPointToWkt(Point{Coordinate{105, 21}}) == "POINT(105 21)");
    CHECK(geoJSONPointToWkt(Point{Coordinate{-0.1276, 51.5072}}) == "POINT(-0.1276 51.5072)");
}

TEST_CASE("geoJSONPointToWkt avoids exponent notation") {
    CHECK(geoJSONPointToWkt(Point{Coordinate{1e-7, 0}}) == "POINT(0.0000001 0)");
}

TEST_CASE("WKT output parses back to the same coordinates") {
    const vector<Coordinate> samples{
        {105.8542, 21.0285}, {-180, -90}, {179.999999999, 89.999999999},
        {-0.1276, 51.5072}, {1e-7, -1e-12}, {123.456789012345, -45.678901234567}
    };
    for (const auto& c : samples) {
        const auto back = wktPointToGeoJSON(geoJSONPointToWkt(Point{c}));
        REQUIRE(back.has_value());
        CHECK(std::fabs(back->coordinates.lon - c.lon) < 1e-9);
        CHECK(std::fabs(back->coordinates.lat - c.lat) < 1e-9);
    }
}

// -----------------------------------------------------------------------------
// Tests for parseBoundingBox
// -----------------------------------------------------------------------------

TEST_CASE("parseBoundingBox reads minLon,minLat,maxLon,maxLat") {
    const auto box = parseBoundingBox("105.8,21.0,105.9,21.1");

    REQUIRE(box.has_value());
    CHECK(box->minLon == doctest::Approx(105.8));
    CHECK(box->minLat == doctest::Approx(21.0));
    CHECK(box->maxLon == doctest::Approx(105.9));
    CHECK(box->maxLat == doctest::Approx(21.1));
}

TEST_CASE("parseBoundingBox tolerates blanks around numbers") {
    CHECK(parseBoundingBox(" 105.8 , 21.0,105.9 ,21.1 ").has_value());
}

TEST_CASE("parseBoundingBox rejects malformed input") {
    CHECK_FALSE(parseBoundingBox("").has_value());
    CHECK_FALSE(parseBoundingBox("1,2,3").has_value());
    CHECK_FALSE(parseBoundingBox("1,2,3,4,5").has_value());
    CHECK_FALSE(parseBoundingBox("1,2,3,4,").has_value());
    CHECK_FALSE(parseBoundingBox("1,,3,4").has_value());
    CHECK_FALSE(parseBoundingBox("a,b,c,d").has_value());
    CHECK_FALSE(parseBoundingBox("1,2,3,4x").has_value());
}

// -----------------------------------------------------------------------------
// Tests for formatDistance
// -----------------------------------------------------------------------------

TEST_CASE("formatDistance uses metres below one kilometre") {
    CHECK(formatDistance(0.5) == "500 m");
    CHECK(formatDistance(0.0004) == "0 m");
    CHECK(formatDistance(0.9994) == "999 m");
}

TEST_CASE("formatDistance uses one decimal and a comma above one kilometre") {
    CHECK(formatDistance(1.0) == "1,0 km");
    CHECK(formatDistance(2.5) == "2,5 km");
    CHECK(formatDistance(2.319) == "2,3 km");
    CHECK(formatDistance(12.04) == "12,0 km");
}
