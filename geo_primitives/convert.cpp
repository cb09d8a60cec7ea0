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
#include "convert.hpp"
#include <cmath>     // for round, NAN
#include <cstdlib>   // for strtod
#include <iomanip>   // for setprecision
#include <locale>    // for locale
#include <optional>  // for optional, nullopt
#include <regex>     // for regex, regex_search, smatch
#include <sstream>   // for basic_ostringstream, basic_istringstream
#include <string>    // for string, getline
#include <vector>    // for vector

using std::fixed;
using std::istringstream;
using std::nullopt;
using std::optional;
using std::ostringstream;
using std::regex;
using std::setprecision;
using std::smatch;
using std::string;
using std::vector;

using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::LatLng;
using geometry::Point;

namespace convert {
    namespace {
        // POINT(<lon> <lat>), keyword case-insensitive, matched anywhere in the input
        const regex WKT_POINT(R"(POINT\s*\(\s*([-0-9.]+)\s+([-0-9.]+)\s*\))", regex::icase);

        // Longest numeric prefix of s, or NaN when there is none
        double parseLeadingNumber(const string& s) {
            const char* begin = s.c_str();
            char* end = nullptr;
            const double value = std::strtod(begin, &end);
            if (end == begin) return NAN;
            return value;
        }

        // Whole-string number parse; surrounding blanks allowed
        optional<double> parseNumber(const string& s) {
            const auto first = s.find_first_not_of(" \t");
            if (first == string::npos) return nullopt;
            const auto last = s.find_last_not_of(" \t");
            const string trimmed = s.substr(first, last - first + 1);
            const char* begin = trimmed.c_str();
            char* end = nullptr;
            const double value = std::strtod(begin, &end);
            if (end != begin + trimmed.size()) return nullopt;
            return value;
        }

        // Up to 15 significant digits without trailing zeros. Exponent notation
        // is avoided so the WKT pattern can read the number back.
        string formatCoordinate(double value) {
            ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << setprecision(15) << value;
            string text = oss.str();
            if (text.find('e') == string::npos) return text;

            oss.str("");
            oss << fixed << setprecision(20) << value;
            text = oss.str();
            text.erase(text.find_last_not_of('0') + 1);
            if (text.back() == '.') text.pop_back();
            return text;
        }
    }  // namespace

    LatLng pointToLatLng(const Point& point) {
        return LatLng{point.coordinates.lat, point.coordinates.lon};
    }

    Point latLngToPoint(const LatLng& latlng) {
        return Point{Coordinate{latlng.lng, latlng.lat}};
    }

    // Parses a WKT POINT into a GeoJSON Point
    //
    // Args:
    //    wkt: text such as "POINT(105.8542 21.0285)"
    // Returns:
    //    the Point, or nullopt when the text holds no POINT
    optional<Point> wktPointToGeoJSON(const string& wkt) {
        smatch match;
        if (!std::regex_search(wkt, match, WKT_POINT)) return nullopt;
        return Point{Coordinate{parseLeadingNumber(match[1].str()), parseLeadingNumber(match[2].str())}};
    }

    // Formats a Point as "POINT(<lon> <lat>)" without trailing zeros
    string geoJSONPointToWkt(const Point& point) {
        return "POINT(" + formatCoordinate(point.coordinates.lon) + " " +
            formatCoordinate(point.coordinates.lat) + ")";
    }

    // Parses "minLon,minLat,maxLon,maxLat" as used by bbox query parameters
    //
    // Args:
    //    text: exactly four comma-separated numbers
    // Returns:
    //    the box, or nullopt for any other shape of input
    optional<BoundingBox> parseBoundingBox(const string& text) {
        vector<double> values;
        istringstream in(text);
        string part;
        while (std::getline(in, part, ',')) {
            const auto value = parseNumber(part);
            if (!value) return nullopt;
            values.push_back(*value);
        }
        // getline drops a trailing empty field
        if (values.size() != 4 || text.back() == ',') return nullopt;

        BoundingBox box;
        box.minLon = values[0];
        box.minLat = values[1];
        box.maxLon = values[2];
        box.maxLat = values[3];
        return box;
    }

    // Human-readable distance: "500 m" below one kilometre, "2,5 km" above
    string formatDistance(double km) {
        ostringstream oss;
        oss.imbue(std::locale::classic());
        if (km < 1) {
            oss << static_cast<long long>(std::round(km * 1000)) << " m";
            return oss.str();
        }
        oss << fixed << setprecision(1) << km;
        string text = oss.str();
        const auto dot = text.find('.');
        if (dot != string::npos) text[dot] = ',';
        return text + " km";
    }
}  // namespace convert
