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

// main.cpp

// 1. Project headers
#include "main.h"

// 2. C++ system headers
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// 3. Other library headers
#include "convert.hpp"
#include "geojson_io.hpp"
#include "geometry.hpp"
#include "measure.hpp"
#include "region.hpp"
#include "report.hpp"

using std::cerr;
using std::cout;
using std::exception;
using std::ofstream;
using std::optional;
using std::runtime_error;
using std::setprecision;
using std::string;

using geometry::BoundingBox;
using geometry::Point;

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
// Returns:
//    false when help was requested or --geojson is missing
bool parseArgs(int argc, char** argv, Args* out) {
    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        if (a == "--geojson" && i + 1 < argc) {
            out->geojsonPath = argv[++i];
        } else if (a == "--point" && i + 1 < argc) {
            out->pointWkt = argv[++i];
        } else if (a == "--out" && i + 1 < argc) {
            out->outCsv = argv[++i];
        } else if (a == "--help" || a == "-h") {
            return false;
        }
    }
    return !out->geojsonPath.empty();
}

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
    << "  " << exe
    << " --geojson /path/to/features.geojson [--point \"POINT(<lon> <lat>)\"] [--out report.csv]\n";
}

// Entry point
int main(int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, &args)) {
        usage(argv[0]);
        return 1;
    }

    try {
        // 1) Optional query point
        optional<Point> query;
        if (args.pointWkt) {
            query = convert::wktPointToGeoJSON(*args.pointWkt);
            if (!query) throw runtime_error("Unparseable --point, expected POINT(<lon> <lat>): " + *args.pointWkt);
            cerr << "Query point: " << convert::geoJSONPointToWkt(*query)
                 << (region::isInHanoi(*query) ? " (in " : " (outside ") << region::HANOI.name << ")\n";
        }

        // 2) Load features
        const auto collection = geojson_io::loadFeatureCollection(args.geojsonPath);
        cerr << "Features loaded: " << collection.features.size() << "\n";

        const BoundingBox extent = measure::boundingBox(collection);
        if (extent.empty()) {
            cout << "Collection has no coordinates.\n";
        } else {
            cout << setprecision(15) << "Extent: [" << extent.minLon << "," << extent.minLat << ","
                 << extent.maxLon << "," << extent.maxLat << "]\n";
        }

        // 3) Per-feature report
        const auto rows = report::reportCollection(collection, query);
        for (const auto& row : rows) report::printReport(cout, row);

        // Optional CSV output
        if (args.outCsv) {
            ofstream out(*args.outCsv);
            if (!out) throw runtime_error("Failed to open CSV for writing: " + *args.outCsv);
            report::writeCsv(out, rows);
            cerr << "Wrote report CSV to " << *args.outCsv << "\n";
        }
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
