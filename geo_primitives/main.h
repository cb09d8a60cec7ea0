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
#ifndef GEO_PRIMITIVES_MAIN_H_
#define GEO_PRIMITIVES_MAIN_H_

#include <optional>
#include <string>

using std::optional;
using std::string;

// input args for main entry point
struct Args {
    string geojsonPath;
    optional<string> pointWkt;
    optional<string> outCsv;
};

bool parseArgs(int argc, char** argv, Args* out);
void usage(const char* exe);

#endif  // GEO_PRIMITIVES_MAIN_H_
