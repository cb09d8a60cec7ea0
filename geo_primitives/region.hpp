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
#ifndef GEO_PRIMITIVES_REGION_HPP_
#define GEO_PRIMITIVES_REGION_HPP_

#include "geometry.hpp"

namespace region {

// named metropolitan region: extent plus a reference center
struct Region {
    const char* name;
    geometry::BoundingBox bbox;
    geometry::Point center;
};

// Hanoi extent (minLon, minLat, maxLon, maxLat)
const geometry::BoundingBox HANOI_BOUNDING_BOX{105.28, 20.56, 106.02, 21.38};

// Hoan Kiem Lake
const geometry::Point HANOI_CENTER{geometry::Coordinate{105.8542, 21.0285}};

const Region HANOI{"Hanoi", HANOI_BOUNDING_BOX, HANOI_CENTER};

bool isInRegion(const geometry::Point& point, const Region& region = HANOI);
bool isInHanoi(const geometry::Point& point);

}  // namespace region

#endif  // GEO_PRIMITIVES_REGION_HPP_
