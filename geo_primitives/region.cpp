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
#include "region.hpp"
#include "measure.hpp"

using geometry::Point;

namespace region {
    // Returns true if point lies inside the region's bounding box, edges included
    bool isInRegion(const Point& point, const Region& region) {
        return measure::inBoundingBox(point, region.bbox);
    }

    bool isInHanoi(const Point& point) {
        return isInRegion(point, HANOI);
    }
}  // namespace region
