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
#ifndef GEO_PRIMITIVES_RESULT_HPP_
#define GEO_PRIMITIVES_RESULT_HPP_

#include <string>   // for string
#include <utility>  // for move
#include <variant>  // for variant, get, holds_alternative

using std::string;

namespace result {

// Reasons a validating constructor can reject its input
enum class ErrorKind {
    InvalidCoordinate,  // lat outside [-90, 90], lon outside [-180, 180], or not finite
    TooFewPoints        // not enough vertices for the geometry kind
};

struct GeometryError {
    ErrorKind kind;
    string message;
};

// Holds either a value or the GeometryError explaining why there is none
template <typename T>
class Result {
 public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const GeometryError& error) : data_(error) {}
    Result(GeometryError&& error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(data_); }
    T& value() & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

    const GeometryError& error() const { return std::get<GeometryError>(data_); }

 private:
    std::variant<T, GeometryError> data_;
};

}  // namespace result

#endif  // GEO_PRIMITIVES_RESULT_HPP_
