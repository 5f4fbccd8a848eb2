#pragma once

#include <rapidjson/document.h>

#include "metapipe/Value.hpp"

namespace metapipe {

// bool/int/double/string map directly. Arrays become vector<int> when every
// element is an int, vector<double> when every element is a number, and a
// nested vector<ValueItem> otherwise. null and objects are rejected with
// std::runtime_error.
Value valueFromJson(const rapidjson::Value& v);

} // namespace metapipe
