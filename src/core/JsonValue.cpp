#include "metapipe/JsonValue.hpp"

#include <stdexcept>

namespace metapipe {

Value valueFromJson(const rapidjson::Value& v) {
  if (v.IsBool())   return v.GetBool();
  if (v.IsInt())    return v.GetInt();
  if (v.IsNumber()) return v.GetDouble();
  if (v.IsString()) return std::string(v.GetString(), v.GetStringLength());

  if (v.IsArray()) {
    bool allInt = true, allNum = true;
    for (const auto& e : v.GetArray()) {
      allInt = allInt && e.IsInt();
      allNum = allNum && e.IsNumber();
    }
    if (allInt && !v.Empty()) {
      std::vector<int> out;
      out.reserve(v.Size());
      for (const auto& e : v.GetArray()) out.push_back(e.GetInt());
      return out;
    }
    if (allNum) {
      std::vector<double> out;
      out.reserve(v.Size());
      for (const auto& e : v.GetArray()) out.push_back(e.GetDouble());
      return out;
    }
    std::vector<ValueItem> out;
    out.reserve(v.Size());
    for (const auto& e : v.GetArray()) out.emplace_back(valueFromJson(e));
    return out;
  }

  throw std::runtime_error("valueFromJson: null and object values are not supported");
}

} // namespace metapipe
