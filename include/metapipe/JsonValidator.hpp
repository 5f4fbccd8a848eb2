#pragma once
#include <rapidjson/document.h>
#include <string>
#include <stdexcept>

namespace metapipe {
class JsonValidator {
public:
    // Structure of a pipeline description: {"nodes":[...], "edges":[...]}
    static void validateGraph(const rapidjson::Value& doc);
    static void validateNode(const rapidjson::Value& v);
    static void validateEdge(const rapidjson::Value& v);

    // throw if v[name] is missing or not of expectedType
    static void requireMember(const rapidjson::Value& v,
                              const char* name,
                              rapidjson::Type expectedType)
    {
        if (!v.HasMember(name) || v[name].GetType() != expectedType) {
            throw std::runtime_error(
                std::string("JSON node missing or wrong-type for field '") +
                name + "'");
        }
    }

    // Like requireMember for strings; rapidjson reports true/false as two
    // distinct types, so strings get their own check.
    static void requireString(const rapidjson::Value& v, const char* name)
    {
        if (!v.HasMember(name) || !v[name].IsString()) {
            throw std::runtime_error(
                std::string("JSON node missing or wrong-type for field '") +
                name + "'");
        }
    }
};
}
