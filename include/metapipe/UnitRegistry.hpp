#pragma once
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <rapidjson/document.h>

#include "metapipe/Units.hpp"

namespace metapipe {

// Builds a unit from the "params" object of a node description
// (an empty object when the description has none).
using UnitFactory = std::function<AnyUnit(const rapidjson::Value& params)>;

class UnitRegistry {
public:
    static UnitRegistry& instance();

    /// Register a factory under `name`, replacing any previous one.
    void registerUnit(const std::string& name, UnitFactory f);

    /// Instantiate a unit. Throws std::runtime_error if `name` is unknown.
    AnyUnit create(const std::string& name, const rapidjson::Value& params) const;

    bool contains(const std::string& name) const;

    /// Sorted list of registered names.
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, UnitFactory> _map;
    mutable std::shared_mutex _mutex;
};

/// constant, scale, add, log
void registerBuiltinUnits(UnitRegistry& registry);

}
