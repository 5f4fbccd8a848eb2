#include "metapipe/UnitRegistry.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>

using namespace metapipe;

UnitRegistry& UnitRegistry::instance() {
    static UnitRegistry inst;
    return inst;
}

void UnitRegistry::registerUnit(const std::string& name, UnitFactory f) {
    if (!f) throw std::invalid_argument("UnitRegistry: empty factory for '" + name + "'");
    std::unique_lock lock(_mutex);
    _map[name] = std::move(f);
}

AnyUnit UnitRegistry::create(const std::string& name, const rapidjson::Value& params) const {
    UnitFactory f;
    {
        std::shared_lock lock(_mutex);
        auto it = _map.find(name);
        if (it == _map.end()) throw std::runtime_error("Unit not found: " + name);
        f = it->second;
    }
    // Factories may be slow or register further units; call unlocked.
    return f(params);
}

bool UnitRegistry::contains(const std::string& name) const {
    std::shared_lock lock(_mutex);
    return _map.find(name) != _map.end();
}

std::vector<std::string> UnitRegistry::names() const {
    std::shared_lock lock(_mutex);
    std::vector<std::string> v;
    v.reserve(_map.size());
    for (const auto& kv : _map) {
        v.push_back(kv.first);
    }
    std::sort(v.begin(), v.end());
    return v;
}
