#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace metapipe {

// Forward declare the wrapper so lists may nest
struct ValueItem;

// Anything that can travel over a port
using Value = std::variant<
  bool,
  int,
  double,
  std::string,
  std::vector<int>,
  std::vector<double>,
  std::vector<ValueItem>
>;

struct ValueItem {
  Value value;

  ValueItem() = default;
  ValueItem(const Value& val) : value(val) {}
  ValueItem(Value&& val) : value(std::move(val)) {}

  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ValueItem>>>
  ValueItem(T&& val) : value(std::forward<T>(val)) {}
};

inline bool operator==(const ValueItem& a, const ValueItem& b) { return a.value == b.value; }
inline bool operator!=(const ValueItem& a, const ValueItem& b) { return !(a == b); }

// Port name -> value
using ValueMap = std::unordered_map<std::string, Value>;

// int and double both count as numbers; everything else does not.
std::optional<double> asNumber(const Value& v);

// Short human readable rendering, used by logs and the log sink.
std::string toString(const Value& v);

} // namespace metapipe
