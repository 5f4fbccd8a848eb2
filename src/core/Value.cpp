#include "metapipe/Value.hpp"

#include <sstream>

namespace metapipe {

std::optional<double> asNumber(const Value& v) {
  if (auto i = std::get_if<int>(&v))    return static_cast<double>(*i);
  if (auto d = std::get_if<double>(&v)) return *d;
  return std::nullopt;
}

namespace {

template <typename Seq, typename F>
void joinInto(std::ostringstream& oss, const Seq& seq, F&& each) {
  oss << '[';
  bool first = true;
  for (const auto& x : seq) {
    if (!first) oss << ',';
    first = false;
    each(x);
  }
  oss << ']';
}

void render(std::ostringstream& oss, const Value& v) {
  std::visit([&oss](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, bool>) {
      oss << (x ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
      oss << '"' << x << '"';
    } else if constexpr (std::is_same_v<T, std::vector<ValueItem>>) {
      joinInto(oss, x, [&oss](const ValueItem& item) { render(oss, item.value); });
    } else if constexpr (std::is_same_v<T, std::vector<int>> ||
                         std::is_same_v<T, std::vector<double>>) {
      joinInto(oss, x, [&oss](auto n) { oss << n; });
    } else {
      oss << x;
    }
  }, v);
}

} // namespace

std::string toString(const Value& v) {
  std::ostringstream oss;
  render(oss, v);
  return oss.str();
}

} // namespace metapipe
