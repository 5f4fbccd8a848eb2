#include "metapipe/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace metapipe {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

// Unsigned decimal only; anything else reads as 0 so the default applies.
std::size_t Config::parseLimit(const std::string& s) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return 0;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') return 0;
  if (v > std::numeric_limits<std::size_t>::max()) return 0;
  return static_cast<std::size_t>(v);
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so older builds accept newer files.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if      (key == "maxPropagationDepth") maxPropagationDepth = parseLimit(val);
    else if (key == "maxWaveDeliveries")   maxWaveDeliveries   = parseLimit(val);
    else if (key == "logLevel")            logLevel            = val;
    else if (key == "logJson")             logJson             = parseBool(val);
    else if (key == "logFile")             logFile             = val;
    else {
      // Unknown key; ignore to stay forward-compatible
    }
  }

  std::fclose(f);

  // A zero or unparsable limit would reject every wave.
  if (maxPropagationDepth == 0) maxPropagationDepth = PropagationLimits{}.maxDepth;
  if (maxWaveDeliveries == 0)   maxWaveDeliveries   = PropagationLimits{}.maxDeliveries;

  return true;
}

PropagationLimits Config::limits() const {
  PropagationLimits l;
  l.maxDepth      = maxPropagationDepth;
  l.maxDeliveries = maxWaveDeliveries;
  return l;
}

} // namespace util
} // namespace metapipe
