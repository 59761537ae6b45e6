#include <vs/config/screener_config.hpp>

#include <cctype>

namespace vs {
namespace config {

std::optional<YtdPolicy> parse_ytd_policy(const std::string& s) {
  std::string l;
  for (unsigned char c : s) l.push_back(static_cast<char>(std::tolower(c)));
  if (l == "last" || l == "series" || l == "last_observation") return YtdPolicy::LastObservationYear;
  if (l == "wall" || l == "clock" || l == "wall_clock")         return YtdPolicy::WallClockYear;
  return std::nullopt;
}

const char* to_string(YtdPolicy p) noexcept {
  return p == YtdPolicy::WallClockYear ? "wall" : "last";
}

} // namespace config
} // namespace vs
