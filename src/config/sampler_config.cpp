#include <gb/config/sampler_config.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gb {
namespace config {

const char* method_name(Method m) noexcept {
  return m == Method::Exact ? "exact" : "gibbs";
}

Method parse_method(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "exact") return Method::Exact;
  if (s == "gibbs") return Method::Gibbs;
  throw std::invalid_argument("unknown sampling method: " + name);
}

} // namespace config
} // namespace gb
