#include "gb/io/sample_text.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

// parse strict : tout le champ doit être consommé
static bool parse_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

} // namespace

namespace gb::io {

void write_samples(std::ostream& os, const std::vector<core::Sample>& samples) {
  const auto old_flags = os.flags();
  const auto old_prec  = os.precision();
  os << std::fixed << std::setprecision(3);
  for (const auto& s : samples) {
    os << s.x << ' ' << s.y << '\n';
  }
  os.flags(old_flags);
  os.precision(old_prec);
  if (!os) {
    throw std::runtime_error("write_samples: output stream failure");
  }
}

std::vector<core::Sample>
read_samples(std::istream& is,
             std::size_t* num_ignored,
             std::vector<std::string>* warnings) {
  std::vector<core::Sample> out;
  std::size_t ignored = 0;
  std::string line;
  std::size_t lineno = 0;

  auto reject = [&](const std::string& why) {
    ++ignored;
    if (warnings) {
      warnings->push_back("line " + std::to_string(lineno) + ": " + why);
    }
  };

  while (std::getline(is, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream fields(line);
    std::string a, b, extra;
    if (!(fields >> a)) continue;              // ligne vide
    if (a[0] == '#') continue;                 // commentaire
    if (!(fields >> b)) { reject("missing second field"); continue; }
    if (fields >> extra) { reject("more than two fields"); continue; }

    core::Sample s;
    if (!parse_double(a, s.x) || !parse_double(b, s.y)) {
      reject("non numeric field");
      continue;
    }
    out.push_back(s);
  }

  if (num_ignored) *num_ignored = ignored;
  return out;
}

std::vector<core::Sample>
read_samples_file(const std::string& path,
                  std::size_t* num_ignored,
                  std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open sample file: " + path);
  }
  return read_samples(f, num_ignored, warnings);
}

} // namespace gb::io
