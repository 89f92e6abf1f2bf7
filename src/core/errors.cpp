#include <gb/core/errors.hpp>

#include <cmath>    // std::abs
#include <sstream>

namespace gb {
namespace core {

void validate_rho(double rho) {
  // !(|rho| < 1) attrape aussi NaN.
  if (!(std::abs(rho) < 1.0)) {
    std::ostringstream msg;
    msg << "invalid correlation rho=" << rho << " (expected -1 < rho < 1)";
    throw InvalidParameter(msg.str());
  }
}

void validate_parameters(long long n, double rho) {
  if (n < 1) {
    std::ostringstream msg;
    msg << "invalid sample count n=" << n << " (expected n >= 1)";
    throw InvalidParameter(msg.str());
  }
  validate_rho(rho);
}

} // namespace core
} // namespace gb
