#include "gb/qc/summary.hpp"
#include "gb/core/stats.hpp"

#include <iomanip>
#include <ostream>

namespace gb::qc {

ChainSummary summarize(const std::vector<core::Sample>& samples) {
  core::RunningCovariance acc;
  std::vector<double> xs, ys;
  xs.reserve(samples.size());
  ys.reserve(samples.size());
  for (const auto& s : samples) {
    acc.add(s.x, s.y);
    xs.push_back(s.x);
    ys.push_back(s.y);
  }

  ChainSummary out;
  out.n           = acc.count();
  out.mean_x      = acc.mean_x();
  out.mean_y      = acc.mean_y();
  out.var_x       = acc.variance_x();
  out.var_y       = acc.variance_y();
  out.correlation = acc.correlation();
  out.lag1_x      = core::autocorrelation(xs, 1);
  out.lag1_y      = core::autocorrelation(ys, 1);
  return out;
}

void print_summary(std::ostream& os, const ChainSummary& s) {
  const auto old_flags = os.flags();
  const auto old_prec  = os.precision();
  os << std::fixed << std::setprecision(6);
  os << "n           : " << s.n           << "\n"
     << "mean_x      : " << s.mean_x      << "\n"
     << "mean_y      : " << s.mean_y      << "\n"
     << "var_x       : " << s.var_x       << "\n"
     << "var_y       : " << s.var_y       << "\n"
     << "correlation : " << s.correlation << "\n"
     << "lag1_x      : " << s.lag1_x      << "\n"
     << "lag1_y      : " << s.lag1_y      << "\n";
  os.flags(old_flags);
  os.precision(old_prec);
}

} // namespace gb::qc
