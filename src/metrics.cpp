#include "metrics.hpp"

#include <cmath>
#include <sstream>

int64_t BitrateHistory::average_nonzero() const {
  std::lock_guard<std::mutex> g(mu_);
  double sum = 0.0;
  size_t n = 0;
  for (int64_t v : vals_) {
    if (v <= 0) continue;
    sum += static_cast<double>(v);
    ++n;
  }
  return n ? static_cast<int64_t>(sum / static_cast<double>(n)) : 0;
}

std::optional<BitrateHistory::Dispersion> BitrateHistory::dispersion(size_t min_samples,
                                                                     size_t min_nonzero) const {
  std::vector<double> nz;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() < min_samples) return std::nullopt;
    for (int64_t v : vals_) {
      if (v > 0) nz.push_back(static_cast<double>(v));
    }
  }
  if (nz.empty() || nz.size() < min_nonzero) return std::nullopt;

  Dispersion d;
  for (double v : nz) d.mean += v;
  d.mean /= static_cast<double>(nz.size());
  for (double v : nz) d.variance += (v - d.mean) * (v - d.mean);
  d.variance /= static_cast<double>(nz.size());
  d.cv = d.mean > 0.0 ? std::sqrt(d.variance) / d.mean : 0.0;
  return d;
}

std::string prometheus_text(const WatchdogStats& s) {
  std::ostringstream os;
  os << "streamkeeper_watchdog_running " << (s.running ? 1 : 0) << "\n";
  os << "streamkeeper_watchdog_checks_total " << s.total_checks << "\n";
  os << "streamkeeper_watchdog_checks_effective_total " << s.effective_checks << "\n";
  os << "streamkeeper_watchdog_checks_skipped_total " << s.skipped_checks << "\n";
  os << "streamkeeper_watchdog_anomalies_total " << s.anomalies_detected << "\n";
  os << "streamkeeper_bitrate_bps " << s.current_bitrate << "\n";
  os << "streamkeeper_bitrate_average_bps " << s.average_bitrate << "\n";
  return os.str();
}
