#include "time.hpp"

#include <cstdint>

namespace launcher::util {

namespace {

// Formats value / 10^digits with trailing zeros of the fraction removed.
std::string FormatFraction(uint64_t value, int digits) {
  uint64_t scale = 1;
  for (int i = 0; i < digits; ++i)
    scale *= 10;

  std::string out = std::to_string(value / scale);
  uint64_t    frac = value % scale;
  if (frac == 0) {
    return out;
  }

  std::string frac_text = std::to_string(frac);
  frac_text.insert(0, static_cast<size_t>(digits) - frac_text.size(), '0');
  while (!frac_text.empty() && frac_text.back() == '0')
    frac_text.pop_back();
  return out + "." + frac_text;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::chrono::nanoseconds TimeBucket(std::chrono::nanoseconds elapsed) {
  using std::chrono::minutes;
  using std::chrono::seconds;

  if (elapsed <= seconds(1)) {
    return seconds(1);
  }

  const auto whole_seconds = std::chrono::duration_cast<seconds>(elapsed).count();
  if (elapsed < seconds(5)) {
    return seconds(whole_seconds);
  }

  if (elapsed <= seconds(60)) {
    return seconds(((whole_seconds - 5) / 3) * 3 + 6);
  }

  const auto half_minute = std::chrono::duration_cast<std::chrono::nanoseconds>(seconds(30));
  return std::chrono::duration_cast<minutes>(elapsed + half_minute);
}

std::string FormatDuration(std::chrono::nanoseconds d) {
  if (d.count() == 0) {
    return "0s";
  }

  std::string sign;
  if (d.count() < 0) {
    sign = "-";
    d    = -d;
  }

  const auto ns = static_cast<uint64_t>(d.count());
  if (ns < 1000) {
    return sign + std::to_string(ns) + "ns";
  }
  if (ns < 1000 * 1000) {
    return sign + FormatFraction(ns, 3) + "us";
  }
  if (ns < 1000 * 1000 * 1000) {
    return sign + FormatFraction(ns, 6) + "ms";
  }

  const uint64_t ns_per_second = 1000ULL * 1000 * 1000;
  const uint64_t total_seconds = ns / ns_per_second;
  const uint64_t hours         = total_seconds / 3600;
  const uint64_t minutes       = (total_seconds % 3600) / 60;
  const uint64_t sec_ns        = ns - (hours * 3600 + minutes * 60) * ns_per_second;

  std::string out = sign;
  if (hours > 0) {
    out += std::to_string(hours) + "h";
  }
  if (hours > 0 || minutes > 0) {
    out += std::to_string(minutes) + "m";
  }
  out += FormatFraction(sec_ns, 9) + "s";
  return out;
}

} // namespace launcher::util
