#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;

void TestTimeBucketTable() {
  struct Case {
    std::chrono::nanoseconds input;
    std::chrono::nanoseconds expected;
  };

  const Case cases[] = {
      {0s, 1s},      {500ms, 1s},   {1s, 1s},      {1500ms, 1s},  {2s, 2s},       {2500ms, 2s},
      {3s, 3s},      {3500ms, 3s},  {4s, 4s},      {5s, 6s},      {6s, 6s},       {6400ms, 6s},
      {7s, 6s},      {8s, 9s},      {9s, 9s},      {10s, 9s},     {11s, 12s},     {12s, 12s},
      {13s, 12s},    {14s, 15s},    {17s, 18s},    {20s, 21s},    {59s, 60s},     {60s, 60s},
      {61s, 1min},   {89s, 1min},   {90s, 2min},   {119s, 2min},  {120s, 2min},   {150s, 3min},
      {179s, 3min},  {180s, 3min},  {5min, 5min},  {5min + 29s, 5min},            {5min + 30s, 6min},
  };

  for (const auto& c : cases) {
    const auto got = launcher::util::TimeBucket(c.input);
    if (got != c.expected) {
      std::cerr << "TimeBucket(" << launcher::util::FormatDuration(c.input) << ") = "
                << launcher::util::FormatDuration(got) << ", want " << launcher::util::FormatDuration(c.expected)
                << "\n";
    }
    assert(got == c.expected);
  }
}

void TestFormatDuration() {
  using launcher::util::FormatDuration;

  assert(FormatDuration(0s) == "0s");
  assert(FormatDuration(6s) == "6s");
  assert(FormatDuration(6400ms) == "6.4s");
  assert(FormatDuration(250ms) == "250ms");
  assert(FormatDuration(1500us) == "1.5ms");
  assert(FormatDuration(42ns) == "42ns");
  assert(FormatDuration(1min) == "1m0s");
  assert(FormatDuration(90s) == "1m30s");
  assert(FormatDuration(2h + 3s) == "2h0m3s");
}

} // namespace

int main() {
  TestTimeBucketTable();
  TestFormatDuration();

  std::cout << "launcher_unit_timebucket: pass\n";
  return 0;
}
