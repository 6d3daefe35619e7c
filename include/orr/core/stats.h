#pragma once
// orr/core/stats.h
//
// Sample statistics behind the steps-to-target summaries.
//  - MedianSorted: middle element, or the midpoint of the two middle elements.
//  - Summarize: count/mean/population std/min/median/max over the finite
//    samples of a vector.

#include "orr/core/types.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace orr {

// `sorted` must be ascending and non-empty.
inline double MedianSorted(const std::vector<double>& sorted) {
  const usize mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) return sorted[mid];
  return 0.5 * (sorted[mid - 1] + sorted[mid]);
}

struct Summary {
  usize n{0};

  double mean{0.0};
  double stdev{0.0};  // population (divide by n)

  double min{0.0};
  double median{0.0};
  double max{0.0};
};

// Non-finite samples are dropped; n == 0 means nothing was left.
// Two passes over the sorted samples: the mean first, then squared
// deviations from it, both accumulated in long double.
inline Summary Summarize(const std::vector<double>& samples) {
  Summary s;

  std::vector<double> sorted;
  sorted.reserve(samples.size());
  for (double x : samples) {
    if (std::isfinite(x)) sorted.push_back(x);
  }
  if (sorted.empty()) return s;
  std::sort(sorted.begin(), sorted.end());

  const long double n = static_cast<long double>(sorted.size());
  long double sum = 0.0L;
  for (double x : sorted) sum += x;
  const long double mean = sum / n;

  long double sq = 0.0L;
  for (double x : sorted) {
    const long double d = static_cast<long double>(x) - mean;
    sq += d * d;
  }

  s.n = sorted.size();
  s.mean = static_cast<double>(mean);
  s.stdev = static_cast<double>(std::sqrt(sq / n));
  s.min = sorted.front();
  s.max = sorted.back();
  s.median = MedianSorted(sorted);
  return s;
}

}  // namespace orr
