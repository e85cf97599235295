#pragma once

#include <vector>

namespace StatsUtils {
double runningMean(const std::vector<double>& values);
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Sample standard deviation with denominator n-1.
 * @post Returns 0 for fewer than two values.
 */
double sampleStdDev(const std::vector<double>& values);

double normalCdf(double x);

/**
 * @brief Inverse standard normal CDF (Acklam's rational approximation with one Halley refinement).
 * @pre 0 < p < 1; p outside the open interval maps to -inf / +inf.
 */
double normalQuantile(double p);
}
