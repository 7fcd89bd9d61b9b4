// ============================================================================
// Stats: Online Mean + Min/Max + Pearson Correlation Accumulator
// File: cpp/desal/stats/online_stats.hpp
// ============================================================================
//
// Purpose:
// - Single-pass statistics for the monthly / seasonal / annual summaries:
//     count, sum, running mean, min/max
// - Single-pass Pearson correlation of paired samples (co-moment form).
// - NaN filtering: non-finite samples are ignored, never propagated.
//
// Degenerate input policy:
// - Empty accumulators report 0 for the mean and both extremes.
// - Correlation of a constant (or < 2 sample) series is 0.
//
// ============================================================================

#pragma once
#include "desal/core/numeric.hpp"

#include <cstdint>
#include <limits>

namespace desal::stats {

// -----------------------------
// OnlineStats (running mean)
// -----------------------------
struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();
    double sum = 0.0;

    void push(double x) noexcept {
        if (!is_finite(x)) return;

        ++n;
        sum += x;

        if (x < min_v) min_v = x;
        if (x > max_v) max_v = x;

        mean += (x - mean) / static_cast<double>(n);
    }

    double mean_or_zero() const noexcept {
        return (n > 0 && is_finite(mean)) ? mean : 0.0;
    }

    double min() const noexcept {
        if (n == 0) return 0.0;
        return is_finite(min_v) ? min_v : 0.0;
    }

    double max() const noexcept {
        if (n == 0) return 0.0;
        return is_finite(max_v) ? max_v : 0.0;
    }
};

// -----------------------------
// PearsonAccumulator (paired Welford)
// -----------------------------
// A pair is dropped if either member is non-finite.
struct PearsonAccumulator final {
    std::uint64_t n = 0;
    double mean_x = 0.0;
    double mean_y = 0.0;
    double M2x = 0.0;
    double M2y = 0.0;
    double Cxy = 0.0; // co-moment

    void push(double x, double y) noexcept {
        if (!is_finite(x) || !is_finite(y)) return;

        ++n;
        const double inv_n = 1.0 / static_cast<double>(n);
        const double dx = x - mean_x;
        mean_x += dx * inv_n;
        const double dy = y - mean_y;
        mean_y += dy * inv_n;

        M2x += dx * (x - mean_x);
        M2y += dy * (y - mean_y);
        Cxy += dx * (y - mean_y);
    }

    // r in [-1, 1]; 0 when either series has no spread.
    double correlation() const noexcept {
        if (n < 2) return 0.0;
        if (!(M2x > 0.0) || !(M2y > 0.0)) return 0.0;
        const double den = safe_sqrt(M2x * M2y, 0.0);
        const double r = safe_div(Cxy, den, 0.0);
        return clamp(r, -1.0, 1.0);
    }
};

} // namespace desal::stats
