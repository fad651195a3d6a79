#ifndef CARBONCALC_CREDIT_ISSUANCE_HPP
#define CARBONCALC_CREDIT_ISSUANCE_HPP

#include <vector>

namespace carboncalc {

// Convert per-year generation and issuance flags into an issued-credit series.
//
// remaining[t] = sum(generated[0..t]) - sum(issued[0..t-1])
// issued[t]    = clamp(remaining[t] * flag[t], 0, remaining[t])
//
// Cumulative issuance never exceeds cumulative generation, and credits are only
// issued in flagged years. Unissued inventory carries forward to the next
// flagged year.
std::vector<double> calculate_issued_credits(
    const std::vector<double>& credits_generated,
    const std::vector<int>& issuance_flag
);

} // namespace carboncalc

#endif // CARBONCALC_CREDIT_ISSUANCE_HPP
