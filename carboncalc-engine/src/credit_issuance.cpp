#include "credit_issuance.hpp"
#include <algorithm>
#include <stdexcept>

namespace carboncalc {

std::vector<double> calculate_issued_credits(
    const std::vector<double>& credits_generated,
    const std::vector<int>& issuance_flag)
{
    if (credits_generated.size() != issuance_flag.size()) {
        throw std::invalid_argument("credits_generated and issuance_flag must have the same length");
    }

    std::vector<double> issued(credits_generated.size(), 0.0);
    double cumulative_generated = 0.0;
    double cumulative_issued = 0.0;

    for (size_t t = 0; t < credits_generated.size(); ++t) {
        cumulative_generated += credits_generated[t];
        double remaining = cumulative_generated - cumulative_issued;

        // A negative inventory (net write-downs) never issues
        double upper = std::max(0.0, remaining);
        issued[t] = std::clamp(remaining * issuance_flag[t], 0.0, upper);

        cumulative_issued += issued[t];
    }

    return issued;
}

} // namespace carboncalc
