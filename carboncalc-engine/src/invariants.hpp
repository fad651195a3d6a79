#ifndef CARBONCALC_INVARIANTS_HPP
#define CARBONCALC_INVARIANTS_HPP

#include "financial_model.hpp"
#include <string>
#include <vector>

namespace carboncalc {

// Accounting identities are checked to the cent
constexpr double INVARIANT_TOLERANCE = 0.01;

// Outcome of one identity check across every year of a result
struct InvariantResult {
    std::string name;               // e.g. "balance_identity"
    std::string description;
    bool pass;
    std::string details;            // first offending year and values when failed

    InvariantResult() : pass(true) {}
    InvariantResult(const std::string& n, const std::string& desc)
        : name(n), description(desc), pass(true) {}
};

// Evaluate every accounting identity on a computed result:
//   revenue_sum, opex_sum, cogs, income_chain, interest_sign, debt_roll,
//   dscr_formula, balance_identity, equity_identity, cash_tie_out, cash_roll,
//   cash_continuity, single_implied_price, issuance_bound
std::vector<InvariantResult> check_invariants(const ModelResult& result);

// Number of failed checks
size_t count_failures(const std::vector<InvariantResult>& results);

} // namespace carboncalc

#endif // CARBONCALC_INVARIANTS_HPP
