#ifndef CARBONCALC_REVENUE_ALLOCATION_HPP
#define CARBONCALC_REVENUE_ALLOCATION_HPP

#include "model_inputs.hpp"
#include <vector>

namespace carboncalc {

// Split of issued credits between spot sales and pre-purchase deliveries
struct RevenueAllocation {
    std::vector<double> entitlement;          // purchase_share * issued[t], every year
    std::vector<double> delivered;            // credits delivered to the pre-purchase buyer
    std::vector<double> spot_revenue;         // (issued - delivered) * price_per_credit
    std::vector<double> pre_purchase_revenue; // delivered * implied_purchase_price
    double implied_purchase_price;            // one project-wide price per credit

    RevenueAllocation();

    // True when a pre-purchase agreement is active (purchase year present, share > 0)
    bool has_pre_purchase() const { return implied_purchase_price > 0.0; }
};

// Allocate issued credits to the pre-purchase buyer and the spot market.
//
// Without a purchase year (or with purchase_share == 0) everything is spot-sold
// and the implied price is 0. Otherwise the buyer is entitled to purchase_share of
// every year's issuance and the single cash payment is spread across the total
// entitlement:
//
//   implied_purchase_price = purchase_amount[purchase year] / sum(entitlement)
//
// Deliveries are drawn against a running remaining-entitlement counter, first
// available year first, with no look-ahead.
RevenueAllocation allocate_revenue(const ModelInputs& inputs, const std::vector<double>& issued);

// Pre-purchase buyer's view of the agreement for one year
struct CarbonStreamRow {
    int year;
    double purchase_amount;         // cash paid by the buyer this year
    double purchased_credits;       // credits delivered to the buyer
    double implied_purchase_price;  // same scalar on every row
    double investor_cash_flow;      // -purchase_amount + delivered * price_per_credit

    CarbonStreamRow();
};

std::vector<CarbonStreamRow> build_carbon_stream(const ModelInputs& inputs,
                                                 const RevenueAllocation& allocation);

} // namespace carboncalc

#endif // CARBONCALC_REVENUE_ALLOCATION_HPP
