#include "revenue_allocation.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace carboncalc {

RevenueAllocation::RevenueAllocation() : implied_purchase_price(0.0) {}

CarbonStreamRow::CarbonStreamRow()
    : year(0), purchase_amount(0.0), purchased_credits(0.0),
      implied_purchase_price(0.0), investor_cash_flow(0.0) {}

RevenueAllocation allocate_revenue(const ModelInputs& inputs, const std::vector<double>& issued) {
    const size_t L = issued.size();
    if (inputs.num_years() != L) {
        throw std::invalid_argument("Issued credit series does not match the model horizon");
    }

    RevenueAllocation allocation;
    allocation.entitlement.assign(L, 0.0);
    allocation.delivered.assign(L, 0.0);
    allocation.spot_revenue.assign(L, 0.0);
    allocation.pre_purchase_revenue.assign(L, 0.0);

    std::optional<size_t> purchase_year = inputs.purchase_year_index();
    bool active = purchase_year.has_value() && inputs.purchase_share > 0.0;

    if (active) {
        for (size_t t = 0; t < L; ++t) {
            allocation.entitlement[t] = issued[t] * inputs.purchase_share;
        }

        double total_entitlement = std::accumulate(
            allocation.entitlement.begin(), allocation.entitlement.end(), 0.0);

        if (total_entitlement > 0.0) {
            allocation.implied_purchase_price =
                inputs.purchase_amount[*purchase_year] / total_entitlement;

            double remaining_entitlement = total_entitlement;
            for (size_t t = 0; t < L; ++t) {
                double delivery = std::min(allocation.entitlement[t], remaining_entitlement);
                delivery = std::max(0.0, delivery);
                allocation.delivered[t] = delivery;
                remaining_entitlement -= delivery;
            }
        }
    }

    for (size_t t = 0; t < L; ++t) {
        allocation.spot_revenue[t] =
            (issued[t] - allocation.delivered[t]) * inputs.price_per_credit[t];
        allocation.pre_purchase_revenue[t] =
            allocation.delivered[t] * allocation.implied_purchase_price;
    }

    return allocation;
}

std::vector<CarbonStreamRow> build_carbon_stream(const ModelInputs& inputs,
                                                 const RevenueAllocation& allocation) {
    const size_t L = inputs.num_years();
    std::vector<CarbonStreamRow> stream(L);

    for (size_t t = 0; t < L; ++t) {
        CarbonStreamRow& row = stream[t];
        row.year = inputs.years[t];
        row.purchase_amount = inputs.purchase_amount[t];
        row.purchased_credits = allocation.delivered[t];
        row.implied_purchase_price = allocation.implied_purchase_price;
        row.investor_cash_flow = -row.purchase_amount
                               + row.purchased_credits * inputs.price_per_credit[t];
    }

    return stream;
}

} // namespace carboncalc
