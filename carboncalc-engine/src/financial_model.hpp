#ifndef CARBONCALC_FINANCIAL_MODEL_HPP
#define CARBONCALC_FINANCIAL_MODEL_HPP

#include "model_inputs.hpp"
#include "logger.hpp"
#include "input_validator.hpp"
#include "revenue_allocation.hpp"
#include "debt_schedule.hpp"
#include "statements.hpp"
#include "returns.hpp"
#include <string>
#include <vector>

namespace carboncalc {

constexpr const char* SCHEMA_VERSION = "1.0.0";

// Complete output of one model run
struct ModelResult {
    std::string schema_version;
    ModelInputs inputs;

    std::vector<IncomeStatementRow> income_statements;
    std::vector<BalanceSheetRow> balance_sheets;
    std::vector<CashFlowRow> cash_flow_statements;
    std::vector<DebtScheduleRow> debt_schedule;
    std::vector<CarbonStreamRow> carbon_stream;
    std::vector<FreeCashFlowRow> free_cash_flow;
    Metrics metrics;

    // Non-fatal advisories raised while validating inputs
    std::vector<std::string> advisories;

    // Execution metrics
    double execution_time_ms;

    ModelResult();
};

// FinancialModel: validates one input set and produces the linked statements.
//
// Construction validates the inputs (throws ValidationError) and computes the
// compute-once derived series: issued credits, the revenue allocation and the
// implied purchase price. calculate() then runs the fixed pipeline
//
//   debt schedule -> income statements -> DSCR back-fill -> balance sheets
//     -> cash-flow statements (resolving balance-sheet cash) -> carbon stream
//     -> free cash flow -> metrics
//
// and returns freshly built rows on every call. The model holds no mutable state,
// so repeated calls return identical results.
class FinancialModel {
public:
    explicit FinancialModel(ModelInputs inputs, const LogContext& ctx = LogContext());

    ModelResult calculate() const;

    const ModelInputs& inputs() const { return inputs_; }
    const std::vector<double>& issued_credits() const { return issued_credits_; }
    const RevenueAllocation& revenue_allocation() const { return allocation_; }
    const ValidationReport& validation_report() const { return report_; }

private:
    ModelInputs inputs_;
    ValidationReport report_;
    std::vector<double> issued_credits_;
    RevenueAllocation allocation_;
};

// Convenience: validate and compute in one call
ModelResult run_model(const ModelInputs& inputs, const LogContext& ctx = LogContext());

} // namespace carboncalc

#endif // CARBONCALC_FINANCIAL_MODEL_HPP
