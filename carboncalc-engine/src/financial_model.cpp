#include "financial_model.hpp"
#include "credit_issuance.hpp"
#include <chrono>
#include <utility>

namespace carboncalc {

ModelResult::ModelResult()
    : schema_version(SCHEMA_VERSION), execution_time_ms(0.0) {}

FinancialModel::FinancialModel(ModelInputs inputs, const LogContext& ctx)
    : inputs_(std::move(inputs)),
      report_(validate_inputs(inputs_, ctx)),
      issued_credits_(calculate_issued_credits(inputs_.credits_generated, inputs_.issuance_flag)),
      allocation_(allocate_revenue(inputs_, issued_credits_)) {}

ModelResult FinancialModel::calculate() const {
    auto start_time = std::chrono::high_resolution_clock::now();

    ModelResult result;
    result.inputs = inputs_;
    result.advisories = report_.advisories;

    StatementBuilder builder(inputs_, issued_credits_, allocation_);

    result.debt_schedule = build_debt_schedule(inputs_);
    result.income_statements = builder.build_income_statements(result.debt_schedule);

    std::vector<double> ebitda;
    ebitda.reserve(result.income_statements.size());
    for (const IncomeStatementRow& row : result.income_statements) {
        ebitda.push_back(row.ebitda);
    }
    backfill_dscr(result.debt_schedule, ebitda);

    result.balance_sheets = builder.build_balance_sheets(result.income_statements,
                                                         result.debt_schedule);
    result.cash_flow_statements = builder.build_cash_flow_statements(
        result.income_statements, result.balance_sheets, result.debt_schedule);

    result.carbon_stream = build_carbon_stream(inputs_, allocation_);
    result.free_cash_flow = build_free_cash_flow(inputs_, result.income_statements,
                                                 result.balance_sheets, result.debt_schedule);
    result.metrics = calculate_metrics(inputs_, result.income_statements,
                                       result.cash_flow_statements, result.debt_schedule,
                                       result.carbon_stream, result.free_cash_flow);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return result;
}

ModelResult run_model(const ModelInputs& inputs, const LogContext& ctx) {
    FinancialModel model(inputs, ctx);
    return model.calculate();
}

} // namespace carboncalc
