#ifndef RETIRECALC_PARQUET_WRITER_HPP
#define RETIRECALC_PARQUET_WRITER_HPP

#include "../scenario.hpp"
#include <string>
#include <vector>

namespace retirecalc {

class ParquetWriter {
public:
    /**
     * Write a yearly cash-flow series to a Parquet file.
     *
     * Output schema:
     *   - year, age: int32
     *   - end_balance, total_income, total_withdrawal, rmd, total_tax,
     *     total_expenses, ltc_expenses, net_cash_flow,
     *     discretionary_multiplier: float64
     *   - guardrail_state, regime: utf8
     *
     * @param cashflows Rows in year order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the series is empty, the file cannot be
     *         written, or the build has no Arrow support
     */
    static void write_cashflows(const std::vector<YearlyCashFlow>& cashflows,
                                const std::string& filepath);

    static bool available();
};

} // namespace retirecalc

#endif // RETIRECALC_PARQUET_WRITER_HPP
