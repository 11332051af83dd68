#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <functional>
#endif

namespace retirecalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> int_column(const std::vector<YearlyCashFlow>& rows,
                                         const std::function<int32_t(const YearlyCashFlow&)>& get,
                                         const std::string& name) {
    arrow::Int32Builder builder;
    check(builder.Reserve(rows.size()), "reserve " + name + " column");
    for (const auto& row : rows) {
        check(builder.Append(get(row)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

std::shared_ptr<arrow::Array> double_column(const std::vector<YearlyCashFlow>& rows,
                                            const std::function<double(const YearlyCashFlow&)>& get,
                                            const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(rows.size()), "reserve " + name + " column");
    for (const auto& row : rows) {
        check(builder.Append(get(row)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

std::shared_ptr<arrow::Array> string_column(const std::vector<YearlyCashFlow>& rows,
                                            const std::function<std::string(const YearlyCashFlow&)>& get,
                                            const std::string& name) {
    arrow::StringBuilder builder;
    check(builder.Reserve(rows.size()), "reserve " + name + " column");
    for (const auto& row : rows) {
        check(builder.Append(get(row)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_cashflows(const std::vector<YearlyCashFlow>& cashflows,
                                    const std::string& filepath) {
    if (cashflows.empty()) {
        throw std::runtime_error("No cash flows to write. Run with the representative scenario enabled.");
    }

    auto schema = arrow::schema({
        arrow::field("year", arrow::int32()),
        arrow::field("age", arrow::int32()),
        arrow::field("end_balance", arrow::float64()),
        arrow::field("total_income", arrow::float64()),
        arrow::field("total_withdrawal", arrow::float64()),
        arrow::field("rmd", arrow::float64()),
        arrow::field("total_tax", arrow::float64()),
        arrow::field("total_expenses", arrow::float64()),
        arrow::field("ltc_expenses", arrow::float64()),
        arrow::field("net_cash_flow", arrow::float64()),
        arrow::field("discretionary_multiplier", arrow::float64()),
        arrow::field("guardrail_state", arrow::utf8()),
        arrow::field("regime", arrow::utf8())
    });

    std::vector<std::shared_ptr<arrow::Array>> columns = {
        int_column(cashflows, [](const YearlyCashFlow& r) { return r.year; }, "year"),
        int_column(cashflows, [](const YearlyCashFlow& r) { return r.age; }, "age"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.end_balance; }, "end_balance"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.total_income(); }, "total_income"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.total_withdrawal(); },
                      "total_withdrawal"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.rmd; }, "rmd"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.total_tax; }, "total_tax"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.total_expenses(); },
                      "total_expenses"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.ltc_expenses; }, "ltc_expenses"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.net_cash_flow; }, "net_cash_flow"),
        double_column(cashflows, [](const YearlyCashFlow& r) { return r.discretionary_multiplier; },
                      "discretionary_multiplier"),
        string_column(cashflows,
                      [](const YearlyCashFlow& r) { return guardrail_state_to_string(r.guardrail_state); },
                      "guardrail_state"),
        string_column(cashflows, [](const YearlyCashFlow& r) { return regime_to_string(r.regime); },
                      "regime")
    };

    auto table = arrow::Table::Make(schema, columns);

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_cashflows(const std::vector<YearlyCashFlow>& /* cashflows */,
                                    const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace retirecalc
