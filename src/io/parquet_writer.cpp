#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <memory>
#include <utility>
#include <vector>
#endif

namespace overpay {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> build_double_column(const std::vector<MonthlyRecord>& records,
                                                  double MonthlyRecord::*member,
                                                  const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(records.size())), "reserve " + name + " column");
    for (const MonthlyRecord& record : records) {
        check(builder.Append(record.*member), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_schedule(const SimulationResult& result, const std::string& filepath) {
    if (result.records.empty()) {
        throw std::runtime_error("SimulationResult has no monthly records to write");
    }

    const std::vector<std::pair<std::string, double MonthlyRecord::*>> double_columns = {
        {"mortgage_balance", &MonthlyRecord::mortgage_balance},
        {"savings_balance", &MonthlyRecord::savings_balance},
        {"cumulative_overpayments", &MonthlyRecord::cumulative_overpayments},
        {"monthly_income", &MonthlyRecord::monthly_income},
        {"monthly_expenses", &MonthlyRecord::monthly_expenses},
        {"overpayment", &MonthlyRecord::overpayment},
        {"available_cash", &MonthlyRecord::available_cash},
        {"mortgage_payment", &MonthlyRecord::mortgage_payment},
        {"interest", &MonthlyRecord::interest},
    };

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    arrow::Int32Builder month_builder;
    check(month_builder.Reserve(static_cast<int64_t>(result.records.size())), "reserve month column");
    for (const MonthlyRecord& record : result.records) {
        check(month_builder.Append(record.month), "append month");
    }
    std::shared_ptr<arrow::Array> month_array;
    check(month_builder.Finish(&month_array), "finish month array");

    fields.push_back(arrow::field("month", arrow::int32()));
    arrays.push_back(month_array);

    for (const auto& column : double_columns) {
        fields.push_back(arrow::field(column.first, arrow::float64()));
        arrays.push_back(build_double_column(result.records, column.second, column.first));
    }

    auto table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    // One row group: a schedule is at most a few hundred rows
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     static_cast<int64_t>(result.records.size())),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_schedule(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace overpay
