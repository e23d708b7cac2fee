#ifndef OVERPAY_IO_PARQUET_WRITER_HPP
#define OVERPAY_IO_PARQUET_WRITER_HPP

#include "../simulation.hpp"
#include <string>

namespace overpay {

class ParquetWriter {
public:
    /**
     * Write the monthly schedule of a run to a Parquet file.
     *
     * Output schema:
     *   - month: int32
     *   - mortgage_balance, savings_balance, cumulative_overpayments,
     *     monthly_income, monthly_expenses, overpayment, available_cash,
     *     mortgage_payment, interest: float64
     *
     * @param result SimulationResult with at least one record
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or when built
     *         without Apache Arrow
     */
    static void write_schedule(const SimulationResult& result, const std::string& filepath);
};

} // namespace overpay

#endif // OVERPAY_IO_PARQUET_WRITER_HPP
