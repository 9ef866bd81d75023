#ifndef RISKCALC_PARQUET_WRITER_HPP
#define RISKCALC_PARQUET_WRITER_HPP

#include "../simulation.hpp"
#include <string>

namespace riskcalc {

class ParquetWriter {
public:
    /**
     * Write the outcome arrays of a simulation to a Parquet file.
     *
     * Output schema:
     *   - iteration: uint32 (0-indexed)
     *   - cost: float64
     *   - schedule: float64
     *   - one float64 column per risk, named "risk_<id>"
     *
     * @param results Completed simulation
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow support
     *         was not compiled in
     */
    static void write_results(const SimulationResults& results, const std::string& filepath);

    // True when built with HAVE_ARROW
    static bool available();
};

} // namespace riskcalc

#endif // RISKCALC_PARQUET_WRITER_HPP
