#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace riskcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> double_column(const std::vector<double>& values, const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(values.size())), "Failed to reserve memory for " + name + " column");
    check(builder.AppendValues(values), "Failed to append " + name);

    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "Failed to finish " + name + " array");
    return array;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_results(const SimulationResults& results, const std::string& filepath) {
    if (results.iteration_count() == 0) {
        throw std::runtime_error("SimulationResults has no iterations to write");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("iteration", arrow::uint32()),
        arrow::field("cost", arrow::float64()),
        arrow::field("schedule", arrow::float64())
    };

    arrow::UInt32Builder iteration_builder;
    check(iteration_builder.Reserve(static_cast<int64_t>(results.iteration_count())),
          "Failed to reserve memory for iteration column");
    for (size_t i = 0; i < results.iteration_count(); ++i) {
        check(iteration_builder.Append(static_cast<uint32_t>(i)), "Failed to append iteration");
    }
    std::shared_ptr<arrow::Array> iteration_array;
    check(iteration_builder.Finish(&iteration_array), "Failed to finish iteration array");

    std::vector<std::shared_ptr<arrow::Array>> columns = {
        iteration_array,
        double_column(results.cost_outcomes(), "cost"),
        double_column(results.schedule_outcomes(), "schedule")
    };

    for (const auto& series : results.risk_contributions()) {
        std::string name = "risk_" + series.risk_id;
        fields.push_back(arrow::field(name, arrow::float64()));
        columns.push_back(double_column(series.impacts, name));
    }

    auto table = arrow::Table::Make(arrow::schema(fields), columns);

    auto outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile.status().ToString());
    }

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check((*outfile)->Close(), "Failed to close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_results(const SimulationResults& /* results */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace riskcalc
