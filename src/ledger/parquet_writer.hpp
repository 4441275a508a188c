#pragma once

#include "ledger/export_table.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger_export {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

inline std::shared_ptr<arrow::DataType> arrow_type(ColumnType t) {
    switch (t) {
        case ColumnType::INT64:  return arrow::int64();
        case ColumnType::DOUBLE: return arrow::float64();
        case ColumnType::STRING: return arrow::utf8();
    }
    return arrow::utf8();
}

inline std::shared_ptr<arrow::Array> build_array(const Column& col) {
    std::shared_ptr<arrow::Array> arr;
    switch (col.type) {
        case ColumnType::INT64: {
            arrow::Int64Builder b;
            for (size_t i = 0; i < col.size(); ++i)
                check(col.valid[i] ? b.Append(col.ints[i]) : b.AppendNull(), col.name);
            check(b.Finish(&arr), col.name);
            break;
        }
        case ColumnType::DOUBLE: {
            arrow::DoubleBuilder b;
            for (size_t i = 0; i < col.size(); ++i)
                check(col.valid[i] ? b.Append(col.reals[i]) : b.AppendNull(), col.name);
            check(b.Finish(&arr), col.name);
            break;
        }
        case ColumnType::STRING: {
            arrow::StringBuilder b;
            for (size_t i = 0; i < col.size(); ++i)
                check(col.valid[i] ? b.Append(col.texts[i]) : b.AppendNull(), col.name);
            check(b.Finish(&arr), col.name);
            break;
        }
    }
    return arr;
}

// Writes the table as a single-row-group Parquet file with ZSTD compression.
inline void write_parquet(const ExportTable& t, const std::string& path) {
    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (const auto& col : t.columns) {
        fields.push_back(arrow::field(col.name, arrow_type(col.type), /*nullable=*/true));
        arrays.push_back(build_array(col));
    }
    auto schema = arrow::schema(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(t.rows()));

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok())
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(t.rows()));
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk, props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "Failed to close " + path);
}

}  // namespace ledger_export
