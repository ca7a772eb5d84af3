/**
 * @file wide_splitter.cpp
 * @brief Wide splitter implementation
 */

#include "split/wide_splitter.hpp"

#include <fstream>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "csv/csv_reader.hpp"
#include "csv/csv_writer.hpp"

namespace csvcols {

namespace {

void append_range(const Row& row, const Split& split, Row* out) {
    for (size_t i = split.first; i < split.last && i < row.size(); ++i) {
        out->push_back(row[i]);
    }
}

}  // namespace

Status WideSplitter::read_table(Row* header, Table* rows) const {
    std::ifstream in(options_.file, std::ios::binary);
    if (!in.is_open()) {
        return Status::IOError("cannot open input file: " + options_.file);
    }

    CsvReader reader(in, options_.delimiter, /*skip_comments=*/true);
    if (!reader.next(header)) {
        CSVCOLS_RETURN_IF_ERROR(reader.status());
        return Status::InvalidArgument("no header row in " + options_.file);
    }

    rows->clear();
    Row row;
    while (reader.next(&row)) {
        rows->push_back(std::move(row));
    }
    CSVCOLS_RETURN_IF_ERROR(reader.status());

    LOG_DEBUG("Read {} columns and {} rows from {} ({} comment rows skipped)",
              header->size(), rows->size(), options_.file, reader.comments_skipped());
    return Status::Ok();
}

Status WideSplitter::write_split(const Split& split, const Row& header,
                                 const Table& rows) const {
    std::ofstream out(split.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Status::IOError("cannot create output file: " + split.path.string());
    }

    CsvWriter writer(out, options_.delimiter);
    Row out_row;
    out_row.reserve(split.width() + 1);

    out_row.emplace_back();
    append_range(header, split, &out_row);
    CSVCOLS_RETURN_IF_ERROR(writer.write(out_row));

    for (const auto& row : rows) {
        out_row.clear();
        out_row.push_back(row.empty() ? std::string() : row[config::kKeyColumn]);
        append_range(row, split, &out_row);
        CSVCOLS_RETURN_IF_ERROR(writer.write(out_row));
    }
    CSVCOLS_RETURN_IF_ERROR(writer.flush());

    LOG_INFO("Wrote {} (columns {}..{}, {} rows)", split.path.string(), split.first,
             split.last - 1, rows.size());
    return Status::Ok();
}

Status WideSplitter::convert_split(const Split& split) const {
    std::string rendered;
    Status status = converter_->convert(split.path, &rendered);
    if (!status.ok()) {
        LOG_ERROR("Conversion of {} failed: {}", split.path.string(), status.to_string());
        return status;
    }

    const auto tex_path = tex_path_for(split.path);
    std::ofstream out(tex_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Status::IOError("cannot create output file: " + tex_path.string());
    }
    out << rendered;
    out.flush();
    if (!out) {
        return Status::IOError("failed to write " + tex_path.string());
    }

    LOG_INFO("Wrote {}", tex_path.string());
    return Status::Ok();
}

Status WideSplitter::run(std::vector<std::filesystem::path>* written) {
    Row header;
    Table rows;
    CSVCOLS_RETURN_IF_ERROR(read_table(&header, &rows));

    const auto splits = plan_splits(header.size(), options_.ncols, options_.file);
    if (splits.empty()) {
        LOG_WARN("{} has no columns besides the key column, nothing to split",
                 options_.file);
    }

    for (const auto& split : splits) {
        CSVCOLS_RETURN_IF_ERROR(write_split(split, header, rows));
        if (written != nullptr) {
            written->push_back(split.path);
        }
    }

    if (converter_ != nullptr) {
        for (const auto& split : splits) {
            CSVCOLS_RETURN_IF_ERROR(convert_split(split));
        }
    }
    return Status::Ok();
}

}  // namespace csvcols
