#include "arrow_csv_source.hpp"

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/table.h>

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::store::csv {

namespace {

using Setter = void (*)(resolver::v1::Record&, std::string);

struct ColumnBinding {
  const char* name;
  Setter      setter;
};

const std::vector<ColumnBinding>& Bindings() {
  static const std::vector<ColumnBinding> kBindings = {
      {"id", [](resolver::v1::Record& r, std::string v) { r.set_id(std::move(v)); }},
      {"source_key", [](resolver::v1::Record& r, std::string v) { r.set_source_key(std::move(v)); }},
      {"manufacturer", [](resolver::v1::Record& r, std::string v) { r.set_manufacturer_raw(std::move(v)); }},
      {"part_number", [](resolver::v1::Record& r, std::string v) { r.set_part_number_raw(std::move(v)); }},
      {"title", [](resolver::v1::Record& r, std::string v) { r.set_title(std::move(v)); }},
      {"description", [](resolver::v1::Record& r, std::string v) { r.set_description(std::move(v)); }},
      {"unspsc", [](resolver::v1::Record& r, std::string v) { r.set_unspsc(std::move(v)); }},
      {"gtin", [](resolver::v1::Record& r, std::string v) { r.set_gtin(std::move(v)); }},
  };
  return kBindings;
}

arrow::Status ApplyColumn(const arrow::ChunkedArray& column, Setter setter, std::vector<resolver::v1::Record>* records) {
  size_t row = 0;
  for (const auto& chunk : column.chunks()) {
    if (chunk->type_id() != arrow::Type::STRING) {
      return arrow::Status::TypeError("expected utf8 column, got ", chunk->type()->ToString());
    }
    const auto& strings = static_cast<const arrow::StringArray&>(*chunk);
    for (int64_t i = 0; i < strings.length(); ++i, ++row) {
      if (!strings.IsNull(i)) {
        setter((*records)[row], strings.GetString(i));
      }
    }
  }
  return arrow::Status::OK();
}

} // namespace

ArrowCsvRecordSource::ArrowCsvRecordSource(std::string path) : path_(std::move(path)) {
  auto records = ReadFile(path_);
  if (!records.ok()) {
    throw util::BackendError("csv source " + path_ + ": " + records.status().ToString());
  }
  records_ = std::move(records).ValueOrDie();

  std::stable_sort(records_.begin(), records_.end(), [](const auto& a, const auto& b) {
    return a.id() < b.id();
  });

  RESOLVER_LOG_INFO("Loaded CSV records", {observability::StringField("path", path_), observability::IntField("records", static_cast<int64_t>(records_.size()))});
}

arrow::Result<std::vector<resolver::v1::Record>> ArrowCsvRecordSource::ReadFile(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

  auto read_options    = arrow::csv::ReadOptions::Defaults();
  auto parse_options   = arrow::csv::ParseOptions::Defaults();
  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  for (const auto& binding : Bindings()) {
    convert_options.column_types[binding.name] = arrow::utf8();
  }

  ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options));
  ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());

  if (!table->GetColumnByName("id")) {
    return arrow::Status::Invalid("missing required column 'id'");
  }

  std::vector<resolver::v1::Record> records(static_cast<size_t>(table->num_rows()));
  for (const auto& binding : Bindings()) {
    auto column = table->GetColumnByName(binding.name);
    if (!column) {
      continue;
    }
    ARROW_RETURN_NOT_OK(ApplyColumn(*column, binding.setter, &records));
  }
  return records;
}

void ArrowCsvRecordSource::IterateAll(const RecordVisitor& visit) {
  for (const auto& record : records_) {
    visit(record);
  }
}

std::optional<resolver::v1::Record> ArrowCsvRecordSource::Get(const std::string& id) {
  auto it = std::lower_bound(records_.begin(), records_.end(), id, [](const auto& record, const std::string& key) {
    return record.id() < key;
  });
  if (it == records_.end() || it->id() != id) {
    return std::nullopt;
  }
  return *it;
}

} // namespace resolver::store::csv
