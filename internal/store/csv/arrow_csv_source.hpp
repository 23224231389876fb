#pragma once

#include <arrow/result.h>

#include <string>
#include <vector>

#include "internal/store/api/record_source.hpp"

namespace resolver::store::csv {

/*
  ArrowCsvRecordSource

  Reads a header-first CSV file with the Arrow CSV reader. Recognized
  columns: id (required), source_key, manufacturer, part_number, title,
  description, unspsc, gtin. Every column is read as utf8 so codes keep
  their leading zeros; unknown columns are ignored.

  The file is read once at construction. Rows are kept in id order,
  duplicates included, so the engine can reject them.
*/
class ArrowCsvRecordSource final : public RecordSource {
 public:
  explicit ArrowCsvRecordSource(std::string path);

  void IterateAll(const RecordVisitor& visit) override;
  std::optional<resolver::v1::Record> Get(const std::string& id) override;
  std::string Describe() const override {
    return "csv:" + path_;
  }

  size_t Size() const {
    return records_.size();
  }

 private:
  static arrow::Result<std::vector<resolver::v1::Record>> ReadFile(const std::string& path);

  std::string                       path_;
  std::vector<resolver::v1::Record> records_;
};

} // namespace resolver::store::csv
