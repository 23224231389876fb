#pragma once

#include <functional>
#include <optional>
#include <string>

#include "resolver/v1/types.pb.h"

namespace resolver::store {

using RecordVisitor = std::function<void(const resolver::v1::Record&)>;

/*
  Ingestion boundary.

  Records are owned by the source and never mutated by the engine.
  I/O failures throw util::BackendError; a missing id is std::nullopt.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Visits every record once, in ascending id order.
  virtual void IterateAll(const RecordVisitor& visit) = 0;

  virtual std::optional<resolver::v1::Record> Get(const std::string& id) = 0;

  // Short backend label for logs ("memory", "sqlite:/path", ...).
  virtual std::string Describe() const = 0;
};

} // namespace resolver::store
