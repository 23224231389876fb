#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/pipeline/resolution_engine.hpp"
#include "internal/query/golden_record_store.hpp"
#include "internal/query/query_service.hpp"
#include "internal/store/api/record_source.hpp"
#include "internal/store/api/resolution_sink.hpp"

namespace resolver::factory {

/*
  Runtime

  Everything one process needs to resolve and query. Members live as long
  as the Runtime; the engine and the query service share the store.
*/
struct Runtime {
  std::shared_ptr<store::RecordSource>        source;
  std::shared_ptr<store::ResolutionSink>      sink;
  std::shared_ptr<query::GoldenRecordStore>   golden_store;
  std::shared_ptr<pipeline::ResolutionEngine> engine;
  std::shared_ptr<query::QueryService>        query;
};

/*
  Build

  Composition root: the only place that knows concrete backend types.
  A backend compiled out of this build throws std::runtime_error.
  Relative file paths in the config resolve against base_dir.
*/
Runtime Build(const resolver::runtime::config::RuntimeConfig& config, const std::string& base_dir = {});

std::shared_ptr<store::RecordSource> BuildSource(const resolver::runtime::config::SourceConfig& config, const std::string& base_dir = {});

std::shared_ptr<store::ResolutionSink> BuildSink(const resolver::runtime::config::SinkConfig& config, const std::string& base_dir = {});

} // namespace resolver::factory
