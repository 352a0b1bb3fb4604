#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/datastore/tuple_reader.hpp"
#include "internal/db/api/storage_engine.hpp"

namespace tuplestore::factory {

/*
  Application

  The storage engine and the reader built on top of it.
*/
struct Application {
  std::shared_ptr<db::StorageEngine>       engine;
  std::shared_ptr<datastore::TupleReader>  reader;
};

/*
  Build

  Composition root. It is the ONLY place allowed to know concrete
  engine types. Throws if the configured backend was not compiled in.
*/
Application Build(const tuplestore::runtime::config::RuntimeConfig& config);

} // namespace tuplestore::factory
