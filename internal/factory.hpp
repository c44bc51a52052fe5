#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/resolution_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/parser/name_parser.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace resolver::factory {

/*
  Application

  Owns every long-lived object a CLI command needs. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  config::ResolutionSettings           settings;
  std::shared_ptr<db::Repository>      repository;
  std::unique_ptr<parser::NameParser>  parser;
  std::unique_ptr<runtime::WorkerPool> workers;
};

/*
  Composition root. The ONLY place allowed to know concrete store types.

  Settings are validated first, so a broken config fails before the
  store is opened or any mention is touched.
*/
Application Build(const resolver::runtime::config::RuntimeConfig& config);

// Opens (and bootstraps) the configured store. memory when none is set.
std::shared_ptr<db::Repository> BuildRepository(const resolver::runtime::config::RuntimeConfig& config);

} // namespace resolver::factory
