#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/warehouse_controller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/repository_collaborators.hpp"

namespace warehouse::factory {

/*
  Application

  Owns every long-lived object for one run.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<db::RepositoryCollaborators> collaborators;
  std::shared_ptr<core::WarehouseController>   controller;
};

/*
  BuildRepository

  Picks the backend named in config.database and applies its schema.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const warehouse::runtime::config::RuntimeConfig& config);

// Clears bins if asked, then inserts seed bins that are not stored yet.
void SeedBins(db::Repository& repository, const warehouse::runtime::config::BootstrapConfig& bootstrap);

/*
  Build

  Composition root: repository -> bootstrap -> controller -> inventory load.
*/
Application Build(const warehouse::runtime::config::RuntimeConfig& config);

} // namespace warehouse::factory
