#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/pricing.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/provider/provider_registry.hpp"
#include "internal/service/service_context.hpp"

namespace ragturn::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<provider::ProviderRegistry> providers;
  service::ServiceContext                     context;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  Vendor clients are registered on Application::providers by the caller.
*/
Application Build(const ragturn::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const ragturn::runtime::config::RuntimeConfig& config);

// config.models when present, else the presets.
std::vector<catalog::ModelSpec> StaticModels(const ragturn::runtime::config::RuntimeConfig& config);

} // namespace ragturn::factory
