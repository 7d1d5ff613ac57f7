#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace timekeeper::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Opens the store backend selected by config.store, creating an empty store
  when none exists yet.
*/
std::shared_ptr<db::Repository> BuildRepository(const timekeeper::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const timekeeper::runtime::config::RuntimeConfig& config);

}
