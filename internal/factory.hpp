#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/notify/fanout_notifier.hpp"
#include "internal/store/action_store.hpp"

namespace actions::factory {

/*
  Application

  Owns all long-lived components of the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<store::ActionStore>     store;
  std::shared_ptr<notify::FanoutNotifier> notifier;
  std::shared_ptr<dispatch::Dispatcher>   dispatcher;
};

// Zero scheduler fields fall back to the DispatcherOptions defaults.
dispatch::DispatcherOptions BuildDispatcherOptions(const runtime::config::SchedulerConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backend types.
  The dispatcher is returned stopped.
*/
Application Build(const runtime::config::RuntimeConfig& config);

} // namespace actions::factory
