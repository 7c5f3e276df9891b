#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/queue/order_key_sequencer.hpp"
#include "internal/queue/priority_queue_manager.hpp"
#include "internal/upload/ack_coordinator.hpp"
#include "internal/upload/timer_service.hpp"
#include "internal/upload/transport.hpp"
#include "internal/upload/upload_service.hpp"
#include "internal/window/window_presenter.hpp"
#include "internal/window/window_session_registry.hpp"

namespace voicecode::factory {

/*
  Application

  Owns all long-lived singletons of the session core.
  Everything here lives for the lifetime of the process.

  The upload members are null when Build() was given no transport.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<queue::PriorityQueueManager>  queue;
  std::shared_ptr<window::WindowSessionRegistry> windows;

  std::shared_ptr<upload::ThreadTimerService> timers;
  std::shared_ptr<upload::AckCoordinator>     acks;
  std::shared_ptr<upload::UploadService>      uploads;
};

queue::OrderKeyPolicy PolicyFromConfig(const voicecode::runtime::config::QueueConfig& config);

// Memory or sqlite, per config. Sqlite schema is bootstrapped here.
std::shared_ptr<db::Repository> BuildRepository(const voicecode::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire session core from runtime config and hydrates the
  priority queue.

  This is the composition root. It is the ONLY place allowed to know
  concrete repository and timer types.
*/
Application Build(const voicecode::runtime::config::RuntimeConfig& config, std::shared_ptr<upload::Transport> transport = nullptr,
                  std::shared_ptr<window::WindowPresenter> presenter = nullptr);

} // namespace voicecode::factory
