#pragma once

#include "swarm/v1/manifest.pb.h"

namespace swarm::model {

using swarm::v1::TaskStatus;

constexpr bool IsTerminal(TaskStatus status) {
  return status == swarm::v1::TASK_STATUS_COMPLETED || status == swarm::v1::TASK_STATUS_FAILED;
}

/*
  Task lifecycle:

      pending ──dispatch──▶ in_progress ──success──▶ completed
                             │    ▲  │
                             └retry┘ └──exhausted / permanent──▶ failed
      failed ──requeue──▶ pending
      in_progress ──recover──▶ pending   (startup, no lease marker)

  in_progress → in_progress is the retry edge; every other self-edge is
  rejected so an accidental double update is caught.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  switch (from) {
    case swarm::v1::TASK_STATUS_PENDING:
      return to == swarm::v1::TASK_STATUS_IN_PROGRESS;
    case swarm::v1::TASK_STATUS_IN_PROGRESS:
      return to == swarm::v1::TASK_STATUS_IN_PROGRESS || to == swarm::v1::TASK_STATUS_COMPLETED || to == swarm::v1::TASK_STATUS_FAILED ||
             to == swarm::v1::TASK_STATUS_PENDING;
    case swarm::v1::TASK_STATUS_FAILED:
      return to == swarm::v1::TASK_STATUS_PENDING;
    case swarm::v1::TASK_STATUS_COMPLETED:
    default:
      return false;
  }
}

} // namespace swarm::model
