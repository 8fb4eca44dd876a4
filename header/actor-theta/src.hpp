#pragma once

// clang-format off
#include <actor-theta.hpp>

#include <actor-theta/impl/errors.ipp>
#include <actor-theta/impl/log.ipp>
#include <actor-theta/impl/supervisor.ipp>

#include <actor-theta/impl/scheduler/timer_wheel.ipp>
#include <actor-theta/impl/scheduler/reactor.ipp>
#include <actor-theta/impl/scheduler/worker.ipp>
#include <actor-theta/impl/scheduler/scheduler.ipp>

#include <actor-theta/impl/context.ipp>
#include <actor-theta/impl/runtime.ipp>
// clang-format on
