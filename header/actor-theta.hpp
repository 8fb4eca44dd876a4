#pragma once

// clang-format off
#include <actor-theta/config.hpp>
#include <actor-theta/errors.hpp>
#include <actor-theta/log.hpp>
#include <actor-theta/options.hpp>
#include <actor-theta/inbox.hpp>
#include <actor-theta/actor_ref.hpp>
#include <actor-theta/supervisor.hpp>
#include <actor-theta/behavior.hpp>
#include <actor-theta/context.hpp>
#include <actor-theta/runtime.hpp>
// clang-format on
