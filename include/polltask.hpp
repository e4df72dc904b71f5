#pragma once

#include "polltask/poll.hpp"
#include "polltask/error.hpp"
#include "polltask/logger.hpp"
#include "polltask/deferred_timer_task.hpp"
#include "polltask/executor.hpp"
#include "polltask/combinators.hpp"
#include "polltask/work.hpp"
