#pragma once

// Convenience header that includes all parallel execution components

#include "parallel/job.hpp"
#include "parallel/queue.hpp"
#include "parallel/scheduler.hpp"
#include "parallel/worker.hpp"
