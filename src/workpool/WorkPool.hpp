#pragma once

#include "core/Error.hpp"
#include "core/PoolConfig.hpp"
#include "core/PoolConfigJson.hpp"
#include "core/PoolEvent.hpp"
#include "core/PoolState.hpp"

#include "task/CancellationToken.hpp"
#include "task/Executor.hpp"
#include "task/Task.hpp"
#include "task/TaskHandle.hpp"

#include "pool/RejectionPolicy.hpp"
#include "pool/TaskPool.hpp"
#include "pool/WorkerFactory.hpp"

#include "schedule/ScheduleHandle.hpp"

#include "forkjoin/ForkJoinPool.hpp"
#include "forkjoin/ForkJoinTask.hpp"
#include "forkjoin/RangeTask.hpp"

#include "log/TaggedLogger.hpp"
