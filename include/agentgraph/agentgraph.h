#ifndef AGENTGRAPH_AGENTGRAPH_H
#define AGENTGRAPH_AGENTGRAPH_H

// Public entry header: graph building, execution, checkpoints, delegation and config

#include "core/types/budget.h"
#include "core/types/cancellation.h"
#include "core/types/context.h"
#include "core/types/errors.h"
#include "core/types/event.h"
#include "core/types/task.h"

#include "core/engine.h"
#include "core/stream.h"
#include "modules/graph/graph_builder.h"
#include "modules/graph/conditions.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/trace/trace_exporter.h"

#include "modules/delegation/load_balancer.h"
#include "modules/delegation/task_store.h"
#include "modules/delegation/worker_pool.h"
#include "modules/delegation/supervisor.h"
#include "modules/delegation/delegation_nodes.h"

#include "common/config/engine_config.h"
#include "common/logging/logger.h"

#endif // AGENTGRAPH_AGENTGRAPH_H
