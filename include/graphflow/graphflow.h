// graphflow/graphflow.h
#ifndef GRAPHFLOW_GRAPHFLOW_H
#define GRAPHFLOW_GRAPHFLOW_H

#include "graphflow/agents/chat_model.h"
#include "graphflow/agents/message.h"
#include "graphflow/agents/prebuilt.h"
#include "graphflow/agents/tool_node.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include "graphflow/common/types.h"
#include "graphflow/common/utils.h"
#include "graphflow/core/command.h"
#include "graphflow/core/compiled_graph.h"
#include "graphflow/core/node.h"
#include "graphflow/core/state.h"
#include "graphflow/core/state_graph.h"
#include "graphflow/core/subgraph_node.h"
#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/checkpoint/file_checkpointer.h"
#include "graphflow/checkpoint/memory_checkpointer.h"
#include "graphflow/config/engine_config.h"
#include "graphflow/engine/graph_result.h"
#include "graphflow/engine/graph_stream.h"
#include "graphflow/tools/registry.h"

#endif // GRAPHFLOW_GRAPHFLOW_H
