// common/utils/id_generator.h
#ifndef AGENTGRAPH_COMMON_UTILS_ID_GENERATOR_H
#define AGENTGRAPH_COMMON_UTILS_ID_GENERATOR_H

#include <string>
#include <string_view>

namespace agentgraph {

// "<prefix>-<16 hex digits>", unique within the process and unlikely to collide across processes
std::string generate_id(std::string_view prefix);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_ID_GENERATOR_H
