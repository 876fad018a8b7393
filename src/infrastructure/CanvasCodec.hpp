/**
 * @file CanvasCodec.hpp
 * @brief JSON Canvas serialization of a CanvasGraph.
 */

#pragma once
#include <string>
#include "domain/CanvasGraph.hpp"

namespace vaultbreakdown::infrastructure {

/**
 * @class CanvasCodec
 * @brief Writes {"nodes":[...],"edges":[...]} canvas documents.
 */
class CanvasCodec {
public:
    static std::string Encode(const domain::CanvasGraph& graph);

    static std::string ColorCode(domain::CanvasColor color);
    static std::string SideName(domain::CanvasSide side);
};

} // namespace vaultbreakdown::infrastructure
