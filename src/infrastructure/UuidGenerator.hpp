/**
 * @file UuidGenerator.hpp
 * @brief Random (version 4) UUIDs via libuuid.
 */

#pragma once
#include <string>

namespace vaultbreakdown::infrastructure {

class UuidGenerator {
public:
    /** @brief Lower-case canonical form, e.g. "3f2b...-...". */
    static std::string Generate();
};

} // namespace vaultbreakdown::infrastructure
