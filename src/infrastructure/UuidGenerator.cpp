#include "infrastructure/UuidGenerator.hpp"
#include <uuid/uuid.h>

namespace vaultbreakdown::infrastructure {

std::string UuidGenerator::Generate() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

} // namespace vaultbreakdown::infrastructure
