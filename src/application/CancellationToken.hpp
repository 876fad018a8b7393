/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag for one unit of work.
 */

#pragma once

#include <atomic>
#include <memory>

namespace vaultbreakdown::application {

/**
 * @class CancellationToken
 * @brief Cheap to copy; all copies share the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace vaultbreakdown::application
