#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace shingle_eval {

/// @brief Retrieves the current logger.
/// @return A reference to shingle_eval's logger object.
spdlog::logger& logger();

/// @brief Setup a logger object to be used by shingle_eval.
///
/// Calling this function with other functions running concurrently is not
/// thread-safe.
///
/// @param logger New logger object to be used by shingle_eval. Ownership is shared with shingle_eval.
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace shingle_eval
