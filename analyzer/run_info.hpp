// Metadata describing one analyzer run, stored in summary.json.
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace analyzer {

struct RunInputs {
    std::filesystem::path truth;
    /// (source name, prediction file), candidate first
    std::vector<std::pair<std::string, std::filesystem::path>> sources;
};

/// @brief Build info, Unicode data version, thread settings and inputs.
/// @param threads Parallelism the run was limited to.
/// @param tag Free-form label; omitted when empty.
nlohmann::json make_run_info(
    const RunInputs& inputs, int threads, const std::string& tag);

} // namespace analyzer
