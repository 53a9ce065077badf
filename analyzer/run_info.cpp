#include "run_info.hpp"

#include <shingle_eval/config.hpp>

#include <tbb/info.h>
#include <unicode/uchar.h>
#include <unicode/uversion.h>

namespace analyzer {

nlohmann::json make_run_info(
    const RunInputs& inputs, int threads, const std::string& tag)
{
    nlohmann::json j;
    j["build"]["project"] = SHINGLE_EVAL_NAME;
    j["build"]["version"] = SHINGLE_EVAL_VER;
    j["build"]["type"] = SHINGLE_EVAL_BUILD_TYPE;

    // Tokenization follows the character tables of the linked ICU
    j["unicode"]["icu"] = U_ICU_VERSION;
    j["unicode"]["unicode"] = U_UNICODE_VERSION;

    j["threads"]["limit"] = threads;
    j["threads"]["tbb_default_concurrency"] = tbb::info::default_concurrency();

    j["inputs"]["truth"] = inputs.truth.string();
    j["inputs"]["sources"] = nlohmann::json::array();
    for (const auto& [name, path] : inputs.sources) {
        j["inputs"]["sources"].push_back({ { "name", name }, { "path", path.string() } });
    }

    if (!tag.empty())
        j["tag"] = tag;
    return j;
}

} // namespace analyzer
