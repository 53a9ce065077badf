// shingle_eval analyzer
// - 读取真值与两个（或更多）抽取器的输出
// - 逐文档计算 n-gram shingle 重叠（precision / recall / F1）
// - 排序、归类差距、统计样板词
// - 输出文本报告 + JSON 结果 + HTML 报告

#include "io.hpp"
#include "options_file.hpp"
#include "report.hpp"
#include "run_info.hpp"

#include <shingle_eval/analysis/aggregator.hpp>
#include <shingle_eval/scoring/evaluator.hpp>
#include <shingle_eval/utils/logger.hpp>
#include <shingle_eval/utils/timer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <tbb/global_control.h>
#include <tbb/info.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using nlohmann::json;
using shingle_eval::logger;

struct SourceArg {
    std::string name;
    fs::path path;
};

static void usage(const char* argv0)
{
    std::cout << "用法: " << argv0 << " [--truth FILE] [--pred NAME=FILE]... [--benchmark DIR]\n";
    std::cout << "                 [--field NAME] [--ngram N] [--mode multiset|set]\n";
    std::cout << "                 [--tokenizer word|whitespace] [--config FILE]\n";
    std::cout << "                 [--out DIR] [--log N] [--threads N] [--tag NAME] [--no-html]\n";
    std::cout << "说明: 第一个 --pred 为待检查的抽取器，第二个为参照抽取器。\n";
    std::cout << "      未给出路径时读取 SHINGLE_EVAL_BENCHMARK_DIR 下的 ground-truth.json 与 output/*.json。\n";
}

static bool parse_count(const std::string& s, size_t& out)
{
    try {
        size_t pos = 0;
        const long long v = std::stoll(s, &pos);
        if (pos != s.size() || v < 0)
            return false;
        out = static_cast<size_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// NAME=FILE；没有 NAME 时使用文件名（去掉扩展名）
static SourceArg parse_source_arg(const std::string& arg)
{
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
        fs::path p(arg);
        return { p.stem().string(), p };
    }
    return { arg.substr(0, eq), fs::path(arg.substr(eq + 1)) };
}

int main(int argc, char** argv)
{
    fs::path out_dir = fs::path("build") / "shingle_eval_report";
    int log_level = spdlog::level::info;
    int num_threads = tbb::info::default_concurrency();
    std::string truth_cli;
    std::string benchmark_cli;
    std::string config_path;
    std::string env_tag;
    bool write_html = true;
    std::vector<SourceArg> sources;

    // 命令行覆盖项，在配置文件之后应用
    std::optional<std::string> field_cli, mode_cli, tokenizer_cli;
    std::optional<size_t> ngram_cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--truth" && i + 1 < argc) {
            truth_cli = argv[++i];
        } else if (arg == "--pred" && i + 1 < argc) {
            sources.push_back(parse_source_arg(argv[++i]));
        } else if (arg == "--benchmark" && i + 1 < argc) {
            benchmark_cli = argv[++i];
        } else if (arg == "--field" && i + 1 < argc) {
            field_cli = argv[++i];
        } else if (arg == "--ngram" && i + 1 < argc) {
            size_t n = 0;
            if (!parse_count(argv[++i], n) || n == 0) {
                logger().error("--ngram 需要正整数: {}", argv[i]);
                return 1;
            }
            ngram_cli = n;
        } else if (arg == "--mode" && i + 1 < argc) {
            mode_cli = argv[++i];
        } else if (arg == "--tokenizer" && i + 1 < argc) {
            tokenizer_cli = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = fs::path(argv[++i]);
        } else if (arg == "--log" && i + 1 < argc) {
            log_level = std::atoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            num_threads = std::atoi(argv[++i]);
            if (num_threads <= 0) num_threads = tbb::info::default_concurrency();
        } else if (arg == "--tag" && i + 1 < argc) {
            env_tag = argv[++i];
        } else if (arg == "--no-html") {
            write_html = false;
        } else {
            logger().warn("忽略未知参数: {}", arg);
        }
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(log_level));
    logger().set_level(static_cast<spdlog::level::level_enum>(log_level));

    tbb::global_control thread_limiter(
        tbb::global_control::max_allowed_parallelism, num_threads);

    // 参数优先级：默认值 < 配置文件 < 命令行
    analyzer::RunOptions opts;
    if (!config_path.empty() && !analyzer::load_options_file(config_path, opts)) {
        return 1;
    }
    if (field_cli) opts.text_field = *field_cli;
    if (ngram_cli) opts.eval.ngram_size = *ngram_cli;
    if (mode_cli && !analyzer::parse_overlap_mode(*mode_cli, opts.eval.overlap_mode)) {
        logger().error("未知 --mode: {}", *mode_cli);
        return 1;
    }
    if (tokenizer_cli && !analyzer::parse_tokenizer_mode(*tokenizer_cli, opts.eval.tokenizer_mode)) {
        logger().error("未知 --tokenizer: {}", *tokenizer_cli);
        return 1;
    }

    // 数据目录：优先命令行 --benchmark ；否则环境变量；否则默认相对路径
    fs::path bench = fs::path("benchmarks") / "article-extraction-benchmark";
    if (!benchmark_cli.empty()) {
        bench = fs::path(benchmark_cli);
    } else {
        const char* env_p = std::getenv("SHINGLE_EVAL_BENCHMARK_DIR");
        if (env_p && *env_p) bench = fs::path(env_p);
    }
    const fs::path truth_path = truth_cli.empty() ? bench / "ground-truth.json" : fs::path(truth_cli);
    if (sources.empty()) {
        sources.push_back({ "rs_trafilatura", bench / "output" / "rs_trafilatura.json" });
        sources.push_back({ "go_trafilatura", bench / "output" / "go_trafilatura.json" });
    }
    if (sources.size() < 2) {
        logger().error("至少需要两个 --pred（待检查 + 参照），当前: {}", sources.size());
        return 1;
    }

    shingle_eval::Corpus corpus;
    if (!analyzer::load_collection(truth_path, opts.text_field, corpus.truth)) {
        return 1;
    }
    for (const auto& s : sources) {
        shingle_eval::PredictionSource src;
        if (!analyzer::load_prediction_source(s.name, s.path, opts.text_field, src)) {
            return 1;
        }
        corpus.sources.push_back(std::move(src));
    }

    constexpr size_t candidate = 0;
    constexpr size_t reference = 1;

    shingle_eval::Timer t;
    t.start();
    const auto results = shingle_eval::evaluate_corpus(corpus, opts.eval);
    t.stop();
    logger().info(
        "评估 {} 篇文档（n={}, {}, {}）用时 {:.3f} ms", results.size(),
        opts.eval.ngram_size, analyzer::to_string(opts.eval.overlap_mode),
        analyzer::to_string(opts.eval.tokenizer_mode), t.getElapsedTimeInMilliSec());

    t.start();
    const auto report = shingle_eval::summarize(
        results, corpus, candidate, reference, opts.eval, opts.analysis);
    t.stop();
    logger().debug("分析用时 {:.3f} ms", t.getElapsedTimeInMilliSec());

    std::cout << analyzer::make_text_report(report, opts.analysis);

    // 写出结果
    json summary = analyzer::make_summary_json(report, opts);
    analyzer::RunInputs inputs;
    inputs.truth = truth_path;
    for (const auto& s : sources) {
        inputs.sources.emplace_back(s.name, s.path);
    }
    summary["run"] = analyzer::make_run_info(inputs, num_threads, env_tag);

    const auto results_path = out_dir / "comparison_results.json";
    bool ok = analyzer::write_json(results_path, analyzer::make_results_json(results, candidate, reference));
    ok = analyzer::write_json(out_dir / "summary.json", summary) && ok;
    if (write_html) {
        ok = analyzer::write_text(out_dir / "report.html", analyzer::make_html_report(report, opts.analysis)) && ok;
    }
    if (!ok) {
        logger().error("写出报告失败: {}", out_dir.string());
        return 1;
    }

    std::cout << "\nDetailed results saved to: " << results_path.string() << "\n";
    return 0;
}
