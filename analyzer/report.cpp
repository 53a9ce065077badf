// Report rendering. The text layout mirrors the historical benchmark output so
// reports from different runs can be diffed.

#include "report.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <sstream>

namespace analyzer {

using namespace shingle_eval;

namespace {

const std::string RULE(100, '=');
const std::string THIN_RULE(100, '-');

void section(std::ostringstream& os, const std::string& title)
{
    os << "\n" << RULE << "\n" << title << "\n" << RULE << "\n";
}

std::string esc(const std::string& s)
{
    std::string o;
    o.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': o += "&amp;"; break;
        case '<': o += "&lt;"; break;
        case '>': o += "&gt;"; break;
        case '"': o += "&quot;"; break;
        case '\'': o += "&#39;"; break;
        default: o += c; break;
        }
    }
    return o;
}

std::string join_ids(const std::vector<DocumentId>& ids, size_t limit)
{
    std::string out;
    for (size_t i = 0; i < ids.size() && i < limit; ++i) {
        if (i > 0)
            out += ", ";
        out += ids[i];
    }
    return out;
}

} // namespace

bool write_json(const std::filesystem::path& path, const nlohmann::json& j)
{
    return write_text(path, j.dump(2) + "\n");
}

bool write_text(const std::filesystem::path& path, const std::string& text)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return false;
    }
    std::ofstream out(path);
    out << text;
    return out.good();
}

nlohmann::json make_results_json(
    const ResultSet& results,
    size_t candidate,
    size_t reference)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& doc : results) {
        nlohmann::json row;
        row["file"] = doc.document_id;
        for (const auto& r : doc.records) {
            row[r.source + "_f1"] = r.score.f1;
            row[r.source + "_precision"] = r.score.precision;
            row[r.source + "_recall"] = r.score.recall;
            row[r.source + "_len"] = r.prediction_length;
        }
        row["true_len"] = doc.truth_length;
        if (candidate < doc.records.size() && reference < doc.records.size()) {
            row["f1_gap"] = doc.records[reference].score.f1
                - doc.records[candidate].score.f1;
        }
        arr.push_back(std::move(row));
    }
    return arr;
}

nlohmann::json make_summary_json(const AnalysisReport& report, const RunOptions& opts)
{
    const auto& d = report.deficits;
    nlohmann::json j;
    j["candidate"] = report.candidate;
    j["reference"] = report.reference;
    j["documents"] = report.document_count;
    j["options"] = options_to_json(opts);
    j["counts"] = {
        { "f1_gap", d.f1_gap.size() },
        { "precision_deficit", d.precision_deficit.size() },
        { "recall_deficit", d.recall_deficit.size() },
        { "empty_extraction", d.empty_extraction.size() },
        { "over_extraction", d.over_extraction.size() },
    };
    j["empty_extraction"] = d.empty_extraction;
    j["boilerplate"] = nlohmann::json::array();
    for (const auto& tc : report.boilerplate) {
        j["boilerplate"].push_back({ { "token", tc.token }, { "count", tc.count } });
    }
    if (report.worst) {
        j["worst_document"] = report.worst->row.document_id;
    }
    return j;
}

std::string make_text_report(const AnalysisReport& r, const AnalysisConfig& c)
{
    std::ostringstream os;
    const auto& d = r.deficits;

    section(os, fmt::format("WORST PERFORMING FILES ({} vs {})", r.candidate, r.reference));
    os << fmt::format(
        "{:<50} {:>9} {:>9} {:>9} {:>9} {:>9}\n", "File", "Cand F1", "Ref F1",
        "Gap", "Cand Prec", "Cand Rec");
    os << THIN_RULE << "\n";
    for (const auto& row : r.f1_ranking) {
        os << fmt::format(
            "{:<50} {:>9.3f} {:>9.3f} {:>9.3f} {:>9.3f} {:>9.3f}\n",
            row.document_id, row.candidate.score.f1, row.reference.score.f1,
            row.gap, row.candidate.score.precision, row.candidate.score.recall);
    }

    section(os, "SUMMARY STATISTICS");
    os << fmt::format("Documents evaluated: {}\n", r.document_count);
    os << fmt::format("Files with F1 gap > {:g}: {}\n", c.deficit_threshold, d.f1_gap.size());
    os << fmt::format(
        "Files with precision deficit > {:g}: {}\n", c.deficit_threshold,
        d.precision_deficit.size());
    os << fmt::format(
        "Files with recall deficit > {:g}: {}\n", c.deficit_threshold,
        d.recall_deficit.size());
    os << fmt::format(
        "Files where {} extracts nothing: {}\n", r.candidate, d.empty_extraction.size());
    if (!d.empty_extraction.empty()) {
        os << "  Empty files: " << join_ids(d.empty_extraction, c.empty_listing_size)
           << "\n";
    }
    os << fmt::format(
        "Files where {} extracts >{:g}x {} length: {}\n", r.candidate,
        c.over_extraction_ratio, r.reference, d.over_extraction.size());

    section(
        os,
        fmt::format(
            "TOP {} WORST PRECISION GAPS ({} vs {})", r.precision_ranking.size(),
            r.candidate, r.reference));
    os << fmt::format(
        "{:<40} {:>9} {:>9} {:>9} {:>9} {:>9}\n", "File ID", "Cand Prec",
        "Ref Prec", "Gap", "Cand Len", "Ref Len");
    os << THIN_RULE << "\n";
    for (const auto& row : r.precision_ranking) {
        os << fmt::format(
            "{:<40} {:>9.3f} {:>9.3f} {:>9.3f} {:>9} {:>9}\n", row.document_id,
            row.candidate.score.precision, row.reference.score.precision,
            row.gap, row.candidate.prediction_length,
            row.reference.prediction_length);
    }

    section(
        os,
        fmt::format(
            "COMMON BOILERPLATE IN WORST {} PRECISION DOCS", c.boilerplate_documents));
    os << "Most common extra words:\n";
    for (const auto& tc : r.boilerplate) {
        os << fmt::format("  {}: {}\n", tc.token, tc.count);
    }

    if (r.worst) {
        const auto& w = *r.worst;
        section(os, "WORST DOC SAMPLE");
        os << fmt::format("File: {}\n", w.row.document_id);
        os << fmt::format(
            "{} Prec: {:.3f}, {} Prec: {:.3f}\n", r.candidate,
            w.row.candidate.score.precision, r.reference,
            w.row.reference.score.precision);
        os << fmt::format(
            "{}: {} words, {}: {} words, Truth: {} words\n", r.candidate,
            w.row.candidate.prediction_length, r.reference,
            w.row.reference.prediction_length, w.row.candidate.truth_length);
        os << fmt::format(
            "\n{} first {} chars:\n{}\n", r.candidate, c.excerpt_chars,
            w.candidate_excerpt);
        os << fmt::format(
            "\n{} first {} chars:\n{}\n", r.reference, c.excerpt_chars,
            w.reference_excerpt);
    }
    return os.str();
}

std::string make_html_report(const AnalysisReport& r, const AnalysisConfig& c)
{
    const auto& d = r.deficits;
    std::ostringstream os;
    os << "<!doctype html><html><head><meta charset=\"utf-8\"/>";
    os << "<title>Extraction Overlap Report</title>";
    os << "<style>body{font-family:Arial,Helvetica,sans-serif;margin:24px}table{border-collapse:collapse}th,td{border:1px solid #ddd;padding:6px 10px}th{background:#f4f4f4}pre{background:#f6f8fa;padding:8px;white-space:pre-wrap} .bad{color:#aa2222} .muted{color:#777}</style>";
    os << "</head><body>";
    os << "<h1>" << esc(r.candidate) << " vs " << esc(r.reference) << "</h1>";
    os << "<p class=\"muted\">Documents: " << r.document_count << "</p>";

    os << "<h2>Summary</h2><table>";
    auto count_row = [&](const std::string& label, size_t n) {
        os << "<tr><td>" << esc(label) << "</td><td>" << n << "</td></tr>";
    };
    count_row(fmt::format("F1 gap > {:g}", c.deficit_threshold), d.f1_gap.size());
    count_row(fmt::format("Precision deficit > {:g}", c.deficit_threshold), d.precision_deficit.size());
    count_row(fmt::format("Recall deficit > {:g}", c.deficit_threshold), d.recall_deficit.size());
    count_row("Empty extraction", d.empty_extraction.size());
    count_row(fmt::format("Over-extraction > {:g}x", c.over_extraction_ratio), d.over_extraction.size());
    os << "</table>";

    os << "<h2>Worst F1 gaps</h2>";
    os << "<table><tr><th>File</th><th>Cand F1</th><th>Ref F1</th><th>Gap</th><th>Cand Prec</th><th>Cand Rec</th></tr>";
    for (const auto& row : r.f1_ranking) {
        os << "<tr><td>" << esc(row.document_id) << "</td>";
        os << fmt::format(
            "<td>{:.3f}</td><td>{:.3f}</td><td class=\"{}\">{:.3f}</td><td>{:.3f}</td><td>{:.3f}</td></tr>",
            row.candidate.score.f1, row.reference.score.f1,
            row.gap > c.deficit_threshold ? "bad" : "", row.gap,
            row.candidate.score.precision, row.candidate.score.recall);
    }
    os << "</table>";

    os << "<h2>Worst precision gaps</h2>";
    os << "<table><tr><th>File</th><th>Cand Prec</th><th>Ref Prec</th><th>Gap</th><th>Cand Len</th><th>Ref Len</th></tr>";
    for (const auto& row : r.precision_ranking) {
        os << "<tr><td>" << esc(row.document_id) << "</td>";
        os << fmt::format(
            "<td>{:.3f}</td><td>{:.3f}</td><td>{:.3f}</td><td>{}</td><td>{}</td></tr>",
            row.candidate.score.precision, row.reference.score.precision,
            row.gap, row.candidate.prediction_length,
            row.reference.prediction_length);
    }
    os << "</table>";

    os << "<h2>Boilerplate tokens</h2><table><tr><th>Token</th><th>Count</th></tr>";
    for (const auto& tc : r.boilerplate) {
        os << "<tr><td>" << esc(tc.token) << "</td><td>" << tc.count << "</td></tr>";
    }
    os << "</table>";

    if (r.worst) {
        const auto& w = *r.worst;
        os << "<h2>Worst document: " << esc(w.row.document_id) << "</h2>";
        os << "<h3>" << esc(r.candidate) << "</h3><pre>" << esc(w.candidate_excerpt) << "</pre>";
        os << "<h3>" << esc(r.reference) << "</h3><pre>" << esc(w.reference_excerpt) << "</pre>";
    }
    os << "</body></html>";
    return os.str();
}

} // namespace analyzer
