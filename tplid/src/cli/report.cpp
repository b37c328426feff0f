#include "report.hpp"

#include "tplid/log/log.hpp"

#include <iomanip>
#include <sstream>
#include <string_view>

namespace tplid::cli {

namespace {

void append_json_string(std::ostream& out, std::string_view text) {
    out << '"';
    log::write_json_escaped(out, text);
    out << '"';
}

auto format_score(double score) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << score;
    return oss.str();
}

} // namespace

void write_text_report(std::ostream& out, const std::vector<match::BatchResult>& results) {
    for (const auto& result : results) {
        out << "== " << result.label << " ==\n";
        if (result.matches.empty()) {
            out << "  no library matched\n";
            continue;
        }
        for (const auto& m : result.matches) {
            out << "  " << format_score(m.score) << "  " << m.library.to_string() << " ["
                << model::category_name(m.library.category) << "]  "
                << match::strategy_name(m.strategy) << "  " << m.matched_class_count << "/"
                << m.library_class_count << " classes";
            if (m.anchor) {
                out << "  at " << join_path(*m.anchor);
            }
            out << "\n";
        }
    }
}

void write_json_report(std::ostream& out, const std::vector<match::BatchResult>& results) {
    out << "[";
    bool first = true;
    for (const auto& result : results) {
        for (const auto& m : result.matches) {
            out << (first ? "\n  " : ",\n  ");
            first = false;

            out << "{\"application\": ";
            append_json_string(out, result.label);
            out << ", \"library\": ";
            append_json_string(out, m.library.name);
            out << ", \"version\": ";
            append_json_string(out, m.library.version);
            out << ", \"category\": ";
            append_json_string(out, model::category_name(m.library.category));
            out << ", \"score\": " << format_score(m.score)
                << ", \"path_agnostic\": " << format_score(m.path_agnostic_score)
                << ", \"path_aware\": " << format_score(m.path_aware_score)
                << ", \"matched_classes\": " << m.matched_class_count
                << ", \"library_classes\": " << m.library_class_count << ", \"strategy\": ";
            append_json_string(out, match::strategy_name(m.strategy));
            out << ", \"anchor\": ";
            if (m.anchor) {
                append_json_string(out, join_path(*m.anchor));
            } else {
                out << "null";
            }
            out << "}";
        }
    }
    out << (first ? "]\n" : "\n]\n");
}

} // namespace tplid::cli
