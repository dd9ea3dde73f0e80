#include "utils.h"
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace {

double percent(uint64_t part, uint64_t whole)
{
    if (whole == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

std::string json_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (static_cast<unsigned char>(c) < 0x20) {
            std::ostringstream hex;
            hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
            out += hex.str();
        } else {
            out += c;
        }
    }
    return out;
}

void write_array(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::trunc);
    out << content;
    if (!out) {
        throw std::runtime_error("Failed to write results file '" + path + "'");
    }
}

} // namespace

void fill_summary(LoadSummary& summary, const CounterSnapshot& snap, double elapsed_sec)
{
    summary.total = snap.total;
    summary.success = snap.success;
    summary.fail = snap.fail;
    summary.success_percent = percent(snap.success, snap.total);
    summary.fail_percent = percent(snap.fail, snap.total);
    summary.elapsed_sec = elapsed_sec;
    summary.avg_rate = elapsed_sec > 0 ? static_cast<double>(snap.total) / elapsed_sec : 0.0;
}

void print_summary(std::ostream& out, const LoadSummary& s)
{
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << "\n\n--- Final Results ---\n"
        << std::fixed << std::setprecision(1)
        << "Total requests:    " << s.total << "\n"
        << "Successful:        " << s.success << " (" << s.success_percent << "%)\n"
        << "Failed:            " << s.fail << " (" << s.fail_percent << "%)\n"
        << std::setprecision(2)
        << "Total time:        " << s.elapsed_sec << " seconds\n"
        << "Average rate:      " << s.avg_rate << " requests/second\n";

    if (s.detailed) {
        out << "\n--- Successful Responses by Code ---\n";
        for (const auto& kv : s.status_counts) {
            out << "HTTP " << kv.first << ":          " << kv.second << "\n";
        }
        out << "Dropped events:    " << s.dropped_events << "\n";
    }
    if (s.abandoned_workers > 0) {
        out << "Abandoned workers: " << s.abandoned_workers << "\n";
    }
    out << std::flush;

    out.flags(flags);
    out.precision(precision);
}

// Append a LoadSummary as a JSON object to a results file that contains a JSON array.
// If the file doesn't exist, it will be created with a single-element array.
void append_result_to_file(const LoadSummary& r, const std::string& path) {
    // Build JSON object string
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "{"
       << "\"target\": \"" << json_escape(r.target) << "\", "
       << "\"workers\": " << r.workers << ", "
       << "\"total\": " << r.total << ", "
       << "\"success\": " << r.success << ", "
       << "\"fail\": " << r.fail << ", "
       << "\"success_percent\": " << r.success_percent << ", "
       << "\"elapsed_sec\": " << r.elapsed_sec << ", "
       << "\"avg_rate\": " << r.avg_rate;
    if (r.detailed) {
        ss << ", \"status_counts\": {";
        bool first = true;
        for (const auto& kv : r.status_counts) {
            if (!first) ss << ", ";
            ss << "\"" << kv.first << "\": " << kv.second;
            first = false;
        }
        ss << "}, \"dropped_events\": " << r.dropped_events;
    }
    ss << "}";

    std::string obj = ss.str();

    // Read existing file (if any)
    std::ifstream in(path);
    if (!in.good()) {
        // Create new file with array
        write_array(path, "[" + obj + "]\n");
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    // Trim trailing whitespace
    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    // If content doesn't start with '[' assume it's invalid and overwrite
    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    if (first_non_ws == std::string::npos || content[first_non_ws] != '[' || content.back() != ']') {
        write_array(path, "[" + obj + "]\n");
        return;
    }

    size_t last_bracket = content.size() - 1;

    // Determine if array is empty (i.e., [  ] or [])
    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }

    if (array_empty) {
        write_array(path, "[" + obj + "]\n");
    } else {
        // Insert comma separator
        write_array(path, content.substr(0, last_bracket) + ",\n" + obj + "]\n");
    }
}
