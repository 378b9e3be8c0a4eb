// dutree_report.cpp - Report printing implementation
#include "dutree_report.h"

#include <iomanip>
#include <sstream>

namespace {

void print_entry(const Entry& entry, uintmax_t parent_size, int depth,
                 const Config& config, std::ostream& out, bool use_colors) {
    out << format_report_line(entry, parent_size, depth, config, use_colors) << "\n";

    if (const DirectoryEntry* dir = entry.as_directory()) {
        for (const auto& child : dir->children()) {
            print_entry(child, dir->size(), depth + 1, config, out, use_colors);
        }
    }
}

} // namespace

double format_percent(uintmax_t part, uintmax_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

std::string format_report_line(const Entry& entry, uintmax_t parent_size, int depth,
                               const Config& config, bool use_colors) {
    const bool is_directory = entry.kind() == EntryKind::Directory;
    std::ostringstream line;

    if (use_colors && is_directory) {
        line << BLUE << BOLD;
    }
    line << (is_directory ? "FOLDER" : "FILE  ");
    if (use_colors && is_directory) {
        line << RESET;
    }

    line << " " << std::setw(SIZE_COLUMN_WIDTH) << std::right
         << format_size(entry.size(), config.format);
    line << " [" << std::fixed << std::setprecision(2)
         << format_percent(entry.size(), parent_size) << "%] ";

    for (int i = 0; i < depth; ++i) {
        line << "->";
    }
    if (depth > 0) {
        line << " ";
    }

    line << shorten_path(entry.path().string());
    return line.str();
}

void print_report(const Entry& root, const Config& config, std::ostream& out, bool use_colors) {
    print_entry(root, root.size(), 0, config, out, use_colors);
    out << std::flush;
}
