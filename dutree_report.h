// dutree_report.h - Text report for a resolved size tree
#ifndef DUTREE_REPORT_H
#define DUTREE_REPORT_H

#include "dutree_core.h"

#include <ostream>
#include <string>

constexpr int SIZE_COLUMN_WIDTH = 10;

// Share of whole in percent; 0 when whole is 0
double format_percent(uintmax_t part, uintmax_t whole);

std::string format_report_line(const Entry& entry, uintmax_t parent_size, int depth,
                               const Config& config, bool use_colors = false);

// Pre-order walk, one line per entry. The root is its own parent.
void print_report(const Entry& root, const Config& config, std::ostream& out = std::cout,
                  bool use_colors = false);

#endif // DUTREE_REPORT_H
