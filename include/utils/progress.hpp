#pragma once

#include <iostream>
#include <string>

namespace utils {

// Redraws a single-line bar: "label [#####.....]  50.0% (5/10)".
// The line is terminated once completed reaches total.
void progress_bar(int completed, int total, const std::string& label,
                  int width = 40, std::ostream& out = std::cout);

std::string format_with_commas(long long value);

} // namespace utils
