#include "utils/progress.hpp"
#include <algorithm>
#include <iomanip>

namespace utils {

void progress_bar(int completed, int total, const std::string& label,
                  int width, std::ostream& out) {
    if (total <= 0) {
        return;
    }

    width = std::max(width, 1);
    completed = std::clamp(completed, 0, total);
    double fraction = static_cast<double>(completed) / total;
    int filled = static_cast<int>(fraction * width);

    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << '\r' << label << " ["
        << std::string(filled, '#') << std::string(width - filled, '.')
        << "] " << std::fixed << std::setprecision(1) << std::setw(5) << fraction * 100.0
        << "% (" << completed << "/" << total << ")";
    out.flags(flags);
    out.precision(precision);

    if (completed == total) {
        out << '\n';
    }
    out << std::flush;
}

std::string format_with_commas(long long value) {
    std::string digits = std::to_string(value);
    if (value < 0) {
        digits.erase(0, 1);  // negating LLONG_MIN would overflow
    }
    std::string result;

    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(*it);
        ++count;
    }
    if (value < 0) {
        result.push_back('-');
    }

    std::reverse(result.begin(), result.end());
    return result;
}

} // namespace utils
