#include "util/BoyerMoore.hpp"
#include <cctype>

namespace turntable::util {

BoyerMooreSearch::BoyerMooreSearch(std::string pattern, bool case_sensitive)
    : pattern_(std::move(pattern)),
      case_sensitive_(case_sensitive) {
    const size_t m = pattern_.size();
    shift_.fill(m);

    // Horspool: only the last occurrence of each byte (excluding the final
    // position) determines the skip
    for (size_t i = 0; i + 1 < m; ++i) {
        shift_[fold(static_cast<unsigned char>(pattern_[i]))] = m - 1 - i;
    }
}

unsigned char BoyerMooreSearch::fold(unsigned char c) const {
    return case_sensitive_ ? c : static_cast<unsigned char>(std::tolower(c));
}

int BoyerMooreSearch::search(std::string_view text, size_t start_pos) const {
    const size_t m = pattern_.size();
    const size_t n = text.size();

    if (m == 0 || m > n || start_pos > n - m) {
        return -1;
    }

    size_t i = start_pos;
    while (i <= n - m) {
        size_t j = m;
        while (j > 0 &&
               fold(static_cast<unsigned char>(text[i + j - 1])) ==
               fold(static_cast<unsigned char>(pattern_[j - 1]))) {
            --j;
        }
        if (j == 0) {
            return static_cast<int>(i);
        }

        i += shift_[fold(static_cast<unsigned char>(text[i + m - 1]))];
    }

    return -1;
}

}  // namespace turntable::util
