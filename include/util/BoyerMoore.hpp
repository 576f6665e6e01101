#pragma once

#include <array>
#include <string>
#include <string_view>

namespace turntable::util {

/**
 * Boyer-Moore-Horspool literal search over bytes.
 *
 * Used by the playlist name filter. Both sides are expected to be normalized
 * already (see normalize_for_search), so comparison is byte-exact unless
 * case_sensitive is false, in which case ASCII letters are folded.
 */
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string pattern, bool case_sensitive = true);

    /**
     * @return Position of the first match at or after start_pos, or -1.
     *         An empty pattern never matches.
     */
    int search(std::string_view text, size_t start_pos = 0) const;

    bool contains(std::string_view text) const { return search(text) >= 0; }

private:
    unsigned char fold(unsigned char c) const;

    std::array<size_t, 256> shift_{};
    std::string pattern_;
    bool case_sensitive_;
};

}  // namespace turntable::util
