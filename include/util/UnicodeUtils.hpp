#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>

namespace turntable::util {

/// Fold text for case-insensitive, accent-insensitive matching.
/// "Björk - Jóga.FLAC" -> "bjork - joga.flac"
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // Decompose, drop combining marks, recompose, then map remaining Latin
    // letters to ASCII. Built once: createInstance parses the rule string.
    static const std::unique_ptr<icu::Transliterator> trans = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Transliterator> t(
            icu::Transliterator::createInstance(
                "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
                UTRANS_FORWARD,
                status
            )
        );
        if (U_FAILURE(status)) t.reset();
        return t;
    }();

    if (trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.foldCase().toUTF8String(result);
    return result;
}

}  // namespace turntable::util
