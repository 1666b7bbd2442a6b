#pragma once

#include <string>

namespace crisisguard {

// Lower-cases ASCII letters, folds typographic apostrophes (U+2018, U+2019) to
// '\'', drops the Arabic tatweel (U+0640), and collapses runs of whitespace into
// one space with no leading or trailing blanks. Non-ASCII bytes are otherwise
// passed through untouched, so Arabic text keeps its exact spelling.
std::string NormalizeText(const std::string& text);

} // namespace crisisguard
