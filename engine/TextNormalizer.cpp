#include "engine/TextNormalizer.hpp"

namespace crisisguard {

namespace {

bool IsAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string NormalizeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool pending_space = false;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (IsAsciiSpace(c)) {
            pending_space = !out.empty();
            ++i;
            continue;
        }

        // U+2018 / U+2019 are E2 80 98 / E2 80 99 in UTF-8
        if (c == 0xE2 && i + 2 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0x80 &&
            (static_cast<unsigned char>(text[i + 2]) == 0x98 ||
             static_cast<unsigned char>(text[i + 2]) == 0x99)) {
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back('\'');
            i += 3;
            continue;
        }

        // U+0640 ARABIC TATWEEL is D9 80
        if (c == 0xD9 && i + 1 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0x80) {
            i += 2;
            continue;
        }

        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }

        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            out.push_back(static_cast<char>(c));
        }
        ++i;
    }

    return out;
}

} // namespace crisisguard
