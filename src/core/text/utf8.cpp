#include "core/text/utf8.hpp"

#include <cstddef>

namespace shellserver::core::text {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";  // U+FFFD

struct LeadInfo {
    std::size_t length = 0;
    unsigned char second_lo = 0x80;
    unsigned char second_hi = 0xBF;
};

// Well-formed byte sequences per Unicode table 3-7.
LeadInfo classify_lead(const unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) {
        return {2, 0x80, 0xBF};
    }
    if (lead == 0xE0) {
        return {3, 0xA0, 0xBF};
    }
    if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        return {3, 0x80, 0xBF};
    }
    if (lead == 0xED) {
        return {3, 0x80, 0x9F};
    }
    if (lead == 0xF0) {
        return {4, 0x90, 0xBF};
    }
    if (lead >= 0xF1 && lead <= 0xF3) {
        return {4, 0x80, 0xBF};
    }
    if (lead == 0xF4) {
        return {4, 0x80, 0x8F};
    }
    return {};
}

}  // namespace

std::string sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        const LeadInfo info = classify_lead(lead);
        if (info.length == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        // Replace the maximal well-formed prefix with a single U+FFFD.
        std::size_t consumed = 1;
        bool complete = true;
        while (consumed < info.length) {
            if (i + consumed >= bytes.size()) {
                complete = false;
                break;
            }
            const auto next = static_cast<unsigned char>(bytes[i + consumed]);
            const unsigned char lo = consumed == 1 ? info.second_lo : 0x80;
            const unsigned char hi = consumed == 1 ? info.second_hi : 0xBF;
            if (next < lo || next > hi) {
                complete = false;
                break;
            }
            ++consumed;
        }

        if (complete) {
            out.append(bytes, i, info.length);
        } else {
            out += kReplacement;
        }
        i += consumed;
    }
    return out;
}

}  // namespace shellserver::core::text
