#include "infrastructure/CharRatioTokenEstimator.hpp"

#include <cmath>

namespace batchplanner::infrastructure {

CharRatioTokenEstimator::CharRatioTokenEstimator(double latinRatio, double cjkRatio)
    : m_latinRatio(latinRatio), m_cjkRatio(cjkRatio) {}

long long CharRatioTokenEstimator::estimate(const std::string& text) const {
    if (text.empty()) return 0;
    double ratio = ContainsCjk(text) ? m_cjkRatio : m_latinRatio;
    return static_cast<long long>(std::ceil(static_cast<double>(CountCodePoints(text)) * ratio));
}

bool CharRatioTokenEstimator::ContainsCjk(const std::string& text) {
    // U+4E00..U+9FFF encodes as three bytes with a lead byte of 0xE4..0xE9.
    for (size_t i = 0; i + 2 < text.size(); ++i) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead >= 0xE4 && lead <= 0xE9) {
            unsigned char b1 = static_cast<unsigned char>(text[i + 1]);
            unsigned char b2 = static_cast<unsigned char>(text[i + 2]);
            if ((b1 & 0xC0) == 0x80 && (b2 & 0xC0) == 0x80) {
                if (lead == 0xE4 && b1 < 0xB8) continue; // below U+4E00
                return true;
            }
        }
    }
    return false;
}

long long CharRatioTokenEstimator::CountCodePoints(const std::string& text) {
    long long count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace batchplanner::infrastructure
