#include "core/money.h"
#include <cctype>

namespace paycore {
namespace core {

bool parseAmount(const std::string& text, uint32_t minorDigits, Amount& out) {
    if (text.empty() || minorDigits > MAX_MINOR_DIGITS) return false;

    size_t dot = text.find('.');
    std::string whole = dot == std::string::npos ? text : text.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (whole.empty()) return false;
    if (dot != std::string::npos && frac.empty()) return false;
    if (frac.size() > minorDigits) return false;

    for (unsigned char c : whole) {
        if (!std::isdigit(c)) return false;
    }
    for (unsigned char c : frac) {
        if (!std::isdigit(c)) return false;
    }

    Amount value = 0;
    for (char c : whole) {
        value = value * 10 + (c - '0');
        if (value > MAX_AMOUNT) return false;
    }
    for (uint32_t i = 0; i < minorDigits; i++) {
        int digit = i < frac.size() ? frac[i] - '0' : 0;
        value = value * 10 + digit;
        if (value > MAX_AMOUNT) return false;
    }

    if (value <= 0) return false;
    out = value;
    return true;
}

std::string formatAmount(Amount amount, uint32_t minorDigits) {
    bool negative = amount < 0;
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(amount + 1)) + 1 : static_cast<uint64_t>(amount);

    std::string digits = std::to_string(magnitude);
    if (minorDigits > 0) {
        if (digits.size() <= minorDigits) {
            digits.insert(0, minorDigits - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - minorDigits, ".");
    }
    return negative ? "-" + digits : digits;
}

bool safeAdd(Amount a, Amount b, Amount& out) {
    if (a < 0 || b < 0) return false;
    if (a > MAX_AMOUNT - b) return false;
    out = a + b;
    return true;
}

bool safeSub(Amount a, Amount b, Amount& out) {
    if (a < 0 || b < 0) return false;
    if (b > a) return false;
    out = a - b;
    return true;
}

}
}
