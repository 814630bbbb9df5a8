#pragma once

#include <string>
#include <cstdint>

namespace paycore {
namespace core {

// Money in minor units of the configured currency (cents for USD).
using Amount = int64_t;

// 15 significant digits.
static constexpr Amount MAX_AMOUNT = 999999999999999LL;
static constexpr uint32_t MAX_MINOR_DIGITS = 6;

// Parses a positive decimal such as "12", "12.5" or "12.50". Signs, exponents,
// whitespace and more than minorDigits fractional digits are rejected.
bool parseAmount(const std::string& text, uint32_t minorDigits, Amount& out);

std::string formatAmount(Amount amount, uint32_t minorDigits);

// Both fail instead of leaving [0, MAX_AMOUNT].
bool safeAdd(Amount a, Amount b, Amount& out);
bool safeSub(Amount a, Amount b, Amount& out);

}
}
