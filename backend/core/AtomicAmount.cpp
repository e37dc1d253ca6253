#include "AtomicAmount.h"

#include <algorithm>
#include <cctype>

namespace WalletAPI {

namespace {

std::string StripLeadingZeros(const std::string& digits) {
    size_t first_nonzero = digits.find_first_not_of('0');
    if (first_nonzero == std::string::npos) {
        return "0";
    }
    return digits.substr(first_nonzero);
}

// Adds one to a decimal digit string in place
void IncrementDigits(std::string& digits) {
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (*it != '9') {
            ++(*it);
            return;
        }
        *it = '0';
    }
    digits.insert(digits.begin(), '1');
}

// Splits into integer and exactly `decimals` fractional digits
void SplitAtDecimals(const std::string& digits, size_t decimals, std::string& integer_part,
                     std::string& fraction_part) {
    std::string padded = digits;
    if (padded.length() <= decimals) {
        padded = std::string(decimals + 1 - padded.length(), '0') + padded;
    }
    integer_part = padded.substr(0, padded.length() - decimals);
    fraction_part = padded.substr(padded.length() - decimals);
}

} // namespace

AtomicAmount AtomicAmount::FromUInt64(uint64_t value) {
    return AtomicAmount(std::to_string(value));
}

std::optional<AtomicAmount> AtomicAmount::FromString(const std::string& digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    bool all_digits = std::all_of(digits.begin(), digits.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!all_digits) {
        return std::nullopt;
    }
    return AtomicAmount(StripLeadingZeros(digits));
}

std::string AtomicAmount::ToDecimalString(int decimals) const {
    size_t scale = decimals > 0 ? static_cast<size_t>(decimals) : 0;

    std::string integer_part;
    std::string fraction_part;
    SplitAtDecimals(m_digits, scale, integer_part, fraction_part);

    size_t last_nonzero = fraction_part.find_last_not_of('0');
    if (last_nonzero == std::string::npos) {
        fraction_part = "0";
    } else {
        fraction_part.erase(last_nonzero + 1);
    }

    return integer_part + "." + fraction_part;
}

std::string AtomicAmount::ToFixedString(int decimals, int places) const {
    size_t scale = decimals > 0 ? static_cast<size_t>(decimals) : 0;
    size_t keep = places > 0 ? static_cast<size_t>(places) : 0;

    std::string integer_part;
    std::string fraction_part;
    SplitAtDecimals(m_digits, scale, integer_part, fraction_part);

    if (fraction_part.length() > keep) {
        bool round_up = fraction_part[keep] >= '5';
        std::string kept = integer_part + fraction_part.substr(0, keep);
        if (round_up) {
            IncrementDigits(kept);
        }
        integer_part = kept.substr(0, kept.length() - keep);
        fraction_part = kept.substr(kept.length() - keep);
    } else {
        fraction_part.append(keep - fraction_part.length(), '0');
    }

    if (keep == 0) {
        return integer_part;
    }
    return integer_part + "." + fraction_part;
}

} // namespace WalletAPI
