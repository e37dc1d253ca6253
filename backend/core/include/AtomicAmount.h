#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace WalletAPI {

/**
 * @brief Arbitrary-precision non-negative integer amount in an asset's smallest unit
 *
 * Stored as a canonical decimal digit string (no sign, no leading zeros) so that amounts
 * larger than 64 bits survive unchanged. Conversion to a human-readable decimal only
 * happens through ToDecimalString()/ToFixedString() with the asset's decimals.
 */
class AtomicAmount {
public:
    AtomicAmount() : m_digits("0") {}

    static AtomicAmount Zero() { return AtomicAmount(); }
    static AtomicAmount FromUInt64(uint64_t value);

    /**
     * @brief Parse a decimal digit string ("000123" is accepted and canonicalized)
     * @return std::nullopt for empty input, signs, separators or any non-digit
     */
    static std::optional<AtomicAmount> FromString(const std::string& digits);

    const std::string& ToString() const { return m_digits; }

    /**
     * @brief Scale by 10^decimals without rounding
     *
     * Trailing fractional zeros are dropped but one fractional digit is always kept:
     * 1000000000 with 9 decimals is "1.0", 1500 with 3 decimals is "1.5".
     */
    std::string ToDecimalString(int decimals) const;

    /**
     * @brief Scale by 10^decimals and round half-up to exactly `places` fractional digits
     */
    std::string ToFixedString(int decimals, int places) const;

    bool operator==(const AtomicAmount& other) const { return m_digits == other.m_digits; }
    bool operator!=(const AtomicAmount& other) const { return m_digits != other.m_digits; }

private:
    explicit AtomicAmount(std::string digits) : m_digits(std::move(digits)) {}

    std::string m_digits;
};

} // namespace WalletAPI
