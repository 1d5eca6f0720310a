#ifndef VOTEFEE_MONEY_HPP
#define VOTEFEE_MONEY_HPP

#include <cstdint>
#include <string>

namespace votefee {

// Amount in lovelace.
typedef uint64_t money;

constexpr uint8_t money_decimal_places = 6;

money checked_add(money left, money right);
money checked_subtract(money left, money right);
money checked_multiply(money left, uint64_t right);

std::string format_money(money amount);

} // namespace votefee

#endif

