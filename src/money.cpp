#include <votefee/money.hpp>

#include <limits>
#include <bitcoin/system.hpp>
#include <votefee/error.hpp>

namespace votefee {

namespace bcs = bc::system;

money checked_add(money left, money right)
{
    if (left > std::numeric_limits<money>::max() - right)
        throw arithmetic_error("money overflow: " + std::to_string(left) +
            " + " + std::to_string(right));
    return left + right;
}

money checked_subtract(money left, money right)
{
    if (right > left)
        throw arithmetic_error("money underflow: " + std::to_string(left) +
            " - " + std::to_string(right));
    return left - right;
}

money checked_multiply(money left, uint64_t right)
{
    if (right != 0 && left > std::numeric_limits<money>::max() / right)
        throw arithmetic_error("money overflow: " + std::to_string(left) +
            " * " + std::to_string(right));
    return left * right;
}

std::string format_money(money amount)
{
    return bcs::encode_base10(amount, money_decimal_places);
}

} // namespace votefee

