#ifndef VOTEFEE_UNSPENT_HPP
#define VOTEFEE_UNSPENT_HPP

#include <vector>
#include <boost/optional.hpp>
#include <votefee/fee.hpp>
#include <votefee/money.hpp>
#include <votefee/transaction.hpp>

namespace votefee {

struct unspent_source
{
    input_reference reference;
    money amount;
};

bool operator==(const unspent_source& left, const unspent_source& right);

// Order is chosen by the caller and is never changed.
typedef std::vector<unspent_source> unspent_source_list;

money unspent_value(const unspent_source_list& sources);
input_reference_list unspent_references(const unspent_source_list& sources);

enum class selection_status
{
    // Nothing was taken: no sources, or the base fee was already met.
    empty,
    // The taken prefix covers the fee it incurs.
    funded,
    // Every source was taken and the fee is still not covered.
    insufficient
};

std::string to_string(selection_status status);

struct selection
{
    selection_status status;
    unspent_source_list sources;
};

// Takes sources in order until their value covers
// fee_base + taken * fee_per_input.
selection take_until_fee_paid(const fee_params& params,
    const unspent_source_list& sources);

// None when nothing was taken. An insufficient selection is still
// returned; use take_until_fee_paid to tell it apart.
boost::optional<unspent_source_list> select_unspent_sources(
    const fee_params& params, const unspent_source_list& sources);

} // namespace votefee

#endif

