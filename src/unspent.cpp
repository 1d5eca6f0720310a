#include <votefee/unspent.hpp>

namespace votefee {

bool operator==(const unspent_source& left, const unspent_source& right)
{
    return left.reference == right.reference && left.amount == right.amount;
}

money unspent_value(const unspent_source_list& sources)
{
    money total = 0;
    for (const auto& source: sources)
        total = checked_add(total, source.amount);
    return total;
}

input_reference_list unspent_references(const unspent_source_list& sources)
{
    input_reference_list references;
    references.reserve(sources.size());
    for (const auto& source: sources)
        references.push_back(source.reference);
    return references;
}

std::string to_string(selection_status status)
{
    switch (status)
    {
        case selection_status::empty:
            return "empty";
        case selection_status::funded:
            return "funded";
        case selection_status::insufficient:
            return "insufficient";
    }
    return "unknown";
}

selection take_until_fee_paid(const fee_params& params,
    const unspent_source_list& sources)
{
    selection result{ selection_status::empty, {} };

    money accumulated = 0;
    money target = params.fee_base;
    auto next = sources.begin();
    while (accumulated < target && next != sources.end())
    {
        accumulated = checked_add(accumulated, next->amount);
        target = checked_add(target, params.fee_per_input);
        result.sources.push_back(*next);
        ++next;
    }

    if (result.sources.empty())
        result.status = selection_status::empty;
    else if (accumulated >= target)
        result.status = selection_status::funded;
    else
        result.status = selection_status::insufficient;
    return result;
}

boost::optional<unspent_source_list> select_unspent_sources(
    const fee_params& params, const unspent_source_list& sources)
{
    auto result = take_until_fee_paid(params, sources);
    if (result.status == selection_status::empty)
        return boost::none;
    return result.sources;
}

} // namespace votefee

