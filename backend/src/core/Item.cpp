#include "Item.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

Item::Item(std::uint64_t i, const std::string& q, const std::string& a,
           const std::string& d, std::time_t created_at)
    : id(i), question(q), answer(a), deck(d)
{
    step = 0;
    due_at = created_at; // step 0 waits 0 seconds
    spdlog::debug("Created Item: ID={}, deck={}, question={}", id, deck, question);
}

std::string Item::recentHistory(std::size_t n) const {
    std::string out;
    out.reserve(n);
    std::size_t take = std::min(n, history.size());
    out.assign(history.rbegin(), history.rbegin() + static_cast<std::ptrdiff_t>(take));
    out.append(n - take, '-');
    return out;
}
