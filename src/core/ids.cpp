#include "ids.hpp"

#include <atomic>
#include <charconv>

namespace termdeck::ids
{

static std::atomic<uint64_t> s_next_id{1};

std::string next(std::string_view prefix)
{
    uint64_t n = s_next_id.fetch_add(1, std::memory_order_relaxed);
    std::string id(prefix);
    id += '-';
    id += std::to_string(n);
    return id;
}

void reserve(std::string_view id)
{
    auto dash = id.rfind('-');
    if (dash == std::string_view::npos || dash + 1 >= id.size())
        return;

    uint64_t    n     = 0;
    const char* first = id.data() + dash + 1;
    const char* last  = id.data() + id.size();
    auto [ptr, ec]    = std::from_chars(first, last, n);
    if (ec != std::errc{} || ptr != last)
        return;

    uint64_t current = s_next_id.load(std::memory_order_relaxed);
    while (current <= n
           && !s_next_id.compare_exchange_weak(current, n + 1, std::memory_order_relaxed))
    {
    }
}

uint64_t peek_counter()
{
    return s_next_id.load(std::memory_order_relaxed);
}

}   // namespace termdeck::ids
