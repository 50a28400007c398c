#include "removal_ledger.hpp"

#include "text_utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mdstrip {

void removal_ledger::log(
    const std::string_view category_name, const std::string_view fragment)
{
    if (is_blank(fragment))
    {
        return;
    }

    std::string key{category_name};
    const auto it = _index_by_name.find(key);

    if (it != _index_by_name.end())
    {
        _categories[it->second]._fragments.emplace_back(fragment);
        return;
    }

    _index_by_name.emplace(key, _categories.size());
    _categories.push_back(category{
        ._name = std::move(key), ._fragments = {std::string{fragment}}});
}

const std::vector<removal_ledger::category>&
removal_ledger::categories() const noexcept
{
    return _categories;
}

const removal_ledger::category* removal_ledger::find(
    const std::string_view category_name) const
{
    const auto it = _index_by_name.find(std::string{category_name});

    if (it == _index_by_name.end())
    {
        return nullptr;
    }

    return &_categories[it->second];
}

std::size_t removal_ledger::count(const std::string_view category_name) const
{
    const category* const c = find(category_name);
    return c == nullptr ? 0 : c->_fragments.size();
}

std::size_t removal_ledger::total_fragments() const noexcept
{
    std::size_t result = 0;

    for (const category& c : _categories)
    {
        result += c._fragments.size();
    }

    return result;
}

bool removal_ledger::empty() const noexcept
{
    return _categories.empty();
}

void removal_ledger::clear() noexcept
{
    _categories.clear();
    _index_by_name.clear();
}

} // namespace mdstrip
