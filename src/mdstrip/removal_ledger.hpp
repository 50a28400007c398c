#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mdstrip {

// Record of every fragment stripped during a conversion, grouped by
// category. Categories are created on first insertion and enumerated in
// first-seen order.
class removal_ledger
{
public:
    struct category
    {
        std::string _name;
        std::vector<std::string> _fragments;
    };

private:
    std::vector<category> _categories;
    std::unordered_map<std::string, std::size_t> _index_by_name;

public:
    // Fragments that are blank once trimmed are ignored.
    void log(const std::string_view category_name,
        const std::string_view fragment);

    [[nodiscard]] const std::vector<category>& categories() const noexcept;

    // Returns `nullptr` if nothing was ever logged under `category_name`.
    [[nodiscard]] const category* find(
        const std::string_view category_name) const;

    [[nodiscard]] std::size_t count(
        const std::string_view category_name) const;

    [[nodiscard]] std::size_t total_fragments() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    void clear() noexcept;
};

} // namespace mdstrip
