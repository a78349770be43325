#ifndef CODCTL_CATEGORY_HPP
#define CODCTL_CATEGORY_HPP

#include <array>
#include <optional>
#include <string_view>

namespace codctl {

/**
 * Kind of a state update published by the player daemon. Each category is an independent,
 * internally ordered stream; the category name doubles as the zmq subscription topic.
 */
enum class Category {
    State,
    RipState,
    Disc
};

constexpr std::array allCategories{ Category::State, Category::RipState, Category::Disc };

constexpr std::string_view categoryName(Category category) noexcept {
    switch (category) {
    case Category::State: return "state";
    case Category::RipState: return "rip_state";
    case Category::Disc: return "disc";
    }
    return "";
}

constexpr std::optional<Category> parseCategory(std::string_view name) noexcept {
    for (const auto category : allCategories) {
        if (categoryName(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

} // namespace codctl

#endif // CODCTL_CATEGORY_HPP
