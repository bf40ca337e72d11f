#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "string_processing.h"

using namespace std::literals;

using Item = std::optional<std::string>;

constexpr std::string_view kSkipNotice = "Skipped"sv;

// Null and empty items are skipped and reported through on_skip(), one call per item.
// Whitespace-only items are not skipped, they just contribute no words.
template <typename ItemContainer, 
          typename SkipHandler, 
          typename = std::enable_if_t<std::is_invocable_v<SkipHandler&>>>
std::vector<std::string> CapitalizeWords(const ItemContainer& items, 
                                         SkipHandler on_skip) {
    std::vector<std::string> words;
    for (const auto& item : items) {
        if (!item.has_value() || item->empty()) {
            on_skip();
            continue;
        }

        for (const auto& word : SplitIntoWords(ToLower(*item))) {
            if (IsBlank(word)) continue;

            words.push_back(CapitalizeFirst(word));
        }
    }
    return words;
}

std::vector<std::string> CapitalizeWords(const std::vector<Item>& items, 
                                         std::ostream& log = std::cout);
