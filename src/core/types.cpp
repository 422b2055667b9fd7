/**
 * @file types.cpp
 * @brief Worker type name parsing.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace wave_delegator {

std::optional<WorkerType> parse_worker_type(std::string_view name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) {
                       return c == '-' ? '_' : static_cast<char>(std::tolower(c));
                   });

    for (auto type : kAllWorkerTypes) {
        if (to_string(type) == normalized) return type;
    }
    return std::nullopt;
}

}  // namespace wave_delegator
