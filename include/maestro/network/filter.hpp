#pragma once

#include "event.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace maestro {
namespace network {

/**
 * @brief Subscription filter. Empty lists match everything.
 *
 * `tags` maps a tag name to accepted values; an event matches when it has
 * at least one tag with an accepted value for every listed name.
 * `limit` bounds the stored events replayed when subscribing.
 */
struct Filter {
    std::vector<std::string> ids;
    std::vector<std::string> authors;
    std::vector<int> kinds;
    std::map<std::string, std::vector<std::string>> tags;
    std::optional<Timestamp> since;
    std::optional<size_t> limit;

    bool matches(const Event& event) const {
        if (!ids.empty() && std::find(ids.begin(), ids.end(), event.id) == ids.end()) {
            return false;
        }
        if (!authors.empty() && std::find(authors.begin(), authors.end(), event.pubkey) == authors.end()) {
            return false;
        }
        if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), event.kind) == kinds.end()) {
            return false;
        }
        if (since.has_value() && event.created_at < *since) {
            return false;
        }
        for (const auto& [name, values] : tags) {
            bool found = false;
            for (const auto& value : values) {
                if (event.has_tag(name, value)) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                return false;
            }
        }
        return true;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = nlohmann::json::object();
        if (!ids.empty()) j["ids"] = ids;
        if (!authors.empty()) j["authors"] = authors;
        if (!kinds.empty()) j["kinds"] = kinds;
        for (const auto& [name, values] : tags) {
            j["#" + name] = values;
        }
        if (since.has_value()) j["since"] = *since;
        if (limit.has_value()) j["limit"] = *limit;
        return j;
    }
};

inline bool any_matches(const std::vector<Filter>& filters, const Event& event) {
    for (const auto& filter : filters) {
        if (filter.matches(event)) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace maestro
