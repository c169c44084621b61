#include "in_memory_services.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace discount_rules {

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

std::optional<std::string>
InMemorySettingStore::getSettingByKey(const std::string& key) const {
    auto it = mSettings.find(key);
    if (it == mSettings.end()) return std::nullopt;
    return it->second;
}

void InMemorySettingStore::setSetting(const std::string& key, const std::string& value) {
    mSettings[key] = value;
}

// ---------------------------------------------------------------------------
// Discount requirements
// ---------------------------------------------------------------------------

std::vector<DiscountRequirement> InMemoryDiscountRequirementStore::getAllRequirements() const {
    return mRequirements;
}

void InMemoryDiscountRequirementStore::deleteRequirement(const DiscountRequirement& requirement) {
    mRequirements.erase(
        std::remove_if(mRequirements.begin(), mRequirements.end(),
                       [&requirement](const DiscountRequirement& r) {
                           return r.id == requirement.id;
                       }),
        mRequirements.end());
}

int InMemoryDiscountRequirementStore::insertRequirement(int discountId,
                                                        const std::string& ruleSystemName) {
    DiscountRequirement r;
    r.id             = mNextId++;
    r.discountId     = discountId;
    r.ruleSystemName = ruleSystemName;
    mRequirements.push_back(r);
    return r.id;
}

void InMemoryDiscountRequirementStore::add(const DiscountRequirement& requirement) {
    mRequirements.push_back(requirement);
    mNextId = std::max(mNextId, requirement.id + 1);
}

// ---------------------------------------------------------------------------
// Locale resources
// ---------------------------------------------------------------------------

void InMemoryLocaleResourceStore::addOrUpdate(const std::string& key, const std::string& value) {
    mResources[key] = value;
}

void InMemoryLocaleResourceStore::deleteResource(const std::string& key) {
    mResources.erase(key);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

RouteUrlHelper::RouteUrlHelper(std::string area)
    : mArea(std::move(area)) {}

std::string RouteUrlHelper::action(const std::string& action,
                                   const std::string& controller,
                                   const RouteValues& routeValues) const
{
    std::string url;
    if (!mArea.empty()) {
        url += "/" + mArea;
    }
    url += "/" + controller + "/" + action;

    char separator = '?';
    for (const auto& [name, value] : routeValues) {
        if (!value) continue;
        url += separator;
        url += urlEncode(name) + "=" + urlEncode(*value);
        separator = '&';
    }
    return url;
}

std::string urlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace discount_rules
