#pragma once

#include "services.hpp"

#include <map>
#include <string>
#include <vector>

namespace discount_rules {

class InMemorySettingStore : public SettingStore {
public:
    std::optional<std::string> getSettingByKey(const std::string& key) const override;
    void setSetting(const std::string& key, const std::string& value) override;

    const std::map<std::string, std::string>& all() const { return mSettings; }

private:
    std::map<std::string, std::string> mSettings;
};

class InMemoryDiscountRequirementStore : public DiscountRequirementStore {
public:
    std::vector<DiscountRequirement> getAllRequirements() const override;
    void deleteRequirement(const DiscountRequirement& requirement) override;
    int insertRequirement(int discountId, const std::string& ruleSystemName) override;

    /// Load an existing record as-is (ids are kept).
    void add(const DiscountRequirement& requirement);

private:
    std::vector<DiscountRequirement> mRequirements;
    int                              mNextId = 1;
};

class InMemoryLocaleResourceStore : public LocaleResourceStore {
public:
    void addOrUpdate(const std::string& key, const std::string& value) override;
    void deleteResource(const std::string& key) override;

    const std::map<std::string, std::string>& all() const { return mResources; }

private:
    std::map<std::string, std::string> mResources;
};

/// Conventional "/{area}/{controller}/{action}?name=value" routing.
class RouteUrlHelper : public UrlHelper {
public:
    /// @param area  Leading path segment, e.g. "Admin"; empty for none.
    explicit RouteUrlHelper(std::string area = "Admin");

    std::string action(const std::string& action,
                       const std::string& controller,
                       const RouteValues& routeValues) const override;

private:
    std::string mArea;
};

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

} // namespace discount_rules
