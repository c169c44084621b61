#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace discount_rules {

/// Key/value settings persisted by the host platform.
class SettingStore {
public:
    virtual ~SettingStore() = default;

    virtual std::optional<std::string> getSettingByKey(const std::string& key) const = 0;
    virtual void setSetting(const std::string& key, const std::string& value) = 0;
};

/// Discount requirement records of all rules.
class DiscountRequirementStore {
public:
    virtual ~DiscountRequirementStore() = default;

    virtual std::vector<DiscountRequirement> getAllRequirements() const = 0;

    /// Removing a requirement that no longer exists is a no-op.
    virtual void deleteRequirement(const DiscountRequirement& requirement) = 0;

    /// Attach a new requirement to @p discountId and return its id.
    virtual int insertRequirement(int discountId, const std::string& ruleSystemName) = 0;
};

/// Localized UI strings.
class LocaleResourceStore {
public:
    virtual ~LocaleResourceStore() = default;

    virtual void addOrUpdate(const std::string& key, const std::string& value) = 0;

    /// Removing a missing resource is a no-op.
    virtual void deleteResource(const std::string& key) = 0;
};

/// Route values in the order they should appear; absent values are omitted
/// from the generated URL.
using RouteValues = std::vector<std::pair<std::string, std::optional<std::string>>>;

/// Builds URLs for controller actions.
class UrlHelper {
public:
    virtual ~UrlHelper() = default;

    virtual std::string action(const std::string& action,
                               const std::string& controller,
                               const RouteValues& routeValues) const = 0;
};

} // namespace discount_rules
