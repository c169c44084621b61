#pragma once

#include "models.hpp"
#include "restrictions.hpp"
#include "services.hpp"

#include <optional>
#include <string>

namespace discount_rules {

struct RuleOptions {
    bool                 cartsSharedBetweenStores = false;
    MalformedTokenPolicy malformedTokenPolicy     = MalformedTokenPolicy::AbortEvaluation;
    bool                 verbose                  = false;
};

/// Discount requirement that passes when the customer's cart holds at
/// least one of the restricted products, optionally in an exact quantity
/// or a quantity range.
class HasOneProductRule {
public:
    HasOneProductRule(SettingStore& settings,
                      DiscountRequirementStore& requirements,
                      LocaleResourceStore& localeResources,
                      const UrlHelper& urlHelper,
                      RuleOptions options = {});

    /// Check the requirement for the customer and store in @p request.
    /// @throws std::invalid_argument if @p request is null.
    ValidationResult checkRequirement(const ValidationRequest* request) const;
    ValidationResult checkRequirement(const ValidationRequest& request) const {
        return checkRequirement(&request);
    }

    /// Relative admin URL of the configuration screen.
    /// @param discountRequirementId  Set when editing an existing requirement.
    std::string getConfigurationUrl(int discountId,
                                    std::optional<int> discountRequirementId) const;

    /// Store @p productIds for the requirement, creating the requirement
    /// first when @p discountRequirementId does not name one of ours.
    /// Returns the id the list was stored under.
    int saveConfiguration(int discountId,
                          std::optional<int> discountRequirementId,
                          const std::string& productIds);

    /// Register the locale resources of the configuration screen.
    void install();

    /// Remove every requirement of this rule and the locale resources.
    void uninstall();

private:
    SettingStore&             mSettings;
    DiscountRequirementStore& mRequirements;
    LocaleResourceStore&      mLocaleResources;
    const UrlHelper&          mUrlHelper;
    RuleOptions               mOptions;
};

} // namespace discount_rules
