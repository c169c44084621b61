#pragma once

#include <string>
#include <utility>
#include <vector>

namespace discount_rules {
namespace defaults {

/// System name the host records on every requirement of this rule.
inline const std::string kSystemName = "DiscountRequirement.HasOneProduct";

/// Settings key prefix; the requirement id is appended.
/// e.g. "DiscountRequirement.HasOneProduct-42"
inline const std::string kSettingsKeyPrefix = "DiscountRequirement.HasOneProduct-";

/// Admin route of the configuration screen.
inline const std::string kConfigureAction     = "Configure";
inline const std::string kConfigureController = "DiscountRulesHasOneProduct";

/// Locale resources the configuration screen uses, with their default
/// (English) values.
inline const std::vector<std::pair<std::string, std::string>> kLocaleResources = {
    {"Plugins.DiscountRules.HasOneProduct.Fields.Products",
     "Restricted products [and quantity range]"},
    {"Plugins.DiscountRules.HasOneProduct.Fields.Products.Hint",
     R"(The comma-separated list of product identifiers (e.g. 77, 123, 156). You can find a product ID on its details page. You can also specify the comma-separated list of product identifiers with quantities ({Product ID}:{Quantity}. for example, 77:1, 123:2, 156:3). And you can also specify the comma-separated list of product identifiers with quantity range ({Product ID}:{Min quantity}-{Max quantity}. for example, 77:1-3, 123:2-5, 156:3-8).)"},
    {"Plugins.DiscountRules.HasOneProduct.Fields.Products.AddNew",
     "Add product"},
    {"Plugins.DiscountRules.HasOneProduct.Fields.Products.Choose",
     "Choose"},
};

inline std::string settingsKey(int discountRequirementId) {
    return kSettingsKeyPrefix + std::to_string(discountRequirementId);
}

} // namespace defaults
} // namespace discount_rules
