#include "has_one_product_rule.hpp"
#include "cart.hpp"
#include "defaults.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace discount_rules {

HasOneProductRule::HasOneProductRule(SettingStore& settings,
                                     DiscountRequirementStore& requirements,
                                     LocaleResourceStore& localeResources,
                                     const UrlHelper& urlHelper,
                                     RuleOptions options)
    : mSettings(settings)
    , mRequirements(requirements)
    , mLocaleResources(localeResources)
    , mUrlHelper(urlHelper)
    , mOptions(options) {}

// ---------------------------------------------------------------------------
// Requirement check
// ---------------------------------------------------------------------------

ValidationResult HasOneProductRule::checkRequirement(const ValidationRequest* request) const
{
    if (request == nullptr) {
        throw std::invalid_argument("checkRequirement: request is null");
    }

    ValidationResult result;

    const auto key = defaults::settingsKey(request->discountRequirementId);
    const auto restrictedProductIds = mSettings.getSettingByKey(key).value_or("");

    // nothing configured: every cart qualifies
    if (isBlank(restrictedProductIds)) {
        if (mOptions.verbose) {
            std::cerr << "[HasOneProduct] No restricted products under '"
                      << key << "'; requirement passes\n";
        }
        result.isValid = true;
        return result;
    }

    if (!request->customer) {
        if (mOptions.verbose) {
            std::cerr << "[HasOneProduct] No customer on the request\n";
        }
        return result;
    }

    const auto tokens = splitCommaList(restrictedProductIds);
    if (tokens.empty()) return result;

    // The same product can sit in the cart several times with different
    // attributes, so compare against the total per product.
    const auto cart = aggregateCart(*request->customer, request->store.id,
                                    mOptions.cartsSharedBetweenStores);

    const auto outcome = evaluateRestrictions(tokens, cart,
                                              mOptions.malformedTokenPolicy,
                                              mOptions.verbose);

    if (mOptions.verbose) {
        std::cerr << "[HasOneProduct] Requirement "
                  << request->discountRequirementId << ": "
                  << (outcome.matched ? "passed" : "failed")
                  << (outcome.aborted ? " (malformed list)" : "") << "\n";
    }

    result.isValid = outcome.matched;
    return result;
}

// ---------------------------------------------------------------------------
// Admin
// ---------------------------------------------------------------------------

std::string HasOneProductRule::getConfigurationUrl(int discountId,
                                                   std::optional<int> discountRequirementId) const
{
    RouteValues values;
    values.emplace_back("discountId", std::to_string(discountId));
    values.emplace_back("discountRequirementId",
                        discountRequirementId
                            ? std::optional<std::string>(std::to_string(*discountRequirementId))
                            : std::nullopt);

    auto url = mUrlHelper.action(defaults::kConfigureAction,
                                 defaults::kConfigureController, values);
    if (!url.empty() && url.front() == '/') {
        url.erase(0, 1);
    }
    return url;
}

int HasOneProductRule::saveConfiguration(int discountId,
                                         std::optional<int> discountRequirementId,
                                         const std::string& productIds)
{
    std::optional<int> requirementId;

    if (discountRequirementId) {
        for (const auto& r : mRequirements.getAllRequirements()) {
            if (r.id == *discountRequirementId && r.discountId == discountId &&
                r.ruleSystemName == defaults::kSystemName) {
                requirementId = r.id;
                break;
            }
        }
    }

    if (!requirementId) {
        requirementId = mRequirements.insertRequirement(discountId, defaults::kSystemName);
        if (mOptions.verbose) {
            std::cerr << "[HasOneProduct] Created requirement " << *requirementId
                      << " for discount " << discountId << "\n";
        }
    }

    mSettings.setSetting(defaults::settingsKey(*requirementId), productIds);
    return *requirementId;
}

void HasOneProductRule::install() {
    for (const auto& [key, value] : defaults::kLocaleResources) {
        mLocaleResources.addOrUpdate(key, value);
    }

    if (mOptions.verbose) {
        std::cerr << "[HasOneProduct] Installed "
                  << defaults::kLocaleResources.size() << " locale resources\n";
    }
}

void HasOneProductRule::uninstall() {
    int removed = 0;
    for (const auto& r : mRequirements.getAllRequirements()) {
        if (r.ruleSystemName == defaults::kSystemName) {
            mRequirements.deleteRequirement(r);
            ++removed;
        }
    }

    for (const auto& entry : defaults::kLocaleResources) {
        mLocaleResources.deleteResource(entry.first);
    }

    if (mOptions.verbose) {
        std::cerr << "[HasOneProduct] Uninstalled: removed " << removed
                  << " requirement(s)\n";
    }
}

} // namespace discount_rules
