/// @file test_rule.cpp
/// Tests for has_one_product_rule.hpp: requirement checks, configuration
/// URL, save-configuration and install/uninstall against in-memory stores.

#include "defaults.hpp"
#include "has_one_product_rule.hpp"
#include "in_memory_services.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace discount_rules;

namespace {

constexpr int kRequirementId = 5;
constexpr int kStoreId       = 1;

ShoppingCartItem makeItem(int productId, int quantity, int storeId = kStoreId,
                          ShoppingCartType type = ShoppingCartType::ShoppingCart) {
    ShoppingCartItem item;
    item.productId        = productId;
    item.quantity         = quantity;
    item.storeId          = storeId;
    item.shoppingCartType = type;
    return item;
}

} // namespace

class HasOneProductRuleTest : public ::testing::Test {
protected:
    InMemorySettingStore             settings;
    InMemoryDiscountRequirementStore requirements;
    InMemoryLocaleResourceStore      resources;
    RouteUrlHelper                   urlHelper;

    HasOneProductRule makeRule(RuleOptions options = {}) {
        return HasOneProductRule(settings, requirements, resources, urlHelper, options);
    }

    void configure(const std::string& productIds) {
        settings.setSetting(defaults::settingsKey(kRequirementId), productIds);
    }

    static ValidationRequest requestWith(std::vector<ShoppingCartItem> items) {
        ValidationRequest request;
        request.discountRequirementId = kRequirementId;
        request.store.id              = kStoreId;
        Customer customer;
        customer.id                = 9;
        customer.shoppingCartItems = std::move(items);
        request.customer           = customer;
        return request;
    }

    bool check(const std::string& productIds, std::vector<ShoppingCartItem> items,
               RuleOptions options = {}) {
        configure(productIds);
        return makeRule(options).checkRequirement(requestWith(std::move(items))).isValid;
    }
};

// ============================================================================
// checkRequirement: no restriction configured
// ============================================================================

TEST_F(HasOneProductRuleTest, NullRequestThrows) {
    auto rule = makeRule();
    EXPECT_THROW(rule.checkRequirement(nullptr), std::invalid_argument);
}

TEST_F(HasOneProductRuleTest, MissingSettingIsValid) {
    auto rule = makeRule();
    EXPECT_TRUE(rule.checkRequirement(requestWith({})).isValid);
}

TEST_F(HasOneProductRuleTest, BlankSettingIsValid) {
    for (const std::string blank : {"", " ", "\t \n"}) {
        EXPECT_TRUE(check(blank, {})) << "setting '" << blank << "'";
    }
}

TEST_F(HasOneProductRuleTest, NoBreakSpaceSettingIsValid) {
    EXPECT_TRUE(check("\xC2\xA0\xC2\xA0", {}));
}

TEST_F(HasOneProductRuleTest, TokenPaddedWithNoBreakSpaceMatches) {
    EXPECT_TRUE(check("\xC2\xA0" "77" "\xC2\xA0, 5", {makeItem(77, 1)}));
}

TEST_F(HasOneProductRuleTest, BlankSettingIsValidEvenWithoutCustomer) {
    configure("   ");
    ValidationRequest request;
    request.discountRequirementId = kRequirementId;
    EXPECT_TRUE(makeRule().checkRequirement(request).isValid);
}

// ============================================================================
// checkRequirement: configured list
// ============================================================================

TEST_F(HasOneProductRuleTest, NoCustomerIsInvalid) {
    configure("77");
    ValidationRequest request;
    request.discountRequirementId = kRequirementId;
    request.store.id              = kStoreId;
    EXPECT_FALSE(makeRule().checkRequirement(request).isValid);
}

TEST_F(HasOneProductRuleTest, OnlySeparatorsIsInvalid) {
    EXPECT_FALSE(check(" , ,", {makeItem(77, 1)}));
}

TEST_F(HasOneProductRuleTest, PlainIdMatchesAnyQuantity) {
    EXPECT_TRUE(check("77", {makeItem(77, 2)}));
}

TEST_F(HasOneProductRuleTest, ExactQuantity) {
    EXPECT_TRUE(check("123:2", {makeItem(123, 2)}));
    EXPECT_FALSE(check("123:3", {makeItem(123, 2)}));
}

TEST_F(HasOneProductRuleTest, QuantityRange) {
    EXPECT_TRUE(check("156:3-8", {makeItem(156, 5)}));
    EXPECT_FALSE(check("156:9-10", {makeItem(156, 5)}));
}

TEST_F(HasOneProductRuleTest, MixedListMatchesAnyToken) {
    EXPECT_TRUE(check("77, 123:2, 156:3-8", {makeItem(5, 1), makeItem(156, 8)}));
    EXPECT_FALSE(check("77, 123:2, 156:3-8", {makeItem(5, 1), makeItem(123, 1)}));
}

TEST_F(HasOneProductRuleTest, UnparsableQuantityIsInvalid) {
    EXPECT_FALSE(check("77:abc", {makeItem(77, 1)}));
}

TEST_F(HasOneProductRuleTest, UnparsableQuantitySuppressesLaterTokens) {
    EXPECT_FALSE(check("77:abc,123", {makeItem(123, 1)}));
    EXPECT_FALSE(check("77:1-x, 123", {makeItem(123, 1)}));
}

TEST_F(HasOneProductRuleTest, UnparsablePlainIdIsSkipped) {
    EXPECT_FALSE(check("abc", {makeItem(77, 1)}));
    EXPECT_TRUE(check("abc, 77", {makeItem(77, 1)}));
}

TEST_F(HasOneProductRuleTest, QuantitiesAreSummedPerProduct) {
    EXPECT_TRUE(check("10:3", {makeItem(10, 1), makeItem(10, 2)}));
}

TEST_F(HasOneProductRuleTest, OverflowingCartTotalIsReported) {
    configure("10:2");
    auto request = requestWith({makeItem(10, std::numeric_limits<int>::max()), makeItem(10, 2)});
    EXPECT_THROW(makeRule().checkRequirement(request), std::overflow_error);
}

TEST_F(HasOneProductRuleTest, ReversedRangeNeverMatches) {
    for (int qty = 1; qty <= 10; ++qty) {
        EXPECT_FALSE(check("10:8-3", {makeItem(10, qty)})) << "quantity " << qty;
    }
}

TEST_F(HasOneProductRuleTest, OtherStoreAndWishlistAreIgnored) {
    EXPECT_FALSE(check("77", {makeItem(77, 1, kStoreId + 1)}));
    EXPECT_FALSE(check("77", {makeItem(77, 1, kStoreId, ShoppingCartType::Wishlist)}));
}

TEST_F(HasOneProductRuleTest, SharedCartsCountOtherStores) {
    RuleOptions options;
    options.cartsSharedBetweenStores = true;
    EXPECT_TRUE(check("77:3", {makeItem(77, 1), makeItem(77, 2, kStoreId + 1)}, options));
}

TEST_F(HasOneProductRuleTest, LenientPolicySkipsMalformedTokens) {
    RuleOptions options;
    options.malformedTokenPolicy = MalformedTokenPolicy::SkipToken;
    EXPECT_TRUE(check("77:abc,123", {makeItem(123, 1)}, options));
    EXPECT_FALSE(check("77:abc", {makeItem(77, 1)}, options));
}

TEST_F(HasOneProductRuleTest, SettingOfAnotherRequirementIsNotUsed) {
    settings.setSetting(defaults::settingsKey(kRequirementId + 1), "999");
    EXPECT_TRUE(makeRule().checkRequirement(requestWith({makeItem(77, 1)})).isValid);
}

// ============================================================================
// getConfigurationUrl
// ============================================================================

TEST_F(HasOneProductRuleTest, ConfigurationUrlForNewRequirement) {
    EXPECT_EQ(makeRule().getConfigurationUrl(3, std::nullopt),
              "Admin/DiscountRulesHasOneProduct/Configure?discountId=3");
}

TEST_F(HasOneProductRuleTest, ConfigurationUrlForExistingRequirement) {
    EXPECT_EQ(makeRule().getConfigurationUrl(3, 12),
              "Admin/DiscountRulesHasOneProduct/Configure?discountId=3&discountRequirementId=12");
}

TEST_F(HasOneProductRuleTest, ConfigurationUrlWithoutArea) {
    RouteUrlHelper noArea("");
    HasOneProductRule rule(settings, requirements, resources, noArea);
    EXPECT_EQ(rule.getConfigurationUrl(1, std::nullopt),
              "DiscountRulesHasOneProduct/Configure?discountId=1");
}

// ============================================================================
// saveConfiguration
// ============================================================================

TEST_F(HasOneProductRuleTest, SaveCreatesRequirementWhenNew) {
    auto rule = makeRule();
    const int id = rule.saveConfiguration(3, std::nullopt, "77, 123:2");

    const auto all = requirements.getAllRequirements();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, id);
    EXPECT_EQ(all[0].discountId, 3);
    EXPECT_EQ(all[0].ruleSystemName, defaults::kSystemName);
    EXPECT_EQ(settings.getSettingByKey(defaults::settingsKey(id)).value_or(""), "77, 123:2");
}

TEST_F(HasOneProductRuleTest, SaveUpdatesExistingRequirement) {
    requirements.add({kRequirementId, 3, defaults::kSystemName});
    configure("1");

    const int id = makeRule().saveConfiguration(3, kRequirementId, "2");
    EXPECT_EQ(id, kRequirementId);
    EXPECT_EQ(requirements.getAllRequirements().size(), 1u);
    EXPECT_EQ(settings.getSettingByKey(defaults::settingsKey(kRequirementId)).value_or(""), "2");
}

TEST_F(HasOneProductRuleTest, SaveWithUnknownIdCreatesRequirement) {
    requirements.add({kRequirementId, 3, "DiscountRequirement.Other"});

    const int id = makeRule().saveConfiguration(3, kRequirementId, "2");
    EXPECT_NE(id, kRequirementId);
    EXPECT_EQ(requirements.getAllRequirements().size(), 2u);
    EXPECT_FALSE(settings.getSettingByKey(defaults::settingsKey(kRequirementId)).has_value());
}

TEST_F(HasOneProductRuleTest, SavedListIsUsedByCheck) {
    auto rule = makeRule();
    const int id = rule.saveConfiguration(3, std::nullopt, "77:2");

    auto request = requestWith({makeItem(77, 2)});
    request.discountRequirementId = id;
    EXPECT_TRUE(rule.checkRequirement(request).isValid);
}

// ============================================================================
// install / uninstall
// ============================================================================

TEST_F(HasOneProductRuleTest, InstallAddsLocaleResources) {
    makeRule().install();

    ASSERT_EQ(resources.all().size(), defaults::kLocaleResources.size());
    EXPECT_EQ(resources.all().at("Plugins.DiscountRules.HasOneProduct.Fields.Products"),
              "Restricted products [and quantity range]");
    EXPECT_EQ(resources.all().at("Plugins.DiscountRules.HasOneProduct.Fields.Products.AddNew"),
              "Add product");
    EXPECT_EQ(resources.all().at("Plugins.DiscountRules.HasOneProduct.Fields.Products.Choose"),
              "Choose");
}

TEST_F(HasOneProductRuleTest, InstallOverwritesExistingValues) {
    resources.addOrUpdate("Plugins.DiscountRules.HasOneProduct.Fields.Products.Choose", "Pick");
    makeRule().install();
    EXPECT_EQ(resources.all().at("Plugins.DiscountRules.HasOneProduct.Fields.Products.Choose"),
              "Choose");
}

TEST_F(HasOneProductRuleTest, UninstallRemovesOwnRequirementsAndResources) {
    requirements.add({1, 3, defaults::kSystemName});
    requirements.add({2, 3, "DiscountRequirement.MustBeAssignedToCustomerRole"});
    requirements.add({3, 4, defaults::kSystemName});
    resources.addOrUpdate("Unrelated.Key", "kept");

    auto rule = makeRule();
    rule.install();
    rule.uninstall();

    const auto remaining = requirements.getAllRequirements();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, 2);

    ASSERT_EQ(resources.all().size(), 1u);
    EXPECT_EQ(resources.all().count("Unrelated.Key"), 1u);
}

TEST_F(HasOneProductRuleTest, UninstallWithoutInstallIsHarmless) {
    EXPECT_NO_THROW(makeRule().uninstall());
    EXPECT_TRUE(resources.all().empty());
    EXPECT_TRUE(requirements.getAllRequirements().empty());
}
