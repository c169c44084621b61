#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace discount_rules {

/// Persisted state of the collaborator stores, as loaded from a JSON file.
struct StoreContents {
    std::map<std::string, std::string> settings;
    std::vector<DiscountRequirement>   discountRequirements;
    std::map<std::string, std::string> localeResources;
};

/// Accepts "ShoppingCart" / "Wishlist" or the numeric values 1 / 2.
/// Throws std::runtime_error on anything else.
ShoppingCartType parseShoppingCartType(const nlohmann::json& value);

/// Map one cart item node.  "productId" and "quantity" are required.
ShoppingCartItem parseCartItem(const nlohmann::json& node);

Customer parseCustomer(const nlohmann::json& node);

Store parseStore(const nlohmann::json& node);

/// Parse a full validation request document.  A missing or null
/// "customer" leaves the request without a customer.
/// Throws std::runtime_error if the expected shape is missing.
ValidationRequest parseValidationRequest(const nlohmann::json& document);

/// Parse the "settings" / "discountRequirements" / "localeResources"
/// sections; each one is optional.
StoreContents parseStoreContents(const nlohmann::json& document);

nlohmann::json toJson(const StoreContents& contents);

} // namespace discount_rules
