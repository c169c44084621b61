#pragma once

#include <optional>
#include <string>
#include <vector>

namespace discount_rules {

/// Cart kinds the storefront keeps per customer.
enum class ShoppingCartType {
    ShoppingCart = 1,
    Wishlist     = 2,
};

/// One row of a customer's cart (the same product may appear several
/// times with different attributes).
struct ShoppingCartItem {
    int              id       = 0;
    int              productId = 0;
    int              storeId  = 0;
    int              quantity = 0;
    ShoppingCartType shoppingCartType = ShoppingCartType::ShoppingCart;
};

struct Customer {
    int                           id = 0;
    std::vector<ShoppingCartItem> shoppingCartItems;
};

struct Store {
    int         id = 0;
    std::string name;
};

/// A rule attached to a discount.
struct DiscountRequirement {
    int         id         = 0;
    int         discountId = 0;
    std::string ruleSystemName;
};

/// Everything a requirement rule needs to decide on a discount.
struct ValidationRequest {
    int                     discountRequirementId = 0;
    std::optional<Customer> customer;
    Store                   store;
};

struct ValidationResult {
    bool isValid = false;   // fail closed
};

/// All cart items of one product, quantities summed.
struct CartLine {
    int productId     = 0;
    int totalQuantity = 0;
};

} // namespace discount_rules
