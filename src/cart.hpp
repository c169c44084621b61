#pragma once

#include "models.hpp"

#include <vector>

namespace discount_rules {

/// Keep the items that belong to @p storeId (all of them when carts are
/// shared between stores) and are of type ShoppingCart.
std::vector<ShoppingCartItem> limitPerStore(const std::vector<ShoppingCartItem>& items,
                                            int storeId,
                                            bool cartsSharedBetweenStores = false);

/// Group the customer's shopping cart by product id and sum quantities.
/// Lines come out in order of each product's first appearance.
/// @throws std::overflow_error if a product's total leaves the int range.
std::vector<CartLine> aggregateCart(const Customer& customer,
                                    int storeId,
                                    bool cartsSharedBetweenStores = false);

} // namespace discount_rules
