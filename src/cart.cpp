#include "cart.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace discount_rules {

std::vector<ShoppingCartItem> limitPerStore(const std::vector<ShoppingCartItem>& items,
                                            int storeId,
                                            bool cartsSharedBetweenStores)
{
    std::vector<ShoppingCartItem> kept;
    for (const auto& item : items) {
        if (item.shoppingCartType != ShoppingCartType::ShoppingCart) continue;
        if (!cartsSharedBetweenStores && item.storeId != storeId) continue;
        kept.push_back(item);
    }
    return kept;
}

std::vector<CartLine> aggregateCart(const Customer& customer,
                                    int storeId,
                                    bool cartsSharedBetweenStores)
{
    std::vector<CartLine> lines;
    std::unordered_map<int, std::size_t> indexByProduct;

    for (const auto& item : limitPerStore(customer.shoppingCartItems, storeId,
                                          cartsSharedBetweenStores)) {
        auto it = indexByProduct.find(item.productId);
        if (it == indexByProduct.end()) {
            indexByProduct.emplace(item.productId, lines.size());
            lines.push_back(CartLine{item.productId, item.quantity});
        } else {
            auto& line = lines[it->second];
            const int64_t total = static_cast<int64_t>(line.totalQuantity) + item.quantity;
            if (total > std::numeric_limits<int>::max() ||
                total < std::numeric_limits<int>::min()) {
                throw std::overflow_error("Total quantity of product " +
                                          std::to_string(item.productId) +
                                          " overflows");
            }
            line.totalQuantity = static_cast<int>(total);
        }
    }
    return lines;
}

} // namespace discount_rules
