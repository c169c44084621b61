#include "mapping.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace discount_rules {

namespace {

int checkedInt(const nlohmann::json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Field '") + field +
                                 "' must be an integer");
    }
    // Read wide first so out-of-range numbers are rejected, not narrowed.
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(std::string("Field '") + field + "' out of range");
        }
        return static_cast<int>(value.get<std::uint64_t>());
    }
    const auto wide = value.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string("Field '") + field + "' out of range");
    }
    return static_cast<int>(wide);
}

int requireInt(const nlohmann::json& node, const char* field) {
    if (!node.contains(field)) {
        throw std::runtime_error(std::string("Missing '") + field + "' field");
    }
    return checkedInt(node[field], field);
}

int optionalInt(const nlohmann::json& node, const char* field, int fallback = 0) {
    if (!node.contains(field)) return fallback;
    return checkedInt(node[field], field);
}

std::map<std::string, std::string> parseStringMap(const nlohmann::json& node,
                                                  const char* section) {
    std::map<std::string, std::string> out;
    if (!node.is_object()) {
        throw std::runtime_error(std::string("'") + section + "' must be an object");
    }
    for (const auto& [key, value] : node.items()) {
        if (!value.is_string()) {
            throw std::runtime_error(std::string("'") + section + "." + key +
                                     "' must be a string");
        }
        out[key] = value.get<std::string>();
    }
    return out;
}

} // namespace

ShoppingCartType parseShoppingCartType(const nlohmann::json& value) {
    if (value.is_string()) {
        const auto name = value.get<std::string>();
        if (name == "ShoppingCart") return ShoppingCartType::ShoppingCart;
        if (name == "Wishlist")     return ShoppingCartType::Wishlist;
        throw std::runtime_error("Unknown shopping cart type: " + name);
    }
    if (value.is_number_integer()) {
        const int code = checkedInt(value, "shoppingCartType");
        if (code == 1) return ShoppingCartType::ShoppingCart;
        if (code == 2) return ShoppingCartType::Wishlist;
        throw std::runtime_error("Unknown shopping cart type: " + std::to_string(code));
    }
    throw std::runtime_error("Shopping cart type must be a name or a number");
}

ShoppingCartItem parseCartItem(const nlohmann::json& node) {
    ShoppingCartItem item;
    item.id        = optionalInt(node, "id");
    item.productId = requireInt(node, "productId");
    item.quantity  = requireInt(node, "quantity");
    item.storeId   = optionalInt(node, "storeId");
    if (node.contains("shoppingCartType")) {
        item.shoppingCartType = parseShoppingCartType(node["shoppingCartType"]);
    }
    return item;
}

Customer parseCustomer(const nlohmann::json& node) {
    Customer c;
    c.id = optionalInt(node, "id");

    if (node.contains("shoppingCartItems")) {
        const auto& items = node["shoppingCartItems"];
        if (!items.is_array()) {
            throw std::runtime_error("'shoppingCartItems' must be an array");
        }
        for (const auto& item : items) {
            c.shoppingCartItems.push_back(parseCartItem(item));
        }
    }
    return c;
}

Store parseStore(const nlohmann::json& node) {
    Store s;
    s.id   = optionalInt(node, "id");
    s.name = node.value("name", "");
    return s;
}

ValidationRequest parseValidationRequest(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Validation request must be a JSON object");
    }

    ValidationRequest request;
    request.discountRequirementId = requireInt(document, "discountRequirementId");

    if (!document.contains("store")) {
        throw std::runtime_error("Request missing 'store' field");
    }
    request.store = parseStore(document["store"]);

    // customer is null for guests without a record
    if (document.contains("customer") && !document["customer"].is_null()) {
        request.customer = parseCustomer(document["customer"]);
    }
    return request;
}

StoreContents parseStoreContents(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Store contents must be a JSON object");
    }

    StoreContents contents;

    if (document.contains("settings")) {
        contents.settings = parseStringMap(document["settings"], "settings");
    }

    if (document.contains("discountRequirements")) {
        const auto& reqs = document["discountRequirements"];
        if (!reqs.is_array()) {
            throw std::runtime_error("'discountRequirements' must be an array");
        }
        for (const auto& node : reqs) {
            DiscountRequirement r;
            r.id             = requireInt(node, "id");
            r.discountId     = optionalInt(node, "discountId");
            r.ruleSystemName = node.value("discountRequirementRuleSystemName", "");
            contents.discountRequirements.push_back(r);
        }
    }

    if (document.contains("localeResources")) {
        contents.localeResources =
            parseStringMap(document["localeResources"], "localeResources");
    }

    return contents;
}

nlohmann::json toJson(const StoreContents& contents) {
    nlohmann::json requirements = nlohmann::json::array();
    for (const auto& r : contents.discountRequirements) {
        requirements.push_back({
            {"id", r.id},
            {"discountId", r.discountId},
            {"discountRequirementRuleSystemName", r.ruleSystemName}
        });
    }

    return {
        {"settings", contents.settings},
        {"discountRequirements", requirements},
        {"localeResources", contents.localeResources}
    };
}

} // namespace discount_rules
