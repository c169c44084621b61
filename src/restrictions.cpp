#include "restrictions.hpp"
#include "util.hpp"

#include <iostream>
#include <type_traits>

namespace discount_rules {

namespace {

ParsedToken parsed(Constraint c) {
    ParsedToken t;
    t.status     = TokenStatus::Parsed;
    t.constraint = c;
    return t;
}

ParsedToken failed(TokenStatus status) {
    ParsedToken t;
    t.status = status;
    return t;
}

const char* modeName(ConstraintMode mode) {
    switch (mode) {
        case ConstraintMode::ExactQuantity: return "exact quantity";
        case ConstraintMode::QuantityRange: return "quantity range";
        default:                            return "any quantity";
    }
}

} // namespace

ParsedToken parseToken(const std::string& token) {
    const auto colon = token.find(':');

    // --- plain product id ---
    if (colon == std::string::npos) {
        auto id = tryParseInt(token);
        if (!id) return failed(TokenStatus::BadProductId);
        return parsed(AnyQuantity{*id});
    }

    // Quantity field is whatever sits between the first and second colon.
    const auto fields   = split(token, ':');
    const auto id       = tryParseInt(fields[0]);
    const auto& qtyText = fields[1];

    // --- id:min-max ---
    if (token.find('-', colon + 1) != std::string::npos) {
        const auto bounds = split(qtyText, '-');
        if (!id || bounds.size() < 2) return failed(TokenStatus::BadQuantity);

        auto minQty = tryParseInt(bounds[0]);
        auto maxQty = tryParseInt(bounds[1]);
        if (!minQty || !maxQty) return failed(TokenStatus::BadQuantity);

        return parsed(QuantityRange{*id, *minQty, *maxQty});
    }

    // --- id:qty ---
    auto qty = tryParseInt(qtyText);
    if (!id || !qty) return failed(TokenStatus::BadQuantity);
    return parsed(ExactQuantity{*id, *qty});
}

ConstraintMode modeOf(const Constraint& constraint) {
    switch (constraint.index()) {
        case 1:  return ConstraintMode::ExactQuantity;
        case 2:  return ConstraintMode::QuantityRange;
        default: return ConstraintMode::Any;
    }
}

int productIdOf(const Constraint& constraint) {
    return std::visit([](const auto& c) { return c.productId; }, constraint);
}

bool matches(const Constraint& constraint, const CartLine& line) {
    return std::visit([&line](const auto& c) {
        using T = std::decay_t<decltype(c)>;

        if (line.productId != c.productId) return false;

        if constexpr (std::is_same_v<T, ExactQuantity>) {
            return line.totalQuantity == c.quantity;
        } else if constexpr (std::is_same_v<T, QuantityRange>) {
            return c.minQuantity <= line.totalQuantity &&
                   line.totalQuantity <= c.maxQuantity;
        } else {
            return true;
        }
    }, constraint);
}

EvaluationOutcome evaluateRestrictions(const std::vector<std::string>& tokens,
                                       const std::vector<CartLine>& cart,
                                       MalformedTokenPolicy policy,
                                       bool verbose)
{
    EvaluationOutcome outcome;

    for (const auto& token : tokens) {
        if (isBlank(token)) continue;

        const auto result = parseToken(token);

        if (result.status == TokenStatus::BadProductId) {
            if (verbose) {
                std::cerr << "[Restrictions] Ignoring token '" << token
                          << "': not a product id\n";
            }
            continue;
        }

        if (result.status == TokenStatus::BadQuantity) {
            if (policy == MalformedTokenPolicy::AbortEvaluation) {
                if (verbose) {
                    std::cerr << "[Restrictions] Malformed token '" << token
                              << "'; rejecting the whole list\n";
                }
                outcome.aborted = true;
                return outcome;
            }
            if (verbose) {
                std::cerr << "[Restrictions] Skipping malformed token '"
                          << token << "'\n";
            }
            continue;
        }

        const auto& constraint = *result.constraint;
        for (const auto& line : cart) {
            if (matches(constraint, line)) {
                if (verbose) {
                    std::cerr << "[Restrictions] Token '" << token << "' ("
                              << modeName(modeOf(constraint)) << ") matched product "
                              << productIdOf(constraint)
                              << " with quantity " << line.totalQuantity << "\n";
                }
                outcome.matched      = true;
                outcome.matchedToken = token;
                return outcome;
            }
        }
    }

    return outcome;
}

} // namespace discount_rules
