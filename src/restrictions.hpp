#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace discount_rules {

// Restricted-product list grammar:
//
//   list  := token ("," token)*
//   token := ProductId                          e.g. 77
//          | ProductId ":" Quantity             e.g. 123:2
//          | ProductId ":" MinQty "-" MaxQty    e.g. 156:3-8

enum class ConstraintMode {
    Any,
    ExactQuantity,
    QuantityRange,
};

/// Product in any quantity.
struct AnyQuantity {
    int productId = 0;
};

/// Product with exactly @c quantity units in the cart.
struct ExactQuantity {
    int productId = 0;
    int quantity  = 0;
};

/// Product with [minQuantity, maxQuantity] units (inclusive).
/// A reversed range never matches.
struct QuantityRange {
    int productId   = 0;
    int minQuantity = 0;
    int maxQuantity = 0;
};

using Constraint = std::variant<AnyQuantity, ExactQuantity, QuantityRange>;

enum class TokenStatus {
    Parsed,
    BadProductId,     // plain id that is not an integer
    BadQuantity,      // id:qty or id:min-max with an unparsable field
};

struct ParsedToken {
    TokenStatus               status = TokenStatus::BadProductId;
    std::optional<Constraint> constraint;
};

/// What to do with a token whose quantity part cannot be parsed.
enum class MalformedTokenPolicy {
    AbortEvaluation,   // whole list fails (historical behaviour)
    SkipToken,         // treat like a bad plain id and keep going
};

struct EvaluationOutcome {
    bool                       matched = false;
    bool                       aborted = false;
    std::optional<std::string> matchedToken;
};

/// Parse one already-trimmed token.
ParsedToken parseToken(const std::string& token);

ConstraintMode modeOf(const Constraint& constraint);
int            productIdOf(const Constraint& constraint);

/// Does @p line satisfy @p constraint?
bool matches(const Constraint& constraint, const CartLine& line);

/// Walk @p tokens in order and stop at the first one that some cart line
/// satisfies.  A BadQuantity token aborts the walk under
/// MalformedTokenPolicy::AbortEvaluation.
EvaluationOutcome evaluateRestrictions(const std::vector<std::string>& tokens,
                                       const std::vector<CartLine>& cart,
                                       MalformedTokenPolicy policy
                                           = MalformedTokenPolicy::AbortEvaluation,
                                       bool verbose = false);

} // namespace discount_rules
