#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/util/enum.hpp"
#include "flowcore/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowcore {

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

enum class CompareOp : std::uint8_t { Eq, Ne, Gt, Lt, Ge, Le };
BOOST_DESCRIBE_ENUM(CompareOp, Eq, Ne, Gt, Lt, Ge, Le)
FLOWCORE_DEFINE_ENUM_SERDE(CompareOp)

enum class LogicalOp : std::uint8_t { And, Or };
BOOST_DESCRIBE_ENUM(LogicalOp, And, Or)
FLOWCORE_DEFINE_ENUM_SERDE(LogicalOp)

namespace expr {

struct Literal {
  JsonValue value;
};

// Dot path into the event document, with an optional default.
struct Var {
  std::string path;
  ExprPtr fallback;
};

struct Compare {
  CompareOp op;
  ExprPtr lhs;
  ExprPtr rhs;
};

struct Logical {
  LogicalOp op;
  std::vector<ExprPtr> operands;
};

struct Not {
  ExprPtr operand;
};

struct BoolCast {
  ExprPtr operand;
};

} // namespace expr

struct Expr {
  std::variant<expr::Literal, expr::Var, expr::Compare, expr::Logical,
               expr::Not, expr::BoolCast>
      node;
};

struct EvalOptions {
  MissingVarPolicy missing_var{MissingVarPolicy::Falsy};
};

// Parses the JSON rule form, e.g.
//   {"and": [{"eq": [{"var": "type"}, "workflow_finished"]},
//            {"eq": [{"var": "data.state"}, "failed"]}]}
// An object is always an operator with exactly one key; any other value is a
// literal. A non-list operand is shorthand for a one-element list.
[[nodiscard]] auto parse_condition(const JsonValue &rule,
                                   std::string *diagnostic = nullptr)
    -> Result<ExprPtr>;

[[nodiscard]] auto evaluate(const Expr &expr, const JsonValue &document,
                            const EvalOptions &options = {})
    -> Result<JsonValue>;

// Truthiness of evaluate().
[[nodiscard]] auto matches(const Expr &expr, const JsonValue &document,
                           const EvalOptions &options = {}) -> Result<bool>;

} // namespace flowcore
