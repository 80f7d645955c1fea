#include "flowcore/trigger/condition.hpp"

#include "flowcore/util/log.hpp"
#include "flowcore/util/util.hpp"

#include <format>
#include <string_view>

namespace flowcore {
namespace {

auto reject(std::string *diagnostic, std::string message)
    -> std::unexpected<std::error_code> {
  if (diagnostic != nullptr) {
    *diagnostic = std::move(message);
  }
  return fail(Error::RuleEvaluationFailed);
}

auto make_expr(auto node) -> ExprPtr {
  return std::make_shared<const Expr>(Expr{.node = std::move(node)});
}

auto parse_node(const JsonValue &rule, std::string *diagnostic, int depth)
    -> Result<ExprPtr>;

auto parse_operands(const JsonValue &raw, std::string *diagnostic, int depth)
    -> Result<std::vector<ExprPtr>> {
  std::vector<ExprPtr> out;
  if (const auto *arr = json::as_array(raw)) {
    out.reserve(arr->size());
    for (const auto &item : *arr) {
      auto node = parse_node(item, diagnostic, depth + 1);
      if (!node) {
        return fail(node.error());
      }
      out.push_back(std::move(*node));
    }
    return ok(std::move(out));
  }
  auto node = parse_node(raw, diagnostic, depth + 1);
  if (!node) {
    return fail(node.error());
  }
  out.push_back(std::move(*node));
  return ok(std::move(out));
}

constexpr int kMaxDepth = 64;

auto parse_node(const JsonValue &rule, std::string *diagnostic, int depth)
    -> Result<ExprPtr> {
  if (depth > kMaxDepth) {
    return reject(diagnostic, "condition nested too deeply");
  }
  const auto *obj = json::as_object(rule);
  if (obj == nullptr) {
    return ok(make_expr(expr::Literal{.value = rule}));
  }
  if (obj->size() != 1) {
    return reject(diagnostic,
                  std::format("operator node must have exactly one key, got {}",
                              obj->size()));
  }

  const auto &[op, raw] = *obj->begin();

  if (op == "var") {
    // {"var": "path"} or {"var": ["path", default]}
    const JsonValue *path = &raw;
    const JsonValue *fallback = nullptr;
    if (const auto *arr = json::as_array(raw)) {
      if (arr->empty() || arr->size() > 2) {
        return reject(diagnostic, "var takes a path and an optional default");
      }
      path = &(*arr)[0];
      if (arr->size() == 2) {
        fallback = &(*arr)[1];
      }
    }
    auto text = json::as_string(*path);
    if (!text || text->empty()) {
      return reject(diagnostic, "var path must be a non-empty string");
    }
    expr::Var var{.path = std::string(*text), .fallback = nullptr};
    if (fallback != nullptr) {
      auto fb = parse_node(*fallback, diagnostic, depth + 1);
      if (!fb) {
        return fail(fb.error());
      }
      var.fallback = std::move(*fb);
    }
    return ok(make_expr(std::move(var)));
  }

  auto operands = parse_operands(raw, diagnostic, depth);
  if (!operands) {
    return fail(operands.error());
  }
  auto &args = *operands;

  if (auto cmp = util::try_parse_enum<CompareOp>(op);
      cmp && op.size() == 2) {
    if (args.size() != 2) {
      return reject(diagnostic, std::format("'{}' takes 2 operands, got {}",
                                            op, args.size()));
    }
    return ok(make_expr(
        expr::Compare{.op = *cmp, .lhs = args[0], .rhs = args[1]}));
  }
  if (op == "and" || op == "or") {
    return ok(make_expr(
        expr::Logical{.op = op == "and" ? LogicalOp::And : LogicalOp::Or,
                      .operands = std::move(args)}));
  }
  if (op == "not" || op == "bool") {
    if (args.size() != 1) {
      return reject(diagnostic, std::format("'{}' takes 1 operand, got {}", op,
                                            args.size()));
    }
    if (op == "not") {
      return ok(make_expr(expr::Not{.operand = std::move(args[0])}));
    }
    return ok(make_expr(expr::BoolCast{.operand = std::move(args[0])}));
  }
  return reject(diagnostic, std::format("unknown operator '{}'", op));
}

auto compare_values(CompareOp op, const JsonValue &lhs, const JsonValue &rhs)
    -> Result<bool> {
  switch (op) {
  case CompareOp::Eq:
    return ok(json::equal(lhs, rhs));
  case CompareOp::Ne:
    return ok(!json::equal(lhs, rhs));
  default:
    break;
  }
  // null orders against nothing.
  if (lhs.is_null() || rhs.is_null()) {
    return ok(false);
  }
  auto order = json::compare(lhs, rhs);
  if (!order) {
    log::debug("Cannot order {} against {}", dump_json(lhs), dump_json(rhs));
    return fail(Error::RuleEvaluationFailed);
  }
  switch (op) {
  case CompareOp::Gt:
    return ok(*order > 0);
  case CompareOp::Lt:
    return ok(*order < 0);
  case CompareOp::Ge:
    return ok(*order >= 0);
  case CompareOp::Le:
    return ok(*order <= 0);
  default:
    return fail(Error::RuleEvaluationFailed);
  }
}

} // namespace

auto parse_condition(const JsonValue &rule, std::string *diagnostic)
    -> Result<ExprPtr> {
  if (json::as_object(rule) == nullptr) {
    return reject(diagnostic, "condition rule must be an operator object");
  }
  return parse_node(rule, diagnostic, 0);
}

auto evaluate(const Expr &e, const JsonValue &document,
              const EvalOptions &options) -> Result<JsonValue> {
  return std::visit(
      overloaded{
          [&](const expr::Literal &lit) -> Result<JsonValue> {
            return ok(lit.value);
          },
          [&](const expr::Var &var) -> Result<JsonValue> {
            if (const auto *found = json::find_path(document, var.path)) {
              return ok(*found);
            }
            if (var.fallback) {
              return evaluate(*var.fallback, document, options);
            }
            if (options.missing_var == MissingVarPolicy::Error) {
              return fail(Error::RuleEvaluationFailed);
            }
            return ok(JsonValue{nullptr});
          },
          [&](const expr::Compare &cmp) -> Result<JsonValue> {
            auto lhs = evaluate(*cmp.lhs, document, options);
            if (!lhs) {
              return fail(lhs.error());
            }
            auto rhs = evaluate(*cmp.rhs, document, options);
            if (!rhs) {
              return fail(rhs.error());
            }
            auto r = compare_values(cmp.op, *lhs, *rhs);
            if (!r) {
              return fail(r.error());
            }
            return ok(JsonValue{*r});
          },
          [&](const expr::Logical &lg) -> Result<JsonValue> {
            const bool is_and = lg.op == LogicalOp::And;
            for (const auto &operand : lg.operands) {
              auto v = evaluate(*operand, document, options);
              if (!v) {
                return fail(v.error());
              }
              if (json::truthy(*v) != is_and) {
                return ok(JsonValue{!is_and});
              }
            }
            return ok(JsonValue{is_and});
          },
          [&](const expr::Not &n) -> Result<JsonValue> {
            auto v = evaluate(*n.operand, document, options);
            if (!v) {
              return fail(v.error());
            }
            return ok(JsonValue{!json::truthy(*v)});
          },
          [&](const expr::BoolCast &b) -> Result<JsonValue> {
            auto v = evaluate(*b.operand, document, options);
            if (!v) {
              return fail(v.error());
            }
            return ok(JsonValue{json::truthy(*v)});
          },
      },
      e.node);
}

auto matches(const Expr &e, const JsonValue &document,
             const EvalOptions &options) -> Result<bool> {
  auto v = evaluate(e, document, options);
  if (!v) {
    return fail(v.error());
  }
  return ok(json::truthy(*v));
}

} // namespace flowcore
