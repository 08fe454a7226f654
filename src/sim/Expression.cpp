#include "instrument-sim/sim/Expression.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/sim/StateStore.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fmt/format.h>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>

namespace instsim {
namespace sim {

using json = nlohmann::json;

namespace {

// g1..g999999999
constexpr std::size_t kMaxCaptureDigits = 9;

/// Raised while evaluating; Expression::evaluate() rewraps it with the source
class EvalFailure : public std::runtime_error {
public:
  explicit EvalFailure(const std::string &message)
      : std::runtime_error(message) {}
};

// ---------------------------------------------------------------------------
// Value helpers
// ---------------------------------------------------------------------------

std::string type_name(const json &v) {
  if (v.is_null())
    return "none";
  if (v.is_boolean())
    return "bool";
  if (v.is_number_integer())
    return "int";
  if (v.is_number())
    return "float";
  if (v.is_string())
    return "string";
  if (v.is_array())
    return "list";
  return "map";
}

/// Numeric view of a value; numeric strings and booleans are coerced
json to_number(const json &v) {
  if (v.is_number())
    return v;
  if (v.is_boolean())
    return v.get<bool>() ? 1 : 0;
  if (v.is_string()) {
    auto parsed = parse_number(v.get<std::string>());
    if (parsed)
      return *parsed;
    throw EvalFailure("'" + v.get<std::string>() + "' is not a number");
  }
  throw EvalFailure("expected a number, got " + type_name(v));
}

double to_double(const json &v) { return to_number(v).get<double>(); }

bool both_integer(const json &a, const json &b) {
  return a.is_number_integer() && b.is_number_integer();
}

/// Integer view of an integral json value; unsigned values past int64 fail
int64_t as_int(const json &v) {
  if (v.is_number_unsigned() &&
      v.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    throw EvalFailure("integer overflow");
  return v.get<int64_t>();
}

/// Integer argument; floats are truncated and must fit in int64
int64_t int_arg(const json &v) {
  json n = to_number(v);
  if (n.is_number_integer())
    return as_int(n);
  return to_int64(n.get<double>());
}

int64_t floor_div(int64_t a, int64_t b) {
  if (a == std::numeric_limits<int64_t>::min() && b == -1)
    throw EvalFailure("integer overflow");
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0)))
    --q;
  return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
  if (b == -1)
    return 0;
  int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0)))
    r += b;
  return r;
}

int64_t int_pow(int64_t base, int64_t exp) {
  int64_t result = 1;
  while (exp > 0) {
    if (exp & 1)
      result = checked_mul(result, base);
    exp >>= 1;
    if (exp == 0)
      break;
    base = checked_mul(base, base);
  }
  return result;
}

json arithmetic(const std::string &op, const json &lhs, const json &rhs) {
  if (op == "+") {
    if (lhs.is_string() && rhs.is_string())
      return lhs.get<std::string>() + rhs.get<std::string>();
    if (lhs.is_array() && rhs.is_array()) {
      json out = lhs;
      for (const auto &item : rhs)
        out.push_back(item);
      return out;
    }
  }

  json a = to_number(lhs);
  json b = to_number(rhs);

  if (op == "+") {
    if (both_integer(a, b))
      return checked_add(as_int(a), as_int(b));
    return a.get<double>() + b.get<double>();
  }
  if (op == "-") {
    if (both_integer(a, b))
      return checked_sub(as_int(a), as_int(b));
    return a.get<double>() - b.get<double>();
  }
  if (op == "*") {
    if (both_integer(a, b))
      return checked_mul(as_int(a), as_int(b));
    return a.get<double>() * b.get<double>();
  }
  if (op == "/") {
    if (b.get<double>() == 0.0)
      throw EvalFailure("division by zero");
    return a.get<double>() / b.get<double>();
  }
  if (op == "//") {
    if (b.get<double>() == 0.0)
      throw EvalFailure("division by zero");
    if (both_integer(a, b))
      return floor_div(as_int(a), as_int(b));
    return std::floor(a.get<double>() / b.get<double>());
  }
  if (op == "%") {
    if (b.get<double>() == 0.0)
      throw EvalFailure("modulo by zero");
    if (both_integer(a, b))
      return floor_mod(as_int(a), as_int(b));
    double x = a.get<double>();
    double y = b.get<double>();
    return x - y * std::floor(x / y);
  }
  if (op == "**") {
    if (both_integer(a, b) && as_int(b) >= 0)
      return int_pow(as_int(a), as_int(b));
    return std::pow(a.get<double>(), b.get<double>());
  }
  throw EvalFailure("unknown operator '" + op + "'");
}

bool compare(const std::string &op, const json &lhs, const json &rhs) {
  if ((lhs.is_null() || rhs.is_null()) && (op == "==" || op == "!="))
    return (lhs == rhs) == (op == "==");
  bool numeric = lhs.is_number() || rhs.is_number() || lhs.is_boolean() ||
                 rhs.is_boolean();
  if (numeric) {
    if ((op == "==" || op == "!=") &&
        ((lhs.is_string() && !parse_number(lhs.get<std::string>())) ||
         (rhs.is_string() && !parse_number(rhs.get<std::string>())))) {
      // a non-numeric string never equals a number
      return op == "!=";
    }
    double a = to_double(lhs);
    double b = to_double(rhs);
    if (op == "==")
      return a == b;
    if (op == "!=")
      return a != b;
    if (op == "<")
      return a < b;
    if (op == "<=")
      return a <= b;
    if (op == ">")
      return a > b;
    if (op == ">=")
      return a >= b;
  } else if (lhs.is_string() && rhs.is_string()) {
    const auto &a = lhs.get_ref<const std::string &>();
    const auto &b = rhs.get_ref<const std::string &>();
    if (op == "==")
      return a == b;
    if (op == "!=")
      return a != b;
    if (op == "<")
      return a < b;
    if (op == "<=")
      return a <= b;
    if (op == ">")
      return a > b;
    if (op == ">=")
      return a >= b;
  } else {
    if (op == "==")
      return lhs == rhs;
    if (op == "!=")
      return lhs != rhs;
    throw EvalFailure("cannot order " + type_name(lhs) + " and " +
                      type_name(rhs));
  }
  throw EvalFailure("unknown comparison '" + op + "'");
}

/// Arguments of a numeric aggregate: a single list, or the arguments
/// themselves
std::vector<double> numeric_items(const std::vector<json> &args,
                                  const char *fn) {
  std::vector<double> out;
  if (args.size() == 1 && args[0].is_array()) {
    for (const auto &item : args[0])
      out.push_back(to_double(item));
  } else {
    for (const auto &item : args)
      out.push_back(to_double(item));
  }
  if (out.empty())
    throw EvalFailure(std::string(fn) + "() of an empty sequence");
  return out;
}

std::vector<json> items_of(const std::vector<json> &args) {
  if (args.size() == 1 && args[0].is_array())
    return std::vector<json>(args[0].begin(), args[0].end());
  return args;
}

double mean_of(const std::vector<double> &values) {
  double total = 0.0;
  for (double v : values)
    total += v;
  return total / static_cast<double>(values.size());
}

double variance_of(const std::vector<double> &values, bool sample,
                   const char *fn) {
  if (sample && values.size() < 2)
    throw EvalFailure(std::string(fn) + "() requires at least two values");
  double m = mean_of(values);
  double ss = 0.0;
  for (double v : values)
    ss += (v - m) * (v - m);
  return ss / static_cast<double>(values.size() - (sample ? 1 : 0));
}

json round_half_even(double value, std::optional<int64_t> digits) {
  if (!digits) {
    return to_int64(std::nearbyint(value));
  }
  double scale = std::pow(10.0, static_cast<double>(*digits));
  return std::nearbyint(value * scale) / scale;
}

// ---------------------------------------------------------------------------
// Function table
// ---------------------------------------------------------------------------

using Builtin =
    std::function<json(const std::vector<json> &, const EvalContext &)>;

struct FunctionSpec {
  std::size_t min_args;
  std::size_t max_args;
  Builtin fn;
};

json unary_math(const std::vector<json> &args, double (*fn)(double)) {
  double result = fn(to_double(args[0]));
  if (std::isnan(result))
    throw EvalFailure("math domain error");
  return result;
}

const std::map<std::string, FunctionSpec> &function_table() {
  static const std::map<std::string, FunctionSpec> table = [] {
    std::map<std::string, FunctionSpec> t;
    constexpr std::size_t kVariadic = 64;

    // built-ins
    t["abs"] = {1, 1, [](const auto &a, const auto &) -> json {
                  json n = to_number(a[0]);
                  if (n.is_number_integer()) {
                    int64_t i = as_int(n);
                    return i < 0 ? checked_sub(0, i) : i;
                  }
                  return std::fabs(n.get<double>());
                }};
    t["min"] = {1, kVariadic, [](const auto &a, const auto &) -> json {
                  auto items = items_of(a);
                  if (items.empty())
                    throw EvalFailure("min() of an empty sequence");
                  json best = to_number(items[0]);
                  for (const auto &item : items)
                    if (compare("<", to_number(item), best))
                      best = to_number(item);
                  return best;
                }};
    t["max"] = {1, kVariadic, [](const auto &a, const auto &) -> json {
                  auto items = items_of(a);
                  if (items.empty())
                    throw EvalFailure("max() of an empty sequence");
                  json best = to_number(items[0]);
                  for (const auto &item : items)
                    if (compare(">", to_number(item), best))
                      best = to_number(item);
                  return best;
                }};
    t["sum"] = {1, 2, [](const auto &a, const auto &) -> json {
                  if (!a[0].is_array())
                    throw EvalFailure("sum() expects a list");
                  json total = a.size() > 1 ? to_number(a[1]) : json(0);
                  for (const auto &item : a[0])
                    total = arithmetic("+", total, to_number(item));
                  return total;
                }};
    t["round"] = {1, 2, [](const auto &a, const auto &) -> json {
                    std::optional<int64_t> digits;
                    if (a.size() > 1)
                      digits = int_arg(a[1]);
                    return round_half_even(to_double(a[0]), digits);
                  }};
    t["len"] = {1, 1, [](const auto &a, const auto &) -> json {
                  if (a[0].is_string())
                    return static_cast<int64_t>(
                        a[0].template get_ref<const std::string &>().size());
                  if (a[0].is_array() || a[0].is_object())
                    return static_cast<int64_t>(a[0].size());
                  throw EvalFailure("len() of " + type_name(a[0]));
                }};
    t["float"] = {1, 1, [](const auto &a, const auto &) -> json {
                    return to_double(a[0]);
                  }};
    t["int"] = {1, 1, [](const auto &a, const auto &) -> json {
                  json n = to_number(a[0]);
                  if (n.is_number_integer())
                    return as_int(n);
                  return to_int64(n.get<double>());
                }};
    t["str"] = {1, 1, [](const auto &a, const auto &) -> json {
                  return format_value(a[0]);
                }};

    // math
    t["math.sqrt"] = {1, 1, [](const auto &a, const auto &) {
                        return unary_math(a, std::sqrt);
                      }};
    t["math.sin"] = {1, 1, [](const auto &a, const auto &) {
                       return unary_math(a, std::sin);
                     }};
    t["math.cos"] = {1, 1, [](const auto &a, const auto &) {
                       return unary_math(a, std::cos);
                     }};
    t["math.tan"] = {1, 1, [](const auto &a, const auto &) {
                       return unary_math(a, std::tan);
                     }};
    t["math.asin"] = {1, 1, [](const auto &a, const auto &) {
                        return unary_math(a, std::asin);
                      }};
    t["math.acos"] = {1, 1, [](const auto &a, const auto &) {
                        return unary_math(a, std::acos);
                      }};
    t["math.atan"] = {1, 1, [](const auto &a, const auto &) {
                        return unary_math(a, std::atan);
                      }};
    t["math.exp"] = {1, 1, [](const auto &a, const auto &) {
                       return unary_math(a, std::exp);
                     }};
    t["math.log10"] = {1, 1, [](const auto &a, const auto &) -> json {
                         double x = to_double(a[0]);
                         if (x <= 0.0)
                           throw EvalFailure("math domain error");
                         return std::log10(x);
                       }};
    t["math.fabs"] = {1, 1, [](const auto &a, const auto &) -> json {
                        return std::fabs(to_double(a[0]));
                      }};
    t["math.floor"] = {1, 1, [](const auto &a, const auto &) -> json {
                         return to_int64(std::floor(to_double(a[0])));
                       }};
    t["math.ceil"] = {1, 1, [](const auto &a, const auto &) -> json {
                        return to_int64(std::ceil(to_double(a[0])));
                      }};
    t["math.log"] = {1, 2, [](const auto &a, const auto &) -> json {
                       double x = to_double(a[0]);
                       if (x <= 0.0)
                         throw EvalFailure("math domain error");
                       if (a.size() == 1)
                         return std::log(x);
                       double base = to_double(a[1]);
                       if (base <= 0.0 || base == 1.0)
                         throw EvalFailure("math domain error");
                       return std::log(x) / std::log(base);
                     }};
    t["math.pow"] = {2, 2, [](const auto &a, const auto &) -> json {
                       double result =
                           std::pow(to_double(a[0]), to_double(a[1]));
                       if (std::isnan(result))
                         throw EvalFailure("math domain error");
                       return result;
                     }};
    t["math.atan2"] = {2, 2, [](const auto &a, const auto &) -> json {
                         return std::atan2(to_double(a[0]), to_double(a[1]));
                       }};
    t["math.hypot"] = {2, 2, [](const auto &a, const auto &) -> json {
                         return std::hypot(to_double(a[0]), to_double(a[1]));
                       }};

    // random, drawn from the backend's own engine
    t["random.random"] = {0, 0, [](const auto &, const EvalContext &ctx) {
                            std::uniform_real_distribution<double> dist(0.0,
                                                                         1.0);
                            return json(dist(ctx.rng));
                          }};
    t["random.uniform"] = {2, 2, [](const auto &a, const EvalContext &ctx) {
                             double lo = to_double(a[0]);
                             double hi = to_double(a[1]);
                             if (hi < lo)
                               std::swap(lo, hi);
                             std::uniform_real_distribution<double> dist(lo,
                                                                         hi);
                             return json(dist(ctx.rng));
                           }};
    t["random.randint"] = {
        2, 2, [](const auto &a, const EvalContext &ctx) -> json {
          int64_t lo = int_arg(a[0]);
          int64_t hi = int_arg(a[1]);
          if (hi < lo)
            throw EvalFailure("randint() empty range");
          std::uniform_int_distribution<int64_t> dist(lo, hi);
          return dist(ctx.rng);
        }};
    t["random.gauss"] = {2, 2, [](const auto &a, const EvalContext &ctx) {
                           double mu = to_double(a[0]);
                           double sigma = to_double(a[1]);
                           if (sigma < 0.0)
                             throw EvalFailure("gauss() sigma must be >= 0");
                           if (sigma == 0.0)
                             return json(mu);
                           std::normal_distribution<double> dist(mu, sigma);
                           return json(dist(ctx.rng));
                         }};
    t["random.choice"] = {
        1, 1, [](const auto &a, const EvalContext &ctx) -> json {
          if (!a[0].is_array() || a[0].empty())
            throw EvalFailure("choice() expects a non-empty list");
          std::uniform_int_distribution<std::size_t> dist(0, a[0].size() - 1);
          return a[0][dist(ctx.rng)];
        }};

    // statistics
    t["statistics.mean"] = {1, kVariadic, [](const auto &a, const auto &) {
                              return json(mean_of(numeric_items(a, "mean")));
                            }};
    t["statistics.median"] = {
        1, kVariadic, [](const auto &a, const auto &) {
          auto values = numeric_items(a, "median");
          std::sort(values.begin(), values.end());
          std::size_t n = values.size();
          if (n % 2 == 1)
            return json(values[n / 2]);
          return json((values[n / 2 - 1] + values[n / 2]) / 2.0);
        }};
    t["statistics.variance"] = {
        1, kVariadic, [](const auto &a, const auto &) {
          return json(variance_of(numeric_items(a, "variance"), true,
                                  "variance"));
        }};
    t["statistics.stdev"] = {
        1, kVariadic, [](const auto &a, const auto &) {
          return json(
              std::sqrt(variance_of(numeric_items(a, "stdev"), true, "stdev")));
        }};
    t["statistics.pstdev"] = {
        1, kVariadic, [](const auto &a, const auto &) {
          return json(std::sqrt(
              variance_of(numeric_items(a, "pstdev"), false, "pstdev")));
        }};

    // date/time
    t["datetime.now"] = {0, 0, [](const auto &, const auto &) {
                           std::time_t now = std::chrono::system_clock::to_time_t(
                               std::chrono::system_clock::now());
                           std::tm local{};
#ifdef _WIN32
                           localtime_s(&local, &now);
#else
                           localtime_r(&now, &local);
#endif
                           char buf[32];
                           std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S",
                                         &local);
                           return json(std::string(buf));
                         }};
    t["datetime.timestamp"] = {
        0, 0, [](const auto &, const auto &) {
          auto since_epoch =
              std::chrono::system_clock::now().time_since_epoch();
          return json(std::chrono::duration<double>(since_epoch).count());
        }};
    return t;
  }();
  return table;
}

const std::map<std::string, json> &constant_table() {
  static const std::map<std::string, json> table = {
      {"math.pi", 3.14159265358979323846},
      {"math.e", 2.71828182845904523536},
      {"math.tau", 6.28318530717958647692},
      {"math.inf", std::numeric_limits<double>::infinity()},
  };
  return table;
}

} // namespace

// ---------------------------------------------------------------------------
// Syntax tree
// ---------------------------------------------------------------------------

namespace detail {

class Node {
public:
  virtual ~Node() = default;
  virtual json eval(const EvalContext &ctx) const = 0;
};

using NodePtr = std::unique_ptr<Node>;

namespace {

class LiteralNode : public Node {
public:
  explicit LiteralNode(json value) : value_(std::move(value)) {}
  json eval(const EvalContext &) const override { return value_; }

private:
  json value_;
};

class ListNode : public Node {
public:
  explicit ListNode(std::vector<NodePtr> items) : items_(std::move(items)) {}
  json eval(const EvalContext &ctx) const override {
    json out = json::array();
    for (const auto &item : items_)
      out.push_back(item->eval(ctx));
    return out;
  }

private:
  std::vector<NodePtr> items_;
};

json lookup_state(const EvalContext &ctx, const std::string &key) {
  const json *value = ctx.state.find(key);
  if (!value)
    throw EvalFailure("unknown state key '" + key + "'");
  return *value;
}

class StateRefNode : public Node {
public:
  explicit StateRefNode(std::string key) : key_(std::move(key)) {}
  json eval(const EvalContext &ctx) const override {
    return lookup_state(ctx, key_);
  }

private:
  std::string key_;
};

class StateIndexNode : public Node {
public:
  explicit StateIndexNode(NodePtr key) : key_(std::move(key)) {}
  json eval(const EvalContext &ctx) const override {
    json key = key_->eval(ctx);
    return lookup_state(ctx, key.is_string() ? key.get<std::string>()
                                             : format_value(key));
  }

private:
  NodePtr key_;
};

class CaptureNode : public Node {
public:
  explicit CaptureNode(std::size_t index) : index_(index) {}
  json eval(const EvalContext &ctx) const override {
    if (index_ == 0 || index_ > ctx.captures.size()) {
      throw EvalFailure(fmt::format("capture g{} not available ({} bound)",
                                    index_, ctx.captures.size()));
    }
    const auto &text = ctx.captures[index_ - 1];
    auto number = parse_number(text);
    if (number)
      return *number;
    return text;
  }

private:
  std::size_t index_;
};

class UnaryNode : public Node {
public:
  UnaryNode(std::string op, NodePtr operand)
      : op_(std::move(op)), operand_(std::move(operand)) {}
  json eval(const EvalContext &ctx) const override {
    json v = operand_->eval(ctx);
    if (op_ == "not")
      return !truthy(v);
    json n = to_number(v);
    if (op_ == "+")
      return n;
    if (n.is_number_integer())
      return checked_sub(0, as_int(n));
    return -n.get<double>();
  }

private:
  std::string op_;
  NodePtr operand_;
};

class BinaryNode : public Node {
public:
  BinaryNode(std::string op, NodePtr lhs, NodePtr rhs)
      : op_(std::move(op)), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}
  json eval(const EvalContext &ctx) const override {
    return arithmetic(op_, lhs_->eval(ctx), rhs_->eval(ctx));
  }

private:
  std::string op_;
  NodePtr lhs_;
  NodePtr rhs_;
};

/// `a < b <= c` holds when every adjacent pair holds
class ComparisonNode : public Node {
public:
  ComparisonNode(std::vector<NodePtr> operands, std::vector<std::string> ops)
      : operands_(std::move(operands)), ops_(std::move(ops)) {}
  json eval(const EvalContext &ctx) const override {
    json lhs = operands_[0]->eval(ctx);
    for (std::size_t i = 0; i < ops_.size(); ++i) {
      json rhs = operands_[i + 1]->eval(ctx);
      if (!compare(ops_[i], lhs, rhs))
        return false;
      lhs = std::move(rhs);
    }
    return true;
  }

private:
  std::vector<NodePtr> operands_;
  std::vector<std::string> ops_;
};

class LogicalNode : public Node {
public:
  LogicalNode(bool is_and, NodePtr lhs, NodePtr rhs)
      : is_and_(is_and), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}
  json eval(const EvalContext &ctx) const override {
    bool left = truthy(lhs_->eval(ctx));
    if (is_and_ && !left)
      return false;
    if (!is_and_ && left)
      return true;
    return truthy(rhs_->eval(ctx));
  }

private:
  bool is_and_;
  NodePtr lhs_;
  NodePtr rhs_;
};

class ConditionalNode : public Node {
public:
  ConditionalNode(NodePtr cond, NodePtr if_true, NodePtr if_false)
      : cond_(std::move(cond)), if_true_(std::move(if_true)),
        if_false_(std::move(if_false)) {}
  json eval(const EvalContext &ctx) const override {
    return truthy(cond_->eval(ctx)) ? if_true_->eval(ctx)
                                    : if_false_->eval(ctx);
  }

private:
  NodePtr cond_;
  NodePtr if_true_;
  NodePtr if_false_;
};

class IndexNode : public Node {
public:
  IndexNode(NodePtr target, NodePtr index)
      : target_(std::move(target)), index_(std::move(index)) {}
  json eval(const EvalContext &ctx) const override {
    json target = target_->eval(ctx);
    json index = index_->eval(ctx);
    if (target.is_object()) {
      std::string key =
          index.is_string() ? index.get<std::string>() : format_value(index);
      if (!target.contains(key))
        throw EvalFailure("unknown key '" + key + "'");
      return target[key];
    }
    int64_t i = int_arg(index);
    int64_t size = 0;
    if (target.is_array())
      size = static_cast<int64_t>(target.size());
    else if (target.is_string())
      size = static_cast<int64_t>(target.get_ref<const std::string &>().size());
    else
      throw EvalFailure("cannot index " + type_name(target));
    if (i < 0)
      i += size;
    if (i < 0 || i >= size)
      throw EvalFailure(fmt::format("index {} out of range", i));
    if (target.is_array())
      return target[static_cast<std::size_t>(i)];
    return std::string(
        1, target.get_ref<const std::string &>()[static_cast<std::size_t>(i)]);
  }

private:
  NodePtr target_;
  NodePtr index_;
};

class CallNode : public Node {
public:
  CallNode(std::string name, const FunctionSpec &fn,
           std::vector<NodePtr> args)
      : name_(std::move(name)), fn_(fn), args_(std::move(args)) {}
  json eval(const EvalContext &ctx) const override {
    std::vector<json> values;
    values.reserve(args_.size());
    for (const auto &arg : args_)
      values.push_back(arg->eval(ctx));
    try {
      return fn_.fn(values, ctx);
    } catch (const EvalFailure &ex) {
      throw EvalFailure(name_ + ": " + ex.what());
    }
  }

private:
  std::string name_;
  const FunctionSpec &fn_;
  std::vector<NodePtr> args_;
};

// ---------------------------------------------------------------------------
// Tokenizer and recursive-descent parser
// ---------------------------------------------------------------------------

enum class Tok {
  Number,
  String,
  Ident,
  Op,
  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  Dot,
  Question,
  Colon,
  End
};

struct Token {
  Tok type;
  std::string text;
  std::size_t pos;
};

class Parser {
public:
  explicit Parser(const std::string &source) : source_(source) {
    tokenize();
  }

  NodePtr parse() {
    NodePtr root = parse_conditional();
    if (peek().type != Tok::End)
      fail("unexpected '" + peek().text + "'", peek().pos);
    return root;
  }

private:
  [[noreturn]] void fail(const std::string &message, std::size_t pos) const {
    throw SimulationError(fmt::format("Invalid expression '{}': {} at column {}",
                                      source_, message, pos + 1));
  }

  void tokenize() {
    static const char *kTwoCharOps[] = {"**", "//", "==", "!=", "<=",
                                        ">=", "&&", "||"};
    std::size_t i = 0;
    const std::size_t n = source_.size();
    while (i < n) {
      char c = source_[i];
      if (std::isspace(static_cast<unsigned char>(c))) {
        ++i;
        continue;
      }
      std::size_t start = i;
      if (std::isdigit(static_cast<unsigned char>(c)) ||
          (c == '.' && i + 1 < n &&
           std::isdigit(static_cast<unsigned char>(source_[i + 1])))) {
        while (i < n && (std::isdigit(static_cast<unsigned char>(source_[i])) ||
                         source_[i] == '.'))
          ++i;
        if (i < n && (source_[i] == 'e' || source_[i] == 'E')) {
          std::size_t j = i + 1;
          if (j < n && (source_[j] == '+' || source_[j] == '-'))
            ++j;
          if (j < n && std::isdigit(static_cast<unsigned char>(source_[j]))) {
            i = j;
            while (i < n && std::isdigit(static_cast<unsigned char>(source_[i])))
              ++i;
          }
        }
        tokens_.push_back({Tok::Number, source_.substr(start, i - start), start});
        continue;
      }
      if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        while (i < n && (std::isalnum(static_cast<unsigned char>(source_[i])) ||
                         source_[i] == '_'))
          ++i;
        tokens_.push_back({Tok::Ident, source_.substr(start, i - start), start});
        continue;
      }
      if (c == '"' || c == '\'') {
        std::string text;
        ++i;
        bool closed = false;
        while (i < n) {
          char ch = source_[i++];
          if (ch == c) {
            closed = true;
            break;
          }
          if (ch == '\\' && i < n) {
            char esc = source_[i++];
            switch (esc) {
            case 'n':
              text += '\n';
              break;
            case 't':
              text += '\t';
              break;
            default:
              text += esc;
            }
            continue;
          }
          text += ch;
        }
        if (!closed)
          fail("unterminated string", start);
        tokens_.push_back({Tok::String, text, start});
        continue;
      }

      bool matched = false;
      for (const char *op : kTwoCharOps) {
        if (source_.compare(i, 2, op) == 0) {
          tokens_.push_back({Tok::Op, op, start});
          i += 2;
          matched = true;
          break;
        }
      }
      if (matched)
        continue;

      switch (c) {
      case '(':
        tokens_.push_back({Tok::LParen, "(", start});
        break;
      case ')':
        tokens_.push_back({Tok::RParen, ")", start});
        break;
      case '[':
        tokens_.push_back({Tok::LBracket, "[", start});
        break;
      case ']':
        tokens_.push_back({Tok::RBracket, "]", start});
        break;
      case ',':
        tokens_.push_back({Tok::Comma, ",", start});
        break;
      case '.':
        tokens_.push_back({Tok::Dot, ".", start});
        break;
      case '?':
        tokens_.push_back({Tok::Question, "?", start});
        break;
      case ':':
        tokens_.push_back({Tok::Colon, ":", start});
        break;
      case '+':
      case '-':
      case '*':
      case '/':
      case '%':
      case '<':
      case '>':
      case '!':
        tokens_.push_back({Tok::Op, std::string(1, c), start});
        break;
      default:
        fail(fmt::format("unexpected character '{}'", c), start);
      }
      ++i;
    }
    tokens_.push_back({Tok::End, "end of input", n});
  }

  const Token &peek(std::size_t ahead = 0) const {
    std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[idx];
  }

  Token next() {
    Token t = peek();
    if (pos_ < tokens_.size() - 1)
      ++pos_;
    return t;
  }

  bool accept_op(const char *op) {
    if (peek().type == Tok::Op && peek().text == op) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool accept_keyword(const char *word) {
    if (peek().type == Tok::Ident && peek().text == word) {
      ++pos_;
      return true;
    }
    return false;
  }

  void expect(Tok type, const char *what) {
    if (peek().type != type)
      fail(std::string("expected ") + what + ", got '" + peek().text + "'",
           peek().pos);
    ++pos_;
  }

  NodePtr parse_conditional() {
    NodePtr cond = parse_or();
    if (peek().type == Tok::Question) {
      next();
      NodePtr if_true = parse_conditional();
      expect(Tok::Colon, "':'");
      NodePtr if_false = parse_conditional();
      return std::make_unique<ConditionalNode>(
          std::move(cond), std::move(if_true), std::move(if_false));
    }
    return cond;
  }

  NodePtr parse_or() {
    NodePtr lhs = parse_and();
    while (accept_keyword("or") || accept_op("||")) {
      lhs = std::make_unique<LogicalNode>(false, std::move(lhs), parse_and());
    }
    return lhs;
  }

  NodePtr parse_and() {
    NodePtr lhs = parse_not();
    while (accept_keyword("and") || accept_op("&&")) {
      lhs = std::make_unique<LogicalNode>(true, std::move(lhs), parse_not());
    }
    return lhs;
  }

  NodePtr parse_not() {
    if (accept_keyword("not") || accept_op("!")) {
      return std::make_unique<UnaryNode>("not", parse_not());
    }
    return parse_comparison();
  }

  NodePtr parse_comparison() {
    static const char *kOps[] = {"==", "!=", "<=", ">=", "<", ">"};
    std::vector<NodePtr> operands;
    std::vector<std::string> ops;
    operands.push_back(parse_additive());
    for (;;) {
      bool matched = false;
      for (const char *op : kOps) {
        if (accept_op(op)) {
          ops.emplace_back(op);
          operands.push_back(parse_additive());
          matched = true;
          break;
        }
      }
      if (!matched)
        break;
    }
    if (ops.empty())
      return std::move(operands[0]);
    return std::make_unique<ComparisonNode>(std::move(operands),
                                            std::move(ops));
  }

  NodePtr parse_additive() {
    NodePtr lhs = parse_term();
    for (;;) {
      if (accept_op("+"))
        lhs = std::make_unique<BinaryNode>("+", std::move(lhs), parse_term());
      else if (accept_op("-"))
        lhs = std::make_unique<BinaryNode>("-", std::move(lhs), parse_term());
      else
        return lhs;
    }
  }

  NodePtr parse_term() {
    NodePtr lhs = parse_unary();
    for (;;) {
      std::string op;
      if (accept_op("*"))
        op = "*";
      else if (accept_op("//"))
        op = "//";
      else if (accept_op("/"))
        op = "/";
      else if (accept_op("%"))
        op = "%";
      else
        return lhs;
      lhs = std::make_unique<BinaryNode>(op, std::move(lhs), parse_unary());
    }
  }

  NodePtr parse_unary() {
    if (accept_op("-"))
      return std::make_unique<UnaryNode>("-", parse_unary());
    if (accept_op("+"))
      return std::make_unique<UnaryNode>("+", parse_unary());
    return parse_power();
  }

  NodePtr parse_power() {
    NodePtr base = parse_postfix();
    if (accept_op("**")) {
      // right associative, binds tighter than a unary minus on its left
      return std::make_unique<BinaryNode>("**", std::move(base), parse_unary());
    }
    return base;
  }

  NodePtr parse_postfix() {
    NodePtr node = parse_primary();
    while (peek().type == Tok::LBracket) {
      next();
      NodePtr index = parse_conditional();
      expect(Tok::RBracket, "']'");
      node = std::make_unique<IndexNode>(std::move(node), std::move(index));
    }
    return node;
  }

  NodePtr parse_primary() {
    const Token tok = peek();
    switch (tok.type) {
    case Tok::Number: {
      next();
      auto value = parse_number(tok.text);
      if (!value)
        fail("malformed number '" + tok.text + "'", tok.pos);
      return std::make_unique<LiteralNode>(*value);
    }
    case Tok::String:
      next();
      return std::make_unique<LiteralNode>(tok.text);
    case Tok::LParen: {
      next();
      NodePtr inner = parse_conditional();
      expect(Tok::RParen, "')'");
      return inner;
    }
    case Tok::LBracket: {
      next();
      std::vector<NodePtr> items;
      if (peek().type != Tok::RBracket) {
        items.push_back(parse_conditional());
        while (peek().type == Tok::Comma) {
          next();
          items.push_back(parse_conditional());
        }
      }
      expect(Tok::RBracket, "']'");
      return std::make_unique<ListNode>(std::move(items));
    }
    case Tok::Ident:
      return parse_name();
    default:
      fail("unexpected '" + tok.text + "'", tok.pos);
    }
  }

  NodePtr parse_name() {
    const Token head = next();

    if (head.text == "true" || head.text == "True")
      return std::make_unique<LiteralNode>(true);
    if (head.text == "false" || head.text == "False")
      return std::make_unique<LiteralNode>(false);
    if (head.text == "none" || head.text == "None" || head.text == "null")
      return std::make_unique<LiteralNode>(nullptr);

    std::vector<std::string> parts{head.text};
    while (peek().type == Tok::Dot && peek(1).type == Tok::Ident) {
      next();
      parts.push_back(next().text);
    }
    std::string dotted = parts[0];
    for (std::size_t i = 1; i < parts.size(); ++i)
      dotted += "." + parts[i];

    if (peek().type == Tok::LParen) {
      const auto &table = function_table();
      auto it = table.find(dotted);
      if (it == table.end())
        fail("unknown function '" + dotted + "'", head.pos);
      next();
      std::vector<NodePtr> args;
      if (peek().type != Tok::RParen) {
        args.push_back(parse_conditional());
        while (peek().type == Tok::Comma) {
          next();
          args.push_back(parse_conditional());
        }
      }
      expect(Tok::RParen, "')'");
      if (args.size() < it->second.min_args ||
          args.size() > it->second.max_args) {
        fail(fmt::format("{}() takes {}..{} arguments, got {}", dotted,
                         it->second.min_args, it->second.max_args,
                         args.size()),
             head.pos);
      }
      return std::make_unique<CallNode>(dotted, it->second, std::move(args));
    }

    if (parts[0] == "state") {
      if (parts.size() > 1)
        return std::make_unique<StateRefNode>(dotted.substr(6));
      if (peek().type != Tok::LBracket)
        fail("'state' must be followed by a key", head.pos);
      next();
      NodePtr key = parse_conditional();
      expect(Tok::RBracket, "']'");
      return std::make_unique<StateIndexNode>(std::move(key));
    }

    if (parts.size() == 1 && parts[0].size() > 1 && parts[0][0] == 'g' &&
        std::all_of(parts[0].begin() + 1, parts[0].end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
      if (parts[0].size() > kMaxCaptureDigits + 1)
        fail("capture index out of range", head.pos);
      std::size_t index = std::stoul(parts[0].substr(1));
      if (index == 0)
        fail("captures are numbered from g1", head.pos);
      return std::make_unique<CaptureNode>(index);
    }

    const auto &constants = constant_table();
    auto it = constants.find(dotted);
    if (it != constants.end())
      return std::make_unique<LiteralNode>(it->second);

    fail("unknown name '" + dotted + "'", head.pos);
  }

  const std::string &source_;
  std::vector<Token> tokens_;
  std::size_t pos_{0};
};

} // namespace
} // namespace detail

// ---------------------------------------------------------------------------
// Expression
// ---------------------------------------------------------------------------

Expression::Expression(std::string source, std::unique_ptr<detail::Node> root)
    : source_(std::move(source)), root_(std::move(root)) {}

Expression::~Expression() = default;

std::shared_ptr<const Expression>
Expression::compile(const std::string &source) {
  detail::Parser parser(source);
  auto root = parser.parse();
  return std::shared_ptr<const Expression>(
      new Expression(source, std::move(root)));
}

json Expression::evaluate(const EvalContext &ctx) const {
  try {
    return root_->eval(ctx);
  } catch (const std::exception &ex) {
    throw SimulationError(
        fmt::format("Expression '{}' failed: {}", source_, ex.what()));
  }
}

bool Expression::evaluate_condition(const EvalContext &ctx) const {
  return truthy(evaluate(ctx));
}

std::vector<std::string> Expression::function_names() {
  std::vector<std::string> names;
  for (const auto &[name, _] : function_table())
    names.push_back(name);
  return names;
}

std::optional<json> parse_number(const std::string &text) {
  std::string s = text;
  auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  if (s.empty())
    return std::nullopt;
  if (std::none_of(s.begin(), s.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; }))
    return std::nullopt;
  if (s.find_first_not_of("0123456789+-.eE") != std::string::npos)
    return std::nullopt;

  bool looks_integer = s.find_first_of(".eE") == std::string::npos;
  if (looks_integer) {
    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() + s.size() && errno != ERANGE)
      return json(static_cast<int64_t>(value));
  }

  errno = 0;
  char *end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE)
    return std::nullopt;
  return json(value);
}

int64_t checked_add(int64_t a, int64_t b) {
  if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
      (b < 0 && a < std::numeric_limits<int64_t>::min() - b))
    throw SimulationError(fmt::format("integer overflow in {} + {}", a, b));
  return a + b;
}

int64_t checked_sub(int64_t a, int64_t b) {
  if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) ||
      (b > 0 && a < std::numeric_limits<int64_t>::min() + b))
    throw SimulationError(fmt::format("integer overflow in {} - {}", a, b));
  return a - b;
}

int64_t checked_mul(int64_t a, int64_t b) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  bool overflow = false;
  if (a > 0) {
    overflow = b > 0 ? a > kMax / b : b < kMin / a;
  } else if (a < 0) {
    overflow = b > 0 ? a < kMin / b : (b != 0 && a < kMax / b);
  }
  if (overflow)
    throw SimulationError(fmt::format("integer overflow in {} * {}", a, b));
  return a * b;
}

int64_t to_int64(double value) {
  // 2^63 is exact as a double; int64 covers [-2^63, 2^63)
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(value) || value < -kLimit || value >= kLimit)
    throw SimulationError(
        fmt::format("integer overflow converting {} to int", value));
  return static_cast<int64_t>(std::trunc(value));
}

bool truthy(const json &value) {
  if (value.is_null())
    return false;
  if (value.is_boolean())
    return value.get<bool>();
  if (value.is_number())
    return value.get<double>() != 0.0;
  if (value.is_string()) {
    std::string lower = value.get<std::string>();
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return !(lower.empty() || lower == "0" || lower == "false" ||
             lower == "off" || lower == "no");
  }
  return !value.empty();
}

std::string format_value(const json &value) {
  if (value.is_null())
    return "";
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_boolean())
    return value.get<bool>() ? "1" : "0";
  if (value.is_number_unsigned())
    return std::to_string(value.get<uint64_t>());
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (std::isnan(d))
      return "nan";
    if (std::isinf(d))
      return d > 0 ? "inf" : "-inf";
    std::string text = fmt::format("{}", d);
    if (text.find_first_of(".e") == std::string::npos)
      text += ".0";
    return text;
  }
  if (value.is_array()) {
    std::string out;
    for (std::size_t i = 0; i < value.size(); ++i) {
      if (i > 0)
        out += ",";
      out += format_value(value[i]);
    }
    return out;
  }
  return value.dump();
}

} // namespace sim
} // namespace instsim
