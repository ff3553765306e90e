#include "toolgate/tools/calculator.hpp"

#include "toolgate/exceptions.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

namespace toolgate::tools
{

namespace
{
double number_arg(const Json& args, const char* key)
{
    if (!args.contains(key) || !args[key].is_number())
        throw ValidationError(std::string("argument '") + key + "' must be a number");
    return args[key].get<double>();
}

// Result takes the sign of the divisor
double floored_mod(double a, double b)
{
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0) != (b < 0)))
        r += b;
    return r;
}

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

// Bound on nested unary/power/parenthesis levels, well inside the default thread stack
constexpr size_t kMaxNesting = 200;

struct Value
{
    double v{0};
    bool integral{false};
};

/// Recursive-descent evaluator over a restricted arithmetic grammar:
///   expr    := term (('+' | '-') term)*
///   term    := unary (('*' | '/' | '//' | '%') unary)*
///   unary   := ('+' | '-') unary | power
///   power   := primary ('**' unary)?
///   primary := number | name | name '(' args ')' | '(' expr ')'
class ExpressionParser
{
  public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    Value parse()
    {
        Value v = expr();
        skip_space();
        if (pos_ != text_.size())
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        return v;
    }

  private:
    [[noreturn]] void fail(const std::string& message) const
    {
        throw ValidationError(message + " at position " + std::to_string(pos_));
    }

    void skip_space()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    bool accept(const char* token)
    {
        skip_space();
        const std::string t(token);
        if (text_.compare(pos_, t.size(), t) != 0)
            return false;
        // "*" must not swallow the first half of "**", "/" likewise for "//"
        if (t.size() == 1 && (t[0] == '*' || t[0] == '/') && pos_ + 1 < text_.size() &&
            text_[pos_ + 1] == t[0])
            return false;
        pos_ += t.size();
        return true;
    }

    static Value checked(double v, bool integral)
    {
        if (std::isnan(v))
            throw ValidationError("math domain error");
        if (std::isinf(v))
            throw ValidationError("result out of range");
        return Value{v, integral};
    }

    Value expr()
    {
        Value lhs = term();
        for (;;)
        {
            if (accept("+"))
            {
                Value rhs = term();
                lhs = checked(lhs.v + rhs.v, lhs.integral && rhs.integral);
            }
            else if (accept("-"))
            {
                Value rhs = term();
                lhs = checked(lhs.v - rhs.v, lhs.integral && rhs.integral);
            }
            else
                return lhs;
        }
    }

    Value term()
    {
        Value lhs = unary();
        for (;;)
        {
            if (accept("*"))
            {
                Value rhs = unary();
                lhs = checked(lhs.v * rhs.v, lhs.integral && rhs.integral);
            }
            else if (accept("//"))
            {
                Value rhs = unary();
                if (rhs.v == 0)
                    throw ValidationError("division by zero");
                lhs = checked(std::floor(lhs.v / rhs.v), lhs.integral && rhs.integral);
            }
            else if (accept("/"))
            {
                Value rhs = unary();
                if (rhs.v == 0)
                    throw ValidationError("division by zero");
                lhs = checked(lhs.v / rhs.v, false);
            }
            else if (accept("%"))
            {
                Value rhs = unary();
                if (rhs.v == 0)
                    throw ValidationError("modulo by zero");
                lhs = checked(floored_mod(lhs.v, rhs.v), lhs.integral && rhs.integral);
            }
            else
                return lhs;
        }
    }

    // Parentheses, call arguments, signs and '**' all recurse through here
    Value unary()
    {
        if (++depth_ > kMaxNesting)
            throw ValidationError("expression nested too deeply");
        Value v;
        if (accept("-"))
        {
            const Value operand = unary();
            v = Value{-operand.v, operand.integral};
        }
        else if (accept("+"))
            v = unary();
        else
            v = power();
        --depth_;
        return v;
    }

    Value power()
    {
        Value base = primary();
        if (!accept("**"))
            return base;
        Value exponent = unary();
        if (base.v == 0 && exponent.v < 0)
            throw ValidationError("zero cannot be raised to a negative power");
        return checked(std::pow(base.v, exponent.v),
                       base.integral && exponent.integral && exponent.v >= 0);
    }

    Value primary()
    {
        skip_space();
        if (pos_ >= text_.size())
            fail("unexpected end of expression");

        const char c = text_[pos_];
        if (c == '(')
        {
            ++pos_;
            Value v = expr();
            if (!accept(")"))
                fail("expected ')'");
            return v;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.')
            return number();
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
            return name();
        fail("unexpected '" + std::string(1, c) + "'");
    }

    Value number()
    {
        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        const double v = std::strtod(begin, &end);
        if (end == begin)
            fail("invalid number");
        const std::string literal(begin, static_cast<size_t>(end - begin));
        pos_ += literal.size();
        const bool integral = literal.find_first_of(".eE") == std::string::npos;
        return Value{v, integral};
    }

    Value name()
    {
        const size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_'))
            ++pos_;
        const std::string id = text_.substr(start, pos_ - start);

        if (!accept("("))
        {
            if (id == "pi")
                return Value{kPi, false};
            if (id == "e")
                return Value{kE, false};
            throw ValidationError("name '" + id + "' is not defined");
        }

        std::vector<Value> args;
        if (!accept(")"))
        {
            do
                args.push_back(expr());
            while (accept(","));
            if (!accept(")"))
                fail("expected ')'");
        }
        return call(id, args);
    }

    static void arity(const std::string& fn, const std::vector<Value>& args, size_t min,
                      size_t max)
    {
        if (args.size() < min || args.size() > max)
            throw ValidationError(fn + "() takes " + std::to_string(min) +
                                  (max != min ? " to " + std::to_string(max) : std::string()) +
                                  " arguments (" + std::to_string(args.size()) + " given)");
    }

    static Value call(const std::string& fn, const std::vector<Value>& args)
    {
        if (fn == "abs")
        {
            arity(fn, args, 1, 1);
            return Value{std::fabs(args[0].v), args[0].integral};
        }
        if (fn == "round")
        {
            arity(fn, args, 1, 2);
            if (args.size() == 1)
                return checked(std::nearbyint(args[0].v), true);
            const double scale = std::pow(10.0, args[1].v);
            return checked(std::nearbyint(args[0].v * scale) / scale, args[0].integral);
        }
        if (fn == "min" || fn == "max" || fn == "sum")
        {
            arity(fn, args, fn == "sum" ? 0 : 1, static_cast<size_t>(-1));
            bool integral = true;
            double acc = fn == "sum" ? 0 : args[0].v;
            for (const auto& a : args)
            {
                integral = integral && a.integral;
                if (fn == "sum")
                    acc += a.v;
                else if (fn == "min")
                    acc = std::min(acc, a.v);
                else
                    acc = std::max(acc, a.v);
            }
            return checked(acc, integral);
        }
        if (fn == "pow")
        {
            arity(fn, args, 2, 2);
            return checked(std::pow(args[0].v, args[1].v),
                           args[0].integral && args[1].integral && args[1].v >= 0);
        }
        if (fn == "log")
        {
            arity(fn, args, 1, 2);
            if (args[0].v <= 0 || (args.size() == 2 && (args[1].v <= 0 || args[1].v == 1)))
                throw ValidationError("math domain error");
            const double v = std::log(args[0].v);
            return checked(args.size() == 2 ? v / std::log(args[1].v) : v, false);
        }

        using Unary = double (*)(double);
        static const std::vector<std::pair<std::string, Unary>> unary = {
            {"sqrt", [](double x) { return std::sqrt(x); }},
            {"sin", [](double x) { return std::sin(x); }},
            {"cos", [](double x) { return std::cos(x); }},
            {"tan", [](double x) { return std::tan(x); }},
            {"log10", [](double x) { return x <= 0 ? std::nan("") : std::log10(x); }},
            {"exp", [](double x) { return std::exp(x); }},
        };
        for (const auto& [name, f] : unary)
        {
            if (name == fn)
            {
                arity(fn, args, 1, 1);
                return checked(f(args[0].v), false);
            }
        }
        throw ValidationError("name '" + fn + "' is not defined");
    }

    const std::string& text_;
    size_t pos_{0};
    size_t depth_{0};
};
} // namespace

const std::vector<std::string>& calculator_operations()
{
    static const std::vector<std::string> ops = {"add",    "subtract", "multiply",
                                                 "divide", "power",    "modulo"};
    return ops;
}

Json calculate(const std::string& operation, double a, double b)
{
    double result = 0;
    if (operation == "add")
        result = a + b;
    else if (operation == "subtract")
        result = a - b;
    else if (operation == "multiply")
        result = a * b;
    else if (operation == "divide" || operation == "modulo")
    {
        if (b == 0)
            return Json{{"success", false}, {"error", "Division by zero"}};
        result = operation == "divide" ? a / b : floored_mod(a, b);
    }
    else if (operation == "power")
        result = std::pow(a, b);
    else
        return Json{{"success", false},
                    {"error", "Unknown operation: " + operation},
                    {"available_operations", calculator_operations()}};

    if (!std::isfinite(result))
        return Json{{"success", false}, {"error", "Result is not a finite number"}};

    return Json{{"success", true}, {"operation", operation}, {"a", a}, {"b", b},
                {"result", result}};
}

Json evaluate_expression(const std::string& expression)
{
    try
    {
        const Value v = ExpressionParser(expression).parse();
        Json result = v.integral && std::fabs(v.v) < 9.0e15
                          ? Json(static_cast<long long>(v.v))
                          : Json(v.v);
        return Json{{"success", true}, {"expression", expression}, {"result", result}};
    }
    catch (const ValidationError& e)
    {
        return Json{{"success", false},
                    {"error", e.what()},
                    {"hint", "Ensure your expression uses only allowed functions and operators"}};
    }
}

Tool make_calculator_tool()
{
    Json schema = {
        {"type", "object"},
        {"properties",
         Json{{"operation", Json{{"type", "string"}, {"enum", calculator_operations()}}},
              {"a", Json{{"type", "number"}}},
              {"b", Json{{"type", "number"}}}}},
        {"required", Json::array({"operation", "a", "b"})}};

    return Tool("calculate", "Perform mathematical calculations", schema,
                [](const Json& args)
                {
                    if (!args.contains("operation") || !args["operation"].is_string())
                        throw ValidationError("argument 'operation' must be a string");
                    return calculate(args["operation"].get<std::string>(),
                                     number_arg(args, "a"), number_arg(args, "b"));
                });
}

Tool make_expression_tool()
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"expression", Json{{"type", "string"}}}}},
                   {"required", Json::array({"expression"})}};

    return Tool("advanced_calculate", "Evaluate a mathematical expression", schema,
                [](const Json& args)
                {
                    if (!args.contains("expression") || !args["expression"].is_string())
                        throw ValidationError("argument 'expression' must be a string");
                    return evaluate_expression(args["expression"].get<std::string>());
                });
}

} // namespace toolgate::tools

