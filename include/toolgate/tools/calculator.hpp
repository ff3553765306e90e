#pragma once
#include "toolgate/tools/tool.hpp"

#include <string>
#include <vector>

namespace toolgate::tools
{

/// Names accepted by calculate(), in display order
const std::vector<std::string>& calculator_operations();

/// Apply a binary arithmetic operation.
/// Division or modulo by zero and unknown operations yield {"success": false, ...}.
Json calculate(const std::string& operation, double a, double b);

/// Evaluate an arithmetic expression such as "sqrt(16) + 2 ** 3".
///
/// Operators: + - * / // % ** and parentheses. Names: pi, e and the functions abs, round,
/// min, max, sum, pow, sqrt, sin, cos, tan, log, log10, exp. Integer-valued input stays
/// integral where the operation preserves it. Any other name, a syntax error or a domain
/// error yields {"success": false, "error", "hint"}.
Json evaluate_expression(const std::string& expression);

/// "calculate" tool: arguments {operation, a, b}
Tool make_calculator_tool();

/// "advanced_calculate" tool: arguments {expression}
Tool make_expression_tool();

} // namespace toolgate::tools
