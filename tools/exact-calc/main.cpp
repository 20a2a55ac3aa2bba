// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file exact-calc/main.cpp
 * @brief Command-line calculator on exact rational numbers
 *
 * Usage examples:
 *   - Normalize a value:                  exact-calc 6/8
 *   - Binary operation:                   exact-calc "1 1/2" + 0.25
 *   - Decimal output with 40 digits:      exact-calc -F D40 1 / 7
 *   - Show the continued fraction:        exact-calc --continued 415/93
 *   - Load formatting defaults:           exact-calc -o options.json 2 pow 100
 *
 * Supported operators: + - * (or x) / % mod pow min max cmp
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>
#include <CLI/CLI.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <exact/ContinuedFraction.hpp>
#include <exact/Exception.hpp>
#include <exact/Options.hpp>
#include <exact/Rational.hpp>
#include <exact/exact.h>

namespace
{
    /**
     * @brief Apply a binary operator to two values
     *
     * @return The result, or std::nullopt if the operator is unknown
     */
    std::optional<exact::Rational> evaluate(exact::Rational const& in_lhs, std::string const& in_op, exact::Rational const& in_rhs)
    {
        if (in_op == "+")
        {
            return in_lhs + in_rhs;
        }
        if (in_op == "-")
        {
            return in_lhs - in_rhs;
        }
        if ((in_op == "*") || (in_op == "x"))
        {
            return in_lhs * in_rhs;
        }
        if (in_op == "/")
        {
            return in_lhs / in_rhs;
        }
        if (in_op == "%")
        {
            return in_lhs % in_rhs;
        }
        if (in_op == "mod")
        {
            return exact::modulo(in_lhs, in_rhs);
        }
        if (in_op == "pow")
        {
            return exact::pow(in_lhs, in_rhs.toInteger<std::int64_t>());
        }
        if (in_op == "min")
        {
            return exact::min(in_lhs, in_rhs);
        }
        if (in_op == "max")
        {
            return exact::max(in_lhs, in_rhs);
        }
        if (in_op == "cmp")
        {
            return exact::Rational{in_lhs.compareTo(in_rhs)};
        }
        return std::nullopt;
    }

    void printError(std::string const& in_message)
    {
        if (::isatty(STDERR_FILENO) != 0)
        {
            std::cerr << fmt::format(fmt::fg(fmt::color::red), "ERROR") << ": " << in_message << std::endl;
        }
        else
        {
            std::cerr << "ERROR: " << in_message << std::endl;
        }
    }

    /**
     * @brief Print the result and the requested extra views of it
     */
    void printResult(exact::Rational const& in_value, exact::Options const& in_options, std::string const& in_format, bool in_continued,
        bool in_double)
    {
        auto const text = in_format.empty() ? in_value.toString(in_options) : in_value.toString(in_format);
        std::cout << text << '\n';

        if (in_continued)
        {
            auto terms = std::vector<std::string>{};
            for (auto const& term : exact::toContinuedForm(in_value))
            {
                terms.push_back(term.str());
            }
            std::cout << fmt::format("{: >12}: [{}]", "Continued", fmt::join(terms, ", ")) << '\n';
        }

        if (in_double)
        {
            std::cout << fmt::format("{: >12}: {}", "Double", in_value.toDouble()) << '\n';
        }
    }
}

/**
 * @brief Main entry point for exact-calc
 *
 * Accepts either a single operand (printed in normalized form) or
 * "<lhs> <op> <rhs>".
 *
 * @return EXIT_SUCCESS or EXIT_FAILURE
 */
int main(int argc, char** argv)
{
    auto app = CLI::App{"exact-calc"};
    app.footer("Operands: integers (-42), fractions (3/4), decimals (1.5e-3) or mixed numbers (\"3 1/2\").\n"
               "Operators: + - * / % (x is an alias of *) mod pow min max cmp\n"
               "Put -- before the expression when the first operand is negative.");

    auto version = ::exactVersionType{};
    ::exactGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto format = std::string{};
    app.add_option("-F,--format", format, "Output format: F, D<n> or W (overrides the options file)");

    auto optionsFile = std::string{};
    app.add_option("-o,--options", optionsFile, "JSON options file")->check(CLI::ExistingFile);

    auto continued = false;
    app.add_flag("-c,--continued", continued, "Also print the continued fraction of the result");

    auto asDouble = false;
    app.add_flag("-d,--double", asDouble, "Also print the nearest double of the result");

    auto expression = std::vector<std::string>{};
    app.add_option("EXPRESSION", expression, "<value> or <lhs> <op> <rhs>")->required()->expected(1, 3);

    CLI11_PARSE(app, argc, argv);

    try
    {
        auto const options = optionsFile.empty() ? exact::Options{} : exact::Options::fromFile(optionsFile);

        if (expression.size() == 2)
        {
            printError("Expected <value> or <lhs> <op> <rhs>.");
            return EXIT_FAILURE;
        }

        auto result = exact::Rational::parse(expression.at(0));
        if (expression.size() == 3)
        {
            auto const rhs = exact::Rational::parse(expression.at(2));
            auto const evaluated = evaluate(result, expression.at(1), rhs);
            if (!evaluated)
            {
                printError(fmt::format("Unknown operator '{}'.", expression.at(1)));
                return EXIT_FAILURE;
            }
            result = *evaluated;
        }

        printResult(result, options, format, continued, asDouble);
    }
    catch (exact::Exception const& e)
    {
        printError(fmt::format("{} ({})", e.what(), ::exactStatusToString(e.status())));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
