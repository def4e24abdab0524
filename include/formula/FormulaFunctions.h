#ifndef FORMULA_FUNCTIONS_H
#define FORMULA_FUNCTIONS_H

/**
 * @file FormulaFunctions.h
 * @brief Closed registry of built-in formula functions
 *
 * The tokenizer consults the registry to tell function names from bare
 * column names; the evaluator dispatches on FormulaFunctionId. Adding a
 * function means adding a row to the table in FormulaFunctions.cpp and a
 * case to FormulaEvaluator::callFunction().
 *
 * ── Aggregation ──     SUM AVG COUNT MIN MAX DISTINCT
 * ── Conditional ──     IF SWITCH COALESCE
 * ── Text ──            CONCATENATE/CONCAT LEFT RIGHT MID LEN UPPER LOWER
 *                       TRIM REPLACE SUBSTITUTE
 * ── Math ──            ROUND FLOOR CEIL/CEILING ABS POWER/POW SQRT MOD
 *                       LOG LOG10 EXP
 * ── Date ──            YEAR MONTH DAY TODAY NOW DATEDIFF DATEADD
 * ── Type conversion ── TEXT VALUE INT FLOAT
 * ── Logical ──         AND OR NOT TRUE FALSE
 */

#include <QString>
#include <QStringList>

enum class FormulaFunctionId {
    // Aggregation
    Sum, Avg, Count, Min, Max, Distinct,
    // Conditional
    If, Switch, Coalesce,
    // Text
    Concatenate, Left, Right, Mid, Len, Upper, Lower, Trim, Replace, Substitute,
    // Math
    Round, Floor, Ceil, Abs, Power, Sqrt, Mod, Log, Log10, Exp,
    // Date
    Year, Month, Day, Today, Now, DateDiff, DateAdd,
    // Type conversion
    Text, Value, Int, Float,
    // Logical
    And, Or, Not, True, False
};

enum class FunctionCategory {
    Aggregation,
    Conditional,
    Text,
    Math,
    Date,
    TypeConversion,
    Logical
};

struct FormulaFunctionInfo {
    const char        *name;      // canonical upper-case spelling
    FormulaFunctionId  id;        // aliases share an id (CONCAT → Concatenate)
    FunctionCategory   category;
};

class FormulaFunctions {
public:
    // Lookup by name (case-insensitive). nullptr when not a function.
    static const FormulaFunctionInfo *find(const QString &name);
    static bool isFunction(const QString &name) { return find(name) != nullptr; }

    // SUM AVG COUNT MIN MAX DISTINCT
    static bool isAggregate(FormulaFunctionId id);

    static QStringList names();
    static QStringList names(FunctionCategory category);
    static QString categoryName(FunctionCategory category);
};

#endif // FORMULA_FUNCTIONS_H
