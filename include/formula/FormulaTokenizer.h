#ifndef FORMULA_TOKENIZER_H
#define FORMULA_TOKENIZER_H

#include <QString>
#include <QVector>

// ═══════════════════════════════════════════════════════════════════
// TOKEN: classified lexical unit of a formula
// ═══════════════════════════════════════════════════════════════════

struct FormulaToken {
    enum Type {
        Number,       // 42, 3.14, .5, plus TRUE / FALSE folded to 1 / 0
        String,       // "text" or 'text', backslash escapes the next char
        Function,     // registered function name, upper-cased
        Operator,     // + - * / % ^ & = <> < > <= >=
        LParen,       // (
        RParen,       // )
        Comma,        // ,
        ColumnRef,    // [Column Name] or a bare identifier
        End           // end of formula
    };

    Type    type = End;
    double  numVal = 0.0;       // Number
    QString strVal;             // String / Function / Operator / ColumnRef
    int     position = 0;       // source offset of the first character
    bool    bracketed = false;  // ColumnRef written as [..]

    static QString typeName(Type type);
};

// ═══════════════════════════════════════════════════════════════════
// TOKENIZER
// ═══════════════════════════════════════════════════════════════════

class FormulaTokenizer {
public:
    // Total: never fails. Characters that start no token are skipped.
    // The result always ends with exactly one End token.
    static QVector<FormulaToken> tokenize(const QString &formula);

private:
    static bool isIdentStart(QChar ch);
    static bool isIdentChar(QChar ch);
    static bool nextNonSpaceIs(const QString &formula, int pos, QChar expected);
};

#endif // FORMULA_TOKENIZER_H
