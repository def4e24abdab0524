#include <QtTest>
#include "formula/FormulaTokenizer.h"

class TestFormulaTokenizer : public QObject {
    Q_OBJECT

private slots:
    // Literals
    void testIntegerAndDecimal();
    void testLeadingDotNumber();
    void testSecondDotStartsNewToken();
    void testDoubleQuotedString();
    void testSingleQuotedStringWithEscape();
    void testMismatchedQuoteDoesNotClose();

    // Column references
    void testBracketedColumn();
    void testBareIdentifierIsColumn();

    // Functions and booleans
    void testFunctionNameUpperCased();
    void testTrueFalseFoldToNumbers();
    void testTrueCallStaysFunction();

    // Operators and punctuation
    void testTwoCharOperators();
    void testSingleCharOperators();
    void testPunctuation();

    // Leniency
    void testUnknownCharactersSkipped();
    void testEmptyInputYieldsEnd();
    void testPositions();
};

void TestFormulaTokenizer::testIntegerAndDecimal() {
    auto tokens = FormulaTokenizer::tokenize("42 3.14");
    QCOMPARE(tokens.size(), 3);
    QCOMPARE(tokens[0].type, FormulaToken::Number);
    QCOMPARE(tokens[0].numVal, 42.0);
    QCOMPARE(tokens[1].type, FormulaToken::Number);
    QCOMPARE(tokens[1].numVal, 3.14);
    QCOMPARE(tokens[2].type, FormulaToken::End);
}

void TestFormulaTokenizer::testLeadingDotNumber() {
    auto tokens = FormulaTokenizer::tokenize(".5");
    QCOMPARE(tokens.size(), 2);
    QCOMPARE(tokens[0].type, FormulaToken::Number);
    QCOMPARE(tokens[0].numVal, 0.5);
}

void TestFormulaTokenizer::testSecondDotStartsNewToken() {
    auto tokens = FormulaTokenizer::tokenize("1.2.3");
    QCOMPARE(tokens.size(), 3);
    QCOMPARE(tokens[0].numVal, 1.2);
    QCOMPARE(tokens[1].numVal, 0.3);
}

void TestFormulaTokenizer::testDoubleQuotedString() {
    auto tokens = FormulaTokenizer::tokenize("\"hello world\"");
    QCOMPARE(tokens[0].type, FormulaToken::String);
    QCOMPARE(tokens[0].strVal, QString("hello world"));
}

void TestFormulaTokenizer::testSingleQuotedStringWithEscape() {
    auto tokens = FormulaTokenizer::tokenize("'it\\'s'");
    QCOMPARE(tokens.size(), 2);
    QCOMPARE(tokens[0].type, FormulaToken::String);
    QCOMPARE(tokens[0].strVal, QString("it's"));
}

void TestFormulaTokenizer::testMismatchedQuoteDoesNotClose() {
    // A single quote inside a double-quoted string is plain text
    auto tokens = FormulaTokenizer::tokenize("\"a'b\"");
    QCOMPARE(tokens.size(), 2);
    QCOMPARE(tokens[0].strVal, QString("a'b"));
}

void TestFormulaTokenizer::testBracketedColumn() {
    auto tokens = FormulaTokenizer::tokenize("[Unit Price]");
    QCOMPARE(tokens[0].type, FormulaToken::ColumnRef);
    QCOMPARE(tokens[0].strVal, QString("Unit Price"));
    QVERIFY(tokens[0].bracketed);
}

void TestFormulaTokenizer::testBareIdentifierIsColumn() {
    auto tokens = FormulaTokenizer::tokenize("revenue_2024");
    QCOMPARE(tokens[0].type, FormulaToken::ColumnRef);
    QCOMPARE(tokens[0].strVal, QString("revenue_2024"));
    QVERIFY(!tokens[0].bracketed);
}

void TestFormulaTokenizer::testFunctionNameUpperCased() {
    auto tokens = FormulaTokenizer::tokenize("sum(");
    QCOMPARE(tokens[0].type, FormulaToken::Function);
    QCOMPARE(tokens[0].strVal, QString("SUM"));
    QCOMPARE(tokens[1].type, FormulaToken::LParen);
}

void TestFormulaTokenizer::testTrueFalseFoldToNumbers() {
    auto tokens = FormulaTokenizer::tokenize("TRUE false");
    QCOMPARE(tokens.size(), 3);
    QCOMPARE(tokens[0].type, FormulaToken::Number);
    QCOMPARE(tokens[0].numVal, 1.0);
    QCOMPARE(tokens[1].type, FormulaToken::Number);
    QCOMPARE(tokens[1].numVal, 0.0);
}

void TestFormulaTokenizer::testTrueCallStaysFunction() {
    auto tokens = FormulaTokenizer::tokenize("TRUE ()");
    QCOMPARE(tokens[0].type, FormulaToken::Function);
    QCOMPARE(tokens[0].strVal, QString("TRUE"));
}

void TestFormulaTokenizer::testTwoCharOperators() {
    auto tokens = FormulaTokenizer::tokenize("<> <= >=");
    QCOMPARE(tokens.size(), 4);
    QCOMPARE(tokens[0].strVal, QString("<>"));
    QCOMPARE(tokens[1].strVal, QString("<="));
    QCOMPARE(tokens[2].strVal, QString(">="));
}

void TestFormulaTokenizer::testSingleCharOperators() {
    auto tokens = FormulaTokenizer::tokenize("+-*/%^&=<>");
    // "<>" at the end is one token
    QCOMPARE(tokens.size(), 10);
    QStringList ops;
    for (int i = 0; i < tokens.size() - 1; ++i) {
        QCOMPARE(tokens[i].type, FormulaToken::Operator);
        ops << tokens[i].strVal;
    }
    QCOMPARE(ops, QStringList({"+", "-", "*", "/", "%", "^", "&", "=", "<>"}));
}

void TestFormulaTokenizer::testPunctuation() {
    auto tokens = FormulaTokenizer::tokenize("(,)");
    QCOMPARE(tokens[0].type, FormulaToken::LParen);
    QCOMPARE(tokens[1].type, FormulaToken::Comma);
    QCOMPARE(tokens[2].type, FormulaToken::RParen);
    QCOMPARE(tokens[3].type, FormulaToken::End);
}

void TestFormulaTokenizer::testUnknownCharactersSkipped() {
    auto tokens = FormulaTokenizer::tokenize("1 # 2 @");
    QCOMPARE(tokens.size(), 3);
    QCOMPARE(tokens[0].numVal, 1.0);
    QCOMPARE(tokens[1].numVal, 2.0);
}

void TestFormulaTokenizer::testEmptyInputYieldsEnd() {
    auto tokens = FormulaTokenizer::tokenize("   ");
    QCOMPARE(tokens.size(), 1);
    QCOMPARE(tokens[0].type, FormulaToken::End);
    QCOMPARE(tokens[0].position, 3);
}

void TestFormulaTokenizer::testPositions() {
    auto tokens = FormulaTokenizer::tokenize("[a] + 'x'");
    QCOMPARE(tokens[0].position, 0);
    QCOMPARE(tokens[1].position, 4);
    QCOMPARE(tokens[2].position, 6);
}

QTEST_MAIN(TestFormulaTokenizer)
#include "test_formula_tokenizer.moc"
