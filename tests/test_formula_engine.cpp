#include <QtTest>
#include "formula/FormulaEngine.h"
#include "formula/FormulaFunctions.h"

class TestFormulaEngine : public QObject {
    Q_OBJECT

private slots:
    void init();

    // compile
    void testCompileOk();
    void testCompileErrorGivesLiteralZero();
    void testCompileIsDeterministic();
    void testCompileIgnoresTrailingTokens();
    void testCompiledFlatChainAlwaysEvaluates();

    // evaluate / evaluateString
    void testEvaluateSwallowsErrors();
    void testEvaluateStringCompileErrorIsNull();
    void testEvaluateStringWithAllRows();

    // computeColumn
    void testComputeColumnUsesAllRows();
    void testComputeColumnLengthOnSyntaxError();
    void testComputeColumnRowFailuresAreLocal();
    void testComputeColumnParallelMatchesSequential();
    void testComputeColumnSameWithDebug();

    // validate
    void testValidateUnknownColumn();
    void testValidateSyntaxError();
    void testValidateDoesNotEvaluate();

    // inferType
    void testInferNumber();
    void testInferZeroOneIsNumber();
    void testInferNativeBoolean();
    void testInferDate();
    void testInferString();
    void testInferSampleSize();

    // introspection / pipeline
    void testReferencedColumns();
    void testApplyComputedColumns();
    void testApplyComputedColumnsReportsErrors();

    // Registry / type names
    void testFunctionRegistry();
    void testColumnTypeNames();

private:
    QVector<TableColumn> m_columns;
    QVector<TableRow> m_rows;
};

void TestFormulaEngine::init() {
    m_columns.clear();
    m_rows.clear();

    TableColumn region;
    region.id = "col_0_region";
    region.name = "Region";
    TableColumn revenue;
    revenue.id = "col_1_revenue";
    revenue.name = "Revenue";
    revenue.type = ColumnType::Number;
    TableColumn active;
    active.id = "col_2_active";
    active.name = "Active";
    active.type = ColumnType::Boolean;
    TableColumn opened;
    opened.id = "col_3_opened";
    opened.name = "Opened";
    opened.type = ColumnType::Date;
    m_columns << region << revenue << active << opened;

    m_rows << TableRow{{"col_0_region", "North"}, {"col_1_revenue", 1500.0},
                       {"col_2_active", true}, {"col_3_opened", "2023-04-01"}};
    m_rows << TableRow{{"col_0_region", "South"}, {"col_1_revenue", 500.0},
                       {"col_2_active", false}, {"col_3_opened", "2023-06-15"}};
    m_rows << TableRow{{"col_0_region", "East"}, {"col_1_revenue", 2000.0},
                       {"col_2_active", true}, {"col_3_opened", "2024-01-10"}};
}

// ═══════════════════════════════════════════════════════════
// compile
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testCompileOk() {
    FormulaEngine engine;
    CompileResult result = engine.compile("IF([Revenue]>1000,\"High\",SUM([Revenue])*1.1)");
    QVERIFY(result.ok());
    QVERIFY(result.ast);
    QCOMPARE(result.ast->kind, FormulaNode::Kind::Conditional);
}

void TestFormulaEngine::testCompileErrorGivesLiteralZero() {
    FormulaEngine engine;
    CompileResult result = engine.compile("1 +");
    QVERIFY(!result.ok());
    QVERIFY(result.error.contains("position"));
    QVERIFY(result.ast);
    QCOMPARE(result.ast->kind, FormulaNode::Kind::NumberLiteral);
    QCOMPARE(result.ast->number, 0.0);
}

void TestFormulaEngine::testCompileIsDeterministic() {
    FormulaEngine engine;
    const QString formula = "ROUND([Revenue] / SUM([Revenue]) * 100, 1) & \"%\"";
    CompileResult a = engine.compile(formula);
    CompileResult b = engine.compile(formula);
    QCOMPARE(a.ast->toString(), b.ast->toString());
    for (const TableRow &row : m_rows)
        QCOMPARE(engine.evaluate(*a.ast, row, m_columns, &m_rows),
                 engine.evaluate(*b.ast, row, m_columns, &m_rows));
}

void TestFormulaEngine::testCompileIgnoresTrailingTokens() {
    FormulaEngine engine;
    CompileResult result = engine.compile("[Revenue]*2)");
    QVERIFY(result.ok());
    QCOMPARE(result.ast->toString(), QString("(* [Revenue] 2)"));

    ComputeResult column = engine.computeColumn("[Revenue]*2)", m_rows, m_columns);
    QVERIFY(column.error.isEmpty());
    QCOMPARE(column.values[1].toDouble(), 1000.0);
    QVERIFY(engine.validate("[Region] [Ghost]", m_columns).valid);
}

void TestFormulaEngine::testCompiledFlatChainAlwaysEvaluates() {
    // Under the default limit of 200 levels
    FormulaEngine engine;
    const QString sum200 = QString("1+").repeated(199) + "1";
    CompileResult ok = engine.compile(sum200);
    QVERIFY(ok.ok());
    QVERIFY(engine.validate(sum200, m_columns).valid);
    QCOMPARE(engine.evaluate(*ok.ast, m_rows[0], m_columns).toDouble(), 200.0);

    CompileResult tooDeep = engine.compile(sum200 + "+1");
    QVERIFY(!tooDeep.ok());
    QVERIFY(tooDeep.error.startsWith("Formula nested too deeply"));
    QVERIFY(!engine.validate(sum200 + "+1", m_columns).valid);

    FormulaOptions options;
    options.maxDepth = 300;
    FormulaEngine roomy(options);
    const QString sum250 = QString("[Revenue]/[Revenue]+").repeated(249) + "1";
    ComputeResult column = roomy.computeColumn(sum250, m_rows, m_columns);
    QVERIFY(column.error.isEmpty());
    for (const QVariant &value : column.values)
        QCOMPARE(value.toDouble(), 250.0);
}

// ═══════════════════════════════════════════════════════════
// evaluate / evaluateString
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testEvaluateSwallowsErrors() {
    FormulaEngine engine;
    CompileResult result = engine.compile("[Missing] * 2");
    QVERIFY(result.ok());
    QVERIFY(!engine.evaluate(*result.ast, m_rows[0], m_columns).isValid());
}

void TestFormulaEngine::testEvaluateStringCompileErrorIsNull() {
    FormulaEngine engine;
    QVERIFY(!engine.evaluateString("IF(1,2)", m_rows[0], m_columns).isValid());
    QCOMPARE(engine.evaluateString("[Region] & \"!\"", m_rows[0], m_columns).toString(),
             QString("North!"));
}

void TestFormulaEngine::testEvaluateStringWithAllRows() {
    FormulaEngine engine;
    QCOMPARE(engine.evaluateString("SUM([Revenue])", m_rows[0], m_columns, &m_rows).toDouble(),
             4000.0);
    QCOMPARE(engine.evaluateString("SUM([Revenue])", m_rows[0], m_columns).toDouble(), 1500.0);
}

// ═══════════════════════════════════════════════════════════
// computeColumn
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testComputeColumnUsesAllRows() {
    FormulaEngine engine;
    ComputeResult result = engine.computeColumn("[Revenue] / SUM([Revenue])", m_rows, m_columns);
    QVERIFY(result.error.isEmpty());
    QCOMPARE(result.values.size(), 3);
    QCOMPARE(result.values[0].toDouble(), 0.375);
    QCOMPARE(result.values[1].toDouble(), 0.125);
    QCOMPARE(result.values[2].toDouble(), 0.5);
}

void TestFormulaEngine::testComputeColumnLengthOnSyntaxError() {
    FormulaEngine engine;
    ComputeResult result = engine.computeColumn("((", m_rows, m_columns);
    QVERIFY(!result.error.isEmpty());
    QCOMPARE(result.values.size(), m_rows.size());
    for (const QVariant &v : result.values)
        QVERIFY(!v.isValid());

    ComputeResult empty = engine.computeColumn("1+", QVector<TableRow>(), m_columns);
    QCOMPARE(empty.values.size(), 0);
}

void TestFormulaEngine::testComputeColumnRowFailuresAreLocal() {
    // Only the South row takes the branch that fails
    FormulaEngine engine;
    ComputeResult result = engine.computeColumn(
        "IF([Region]=\"South\", [Nope], [Revenue])", m_rows, m_columns);
    QVERIFY(result.error.isEmpty());
    QCOMPARE(result.values.size(), 3);
    QCOMPARE(result.values[0].toDouble(), 1500.0);
    QVERIFY(!result.values[1].isValid());
    QCOMPARE(result.values[2].toDouble(), 2000.0);
}

void TestFormulaEngine::testComputeColumnParallelMatchesSequential() {
    QVector<TableRow> rows;
    for (int i = 0; i < 200; ++i)
        rows << TableRow{{"col_0_region", QString("R%1").arg(i % 7)},
                         {"col_1_revenue", double(i * 13 % 101)}};

    const QString formula = "IF([Revenue] > AVG([Revenue]), [Region] & \"+\", [Revenue] - MIN([Revenue]))";

    FormulaEngine sequential;
    FormulaOptions options;
    options.parallelThreshold = 50;
    FormulaEngine parallel(options);

    ComputeResult a = sequential.computeColumn(formula, rows, m_columns);
    ComputeResult b = parallel.computeColumn(formula, rows, m_columns);
    QCOMPARE(a.values.size(), rows.size());
    QCOMPARE(b.values, a.values);
}

void TestFormulaEngine::testComputeColumnSameWithDebug() {
    // Row 1 fails on [Nope]; row 2 divides by zero
    QVector<TableRow> rows = m_rows;
    rows[2].insert("col_1_revenue", 0.0);
    const QString formula = "IF([Region]=\"South\", [Nope], 100 / [Revenue]) & \"\"";

    FormulaEngine quiet;
    FormulaOptions options;
    options.debug = true;
    FormulaEngine verbose(options);

    ComputeResult a = quiet.computeColumn(formula, rows, m_columns);
    ComputeResult b = verbose.computeColumn(formula, rows, m_columns);
    QCOMPARE(b.values, a.values);
    QCOMPARE(b.error, a.error);
    QVERIFY(!a.values[1].isValid());
    QCOMPARE(a.values[2].toString(), QString("Infinity"));

    ComputeResult brokenA = quiet.computeColumn("SUM(", rows, m_columns);
    ComputeResult brokenB = verbose.computeColumn("SUM(", rows, m_columns);
    QCOMPARE(brokenB.values, brokenA.values);
    QCOMPARE(brokenB.error, brokenA.error);
}

// ═══════════════════════════════════════════════════════════
// validate
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testValidateUnknownColumn() {
    FormulaEngine engine;
    ValidationResult result = engine.validate("[NoSuchCol]+1", m_columns);
    QVERIFY(!result.valid);
    QVERIFY(result.error.contains("NoSuchCol"));

    ValidationResult ok = engine.validate("revenue * 2 + LEN([region])", m_columns);
    QVERIFY(ok.valid);
    QVERIFY(ok.error.isEmpty());
}

void TestFormulaEngine::testValidateSyntaxError() {
    FormulaEngine engine;
    ValidationResult result = engine.validate("IF([Revenue]>1, 2)", m_columns);
    QVERIFY(!result.valid);
    QVERIFY(result.error.startsWith("Expected Comma"));
}

void TestFormulaEngine::testValidateDoesNotEvaluate() {
    // Wrong arity is only an evaluation problem; validation passes
    FormulaEngine engine;
    QVERIFY(engine.validate("LEFT([Region])", m_columns).valid);
    // Every branch is checked, not just the taken one
    QVERIFY(!engine.validate("IF(1, [Revenue], [Ghost])", m_columns).valid);
}

// ═══════════════════════════════════════════════════════════
// inferType
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testInferNumber() {
    FormulaEngine engine;
    QCOMPARE(engine.inferType("[Revenue] * 1.18", m_columns, m_rows), ColumnType::Number);
}

void TestFormulaEngine::testInferZeroOneIsNumber() {
    FormulaEngine engine;
    QCOMPARE(engine.inferType("[Revenue] > 1000", m_columns, m_rows), ColumnType::Number);
}

void TestFormulaEngine::testInferNativeBoolean() {
    FormulaEngine engine;
    QCOMPARE(engine.inferType("[Active]", m_columns, m_rows), ColumnType::Boolean);
}

void TestFormulaEngine::testInferDate() {
    FormulaEngine engine;
    QCOMPARE(engine.inferType("[Opened]", m_columns, m_rows), ColumnType::Date);
    QCOMPARE(engine.inferType("DATEADD([Opened], 30)", m_columns, m_rows), ColumnType::Date);
}

void TestFormulaEngine::testInferString() {
    FormulaEngine engine;
    QCOMPARE(engine.inferType("UPPER([Region])", m_columns, m_rows), ColumnType::String);
    QCOMPARE(engine.inferType("[Missing]", m_columns, m_rows), ColumnType::String);
    QCOMPARE(engine.inferType("1+", m_columns, m_rows), ColumnType::String);
    QCOMPARE(engine.inferType("1", m_columns, QVector<TableRow>()), ColumnType::String);
}

void TestFormulaEngine::testInferSampleSize() {
    // The first row yields a number, the second one text
    QVector<TableRow> rows;
    rows << TableRow{{"col_1_revenue", 5.0}} << TableRow{{"col_1_revenue", -5.0}};
    const QString formula = "IF([Revenue] > 0, [Revenue], \"loss\")";

    FormulaOptions options;
    options.sampleSize = 1;
    QCOMPARE(FormulaEngine(options).inferType(formula, m_columns, rows), ColumnType::Number);
    QCOMPARE(FormulaEngine().inferType(formula, m_columns, rows), ColumnType::String);
}

// ═══════════════════════════════════════════════════════════
// Introspection / computed-column pipeline
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testReferencedColumns() {
    FormulaEngine engine;
    QCOMPARE(engine.referencedColumns("[B] + A * [B] + SUM([C])"),
             QStringList({"B", "A", "C"}));
    QVERIFY(engine.referencedColumns("[A] +").isEmpty());
}

void TestFormulaEngine::testApplyComputedColumns() {
    DataTable table;
    table.columns = m_columns;
    table.rows = m_rows;

    FormulaEngine engine;
    QStringList errors = engine.applyComputedColumns(table, {
        {"Share %", "ROUND([Revenue] / SUM([Revenue]) * 100, 1)"},
        {"Tier", "IF([Share %] >= 40, \"Top\", \"Other\")"},
    });
    QVERIFY(errors.isEmpty());
    QCOMPARE(table.columns.size(), 6);

    const TableColumn &share = table.columns[4];
    QCOMPARE(share.id, QString("col_4_share__"));
    QCOMPARE(share.name, QString("Share %"));
    QCOMPARE(share.type, ColumnType::Number);
    QVERIFY(share.isComputed);

    const TableColumn &tier = table.columns[5];
    QCOMPARE(tier.id, QString("col_5_tier"));
    QCOMPARE(tier.type, ColumnType::String);

    QCOMPARE(table.rows[0].value("col_4_share__").toDouble(), 37.5);
    QCOMPARE(table.rows[2].value("col_4_share__").toDouble(), 50.0);
    QCOMPARE(table.rows[0].value("col_5_tier").toString(), QString("Other"));
    QCOMPARE(table.rows[2].value("col_5_tier").toString(), QString("Top"));
}

void TestFormulaEngine::testApplyComputedColumnsReportsErrors() {
    DataTable table;
    table.columns = m_columns;
    table.rows = m_rows;

    FormulaEngine engine;
    QStringList errors = engine.applyComputedColumns(table, {{"Broken", "SUM("}});
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().startsWith("Broken: "));

    // The column still exists, with null values
    QCOMPARE(table.columns.size(), 5);
    for (const TableRow &row : table.rows) {
        QVERIFY(row.contains("col_4_broken"));
        QVERIFY(!row.value("col_4_broken").isValid());
    }
}

// ═══════════════════════════════════════════════════════════
// Registry / type names
// ═══════════════════════════════════════════════════════════

void TestFormulaEngine::testFunctionRegistry() {
    const FormulaFunctionInfo *concat = FormulaFunctions::find("concat");
    QVERIFY(concat);
    QCOMPARE(concat->id, FormulaFunctionId::Concatenate);
    QCOMPARE(concat->category, FunctionCategory::Text);
    QVERIFY(!FormulaFunctions::isFunction("VLOOKUP"));

    QVERIFY(FormulaFunctions::isAggregate(FormulaFunctionId::Distinct));
    QVERIFY(!FormulaFunctions::isAggregate(FormulaFunctionId::Round));

    QStringList aggregates = FormulaFunctions::names(FunctionCategory::Aggregation);
    QCOMPARE(aggregates, QStringList({"SUM", "AVG", "COUNT", "MIN", "MAX", "DISTINCT"}));
    QCOMPARE(FormulaFunctions::categoryName(FunctionCategory::TypeConversion),
             QString("type conversion"));
    QVERIFY(FormulaFunctions::names().contains("DATEADD"));
}

void TestFormulaEngine::testColumnTypeNames() {
    QCOMPARE(columnTypeName(ColumnType::Boolean), QString("boolean"));
    QCOMPARE(columnTypeName(ColumnType::Date), QString("date"));
}

QTEST_MAIN(TestFormulaEngine)
#include "test_formula_engine.moc"
