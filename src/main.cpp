#include "data/CsvTableLoader.h"
#include "formula/FormulaEngine.h"
#include "formula/FormulaFunctions.h"
#include "formula/FormulaOptions.h"
#include "utils/ConfigLoader.h"
#include "utils/FileLogger.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <cstdio>

namespace {

// Explicit --config wins; otherwise the first existing candidate
QString findConfigFile(const QString &explicitPath)
{
    if (!explicitPath.isEmpty())
        return explicitPath;

    QString appDir = QCoreApplication::applicationDirPath();

    QStringList candidates;
    QString appConfigDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (!appConfigDir.isEmpty())
        candidates << QDir(appConfigDir).filePath("sheetcalc.ini");
    candidates << QDir(appDir).filePath("../config/sheetcalc.ini");
    candidates << QDir(appDir).filePath("config/sheetcalc.ini");

    for (const QString &path : candidates) {
        if (QFileInfo::exists(path))
            return path;
    }
    return QString();
}

// "Name=FORMULA" → {Name, FORMULA}; the formula may itself contain '='
bool parseColumnDefinition(const QString &definition, ComputedColumn &out)
{
    int equalPos = definition.indexOf('=');
    if (equalPos <= 0)
        return false;
    out.name = definition.left(equalPos).trimmed();
    out.formula = definition.mid(equalPos + 1).trimmed();
    return !out.name.isEmpty() && !out.formula.isEmpty();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("sheetcalc");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Compute spreadsheet-style formula columns over a CSV table");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption inputOption({"i", "input"}, "CSV file to read.", "file");
    QCommandLineOption columnOption({"c", "column"},
                                    "Computed column as \"Name=FORMULA\" (repeatable).",
                                    "name=formula");
    QCommandLineOption configOption("config", "INI configuration file.", "file");
    QCommandLineOption validateOption("validate", "Only validate the formulas.");
    QCommandLineOption inferOption("infer", "Only print each formula's inferred type.");
    QCommandLineOption functionsOption("functions", "List the formula functions by category.");
    parser.addOption(inputOption);
    parser.addOption(columnOption);
    parser.addOption(configOption);
    parser.addOption(validateOption);
    parser.addOption(inferOption);
    parser.addOption(functionsOption);
    parser.process(app);

    // ── Configuration + logging ──
    ConfigLoader config;
    QString configPath = findConfigFile(parser.value(configOption));
    if (!configPath.isEmpty()) {
        QString error;
        if (!config.load(configPath, &error) && parser.isSet(configOption)) {
            fprintf(stderr, "%s\n", qPrintable(error));
            return 1;
        }
    }
    setupFileLogging(config.getLogDir(), config.getLogDebug());

    FormulaOptions options = FormulaOptions::fromConfig(config);
    FormulaEngine engine(options);

    if (parser.isSet(functionsOption)) {
        QTextStream out(stdout);
        const FunctionCategory categories[] = {
            FunctionCategory::Aggregation, FunctionCategory::Conditional,
            FunctionCategory::Text,        FunctionCategory::Math,
            FunctionCategory::Date,        FunctionCategory::TypeConversion,
            FunctionCategory::Logical};
        for (FunctionCategory category : categories) {
            out << FormulaFunctions::categoryName(category) << ": "
                << FormulaFunctions::names(category).join(", ") << "\n";
        }
        out.flush();
        cleanupFileLogging();
        return 0;
    }

    if (!parser.isSet(inputOption)) {
        qCritical() << "[sheetcalc] --input is required";
        cleanupFileLogging();
        return 1;
    }

    QVector<ComputedColumn> computed;
    for (const QString &definition : parser.values(columnOption)) {
        ComputedColumn column;
        if (!parseColumnDefinition(definition, column)) {
            qCritical() << "[sheetcalc] Invalid --column (expected Name=FORMULA):" << definition;
            cleanupFileLogging();
            return 1;
        }
        computed.append(column);
    }

    DataTable table;
    QString loadError;
    if (!CsvTableLoader::loadFile(parser.value(inputOption), table, &loadError)) {
        qCritical() << "[sheetcalc]" << loadError;
        cleanupFileLogging();
        return 1;
    }

    QTextStream out(stdout);
    int status = 0;

    if (parser.isSet(validateOption)) {
        // Later columns may reference earlier ones
        QVector<TableColumn> columns = table.columns;
        for (const ComputedColumn &column : computed) {
            ValidationResult result = engine.validate(column.formula, columns);
            if (result.valid) {
                out << column.name << ": ok\n";
            } else {
                out << column.name << ": " << result.error << "\n";
                status = 2;
            }
            TableColumn placeholder;
            placeholder.id = makeColumnId(static_cast<int>(columns.size()), column.name);
            placeholder.name = column.name;
            placeholder.isComputed = true;
            placeholder.formula = column.formula;
            columns.append(placeholder);
        }
        if (status != 0)
            qWarning() << "[sheetcalc] Input columns:" << table.columnNames().join(", ");
    } else if (parser.isSet(inferOption)) {
        DataTable working = table;
        for (const ComputedColumn &column : computed) {
            ColumnType type = engine.inferType(column.formula, working.columns, working.rows);
            out << column.name << ": " << columnTypeName(type) << "\n";
            const QStringList errors = engine.applyComputedColumns(working, {column});
            for (const QString &error : errors)
                qWarning() << "[sheetcalc]" << error;
        }
    } else {
        QStringList errors = engine.applyComputedColumns(table, computed);
        for (const QString &error : errors)
            qWarning() << "[sheetcalc]" << error;
        out << CsvTableLoader::toCsv(table) << "\n";
    }

    out.flush();
    cleanupFileLogging();
    return status;
}
