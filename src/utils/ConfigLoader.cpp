#include "utils/ConfigLoader.h"
#include <QDebug>
#include <QFile>
#include <QTextStream>

ConfigLoader::ConfigLoader()
    : m_loaded(false)
{
}

ConfigLoader::~ConfigLoader()
{
}

bool ConfigLoader::load(const QString &filePath, QString *errorMsg)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QString error = QString("Failed to open config file: %1 (%2)")
                            .arg(filePath, file.errorString());
        qWarning() << "[ConfigLoader]" << error;
        if (errorMsg)
            *errorMsg = error;
        return false;
    }

    QTextStream in(&file);
    parse(in);
    file.close();

    qDebug() << "[ConfigLoader] Configuration loaded from:" << filePath;
    qDebug() << "[ConfigLoader]   Sections found:" << m_config.keys();
    return true;
}

void ConfigLoader::loadFromString(const QString &text)
{
    QString copy = text;
    QTextStream in(&copy, QIODevice::ReadOnly);
    parse(in);
}

void ConfigLoader::parse(QTextStream &in)
{
    QString currentSection;

    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();

        // Skip empty lines and comments
        if (line.isEmpty() || line.startsWith('#') || line.startsWith(';')) {
            continue;
        }

        // Check for section header [SECTION]
        if (line.startsWith('[') && line.endsWith(']')) {
            currentSection = line.mid(1, line.length() - 2).trimmed();
            if (!m_config.contains(currentSection)) {
                m_config[currentSection] = QMap<QString, QString>();
            }
            continue;
        }

        // Parse key = value pairs
        int equalPos = line.indexOf('=');
        if (equalPos > 0) {
            QString key = line.left(equalPos).trimmed();
            QString value = line.mid(equalPos + 1).trimmed();

            // Store in default section if no section defined yet
            if (currentSection.isEmpty()) {
                currentSection = "DEFAULT";
            }

            m_config[currentSection][key] = value;
        }
    }

    m_loaded = true;
}

QString ConfigLoader::getValue(const QString &section, const QString &key, const QString &defaultValue) const
{
    auto sectionIt = m_config.constFind(section);
    if (sectionIt != m_config.constEnd()) {
        auto keyIt = sectionIt->constFind(key);
        if (keyIt != sectionIt->constEnd())
            return keyIt.value();
    }
    return defaultValue;
}

int ConfigLoader::getInt(const QString &section, const QString &key, int defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        int result = value.toInt(&ok);
        if (ok) return result;
        qWarning() << "[ConfigLoader] Not an integer:" << section << key << value;
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const QString &section, const QString &key, bool defaultValue) const
{
    QString value = getValue(section, key).toLower();
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    } else if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return defaultValue;
}

QString ConfigLoader::getLogDir() const
{
    return getValue("LOGGING", "log_dir");
}

bool ConfigLoader::getLogDebug() const
{
    return getBool("LOGGING", "debug", false);
}
