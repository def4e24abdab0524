#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QMap>
#include <QString>
#include <QStringList>

class QTextStream;

/**
 * @brief INI-style configuration reader
 *
 *   # comment            ; comment
 *   [FORMULA]
 *   debug = true
 *   max_depth = 200
 *
 * Keys that appear before any section header land in "DEFAULT".
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath, QString *errorMsg = nullptr);

    // Load configuration from in-memory INI text
    void loadFromString(const QString &text);

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;

    bool hasSection(const QString &section) const { return m_config.contains(section); }

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }

    // Logging
    QString getLogDir() const;
    bool getLogDebug() const;

private:
    bool m_loaded;
    QMap<QString, QMap<QString, QString>> m_config;

    void parse(QTextStream &in);
};

#endif // CONFIGLOADER_H
