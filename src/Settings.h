#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>

#include <memory>

//! Application preferences, kept with QSettings. The ledger's own config lives in the database instead.
class Settings
{
public:
    const QString &databasePath() const { return m_databasePath; }
    const QString &defaultFormat() const { return m_defaultFormat; }

    //! Loads the preferences from the INI file \a fileName, or from the platform's default location if it is empty.
    static void init(const QString &fileName = {});
    static Settings *instance() { return s_instance; }

    static QString defaultDatabasePath();

private:
    explicit Settings(const QString &fileName);

    std::unique_ptr<QSettings> open() const;
    void load();
    void save();

    QString m_fileName;
    QString m_databasePath;
    QString m_defaultFormat;

    static inline Settings *s_instance;
};

#endif // SETTINGS_H
