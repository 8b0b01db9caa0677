#include "Settings.h"

#include <QDir>

#include "Logger.h"

namespace logs = Stamp::logs;

Settings::Settings(const QString &fileName)
    : m_fileName{fileName}
{
    load();
}

void Settings::init(const QString &fileName)
{
    if (s_instance)
        delete s_instance;
    s_instance = new Settings{fileName};
}

QString Settings::defaultDatabasePath()
{
    return QDir::home().filePath(QStringLiteral(".stamp/stamp.db"));
}

std::unique_ptr<QSettings> Settings::open() const
{
    if (m_fileName.isEmpty())
        return std::make_unique<QSettings>();
    return std::make_unique<QSettings>(m_fileName, QSettings::IniFormat);
}

void Settings::load()
{
    auto settings = open();

    settings->beginGroup(QStringLiteral("app"));
    const bool firstRun = !settings->contains(QStringLiteral("databasePath"));
    m_databasePath = settings->value(QStringLiteral("databasePath"), defaultDatabasePath()).toString();
    m_defaultFormat = settings->value(QStringLiteral("defaultFormat"), QStringLiteral("table")).toString();
    settings->endGroup();

    logs::app()->trace("Loaded preferences from {}", settings->fileName().toStdString());

    // write the defaults out so there is a file to edit
    if (firstRun)
        save();
}

void Settings::save()
{
    auto settings = open();

    settings->beginGroup(QStringLiteral("app"));
    settings->setValue(QStringLiteral("databasePath"), m_databasePath);
    settings->setValue(QStringLiteral("defaultFormat"), m_defaultFormat);
    settings->endGroup();

    settings->sync();
    if (settings->status() != QSettings::NoError)
        logs::app()->warn("Could not save preferences to {}", settings->fileName().toStdString());
    else
        logs::app()->trace("Saved preferences to {}", settings->fileName().toStdString());
}
