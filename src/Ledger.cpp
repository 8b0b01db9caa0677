#include "Ledger.h"

#include "Errors.h"
#include "Logger.h"
#include "RecordStore.h"
#include "Utils.h"

namespace logs = Stamp::logs;

Ledger::Ledger(RecordStore &store, int currentYear)
    : m_store{store},
      m_currentYear{currentYear}
{}

void Ledger::addOrUpdateDay(const QDate &date, const DayUpdate &update, bool overwrite)
{
    auto policy = MergePolicy::fromOverwriteFlag(overwrite);
    auto existing = m_store.get(date);
    auto merged = policy.apply(date, existing, update);

    if (existing && *existing == merged)
    {
        logs::app()->debug("Day {} unchanged", merged.key().toStdString());
        return;
    }

    m_store.upsert(merged);
    logs::app()->info("{} day {} ({})",
                      existing ? "Updated" : "Added",
                      merged.key().toStdString(),
                      overwrite ? "overwrite" : "fill gaps");
}

qint64 Ledger::addNote(const QDate &date, const QString &text)
{
    return m_store.addNote(date, text);
}

void Ledger::removeNote(qint64 id)
{
    m_store.removeNote(id);
    logs::app()->info("Removed note {}", id);
}

void Ledger::removeDay(const QDate &date)
{
    m_store.remove(date);
    logs::app()->info("Removed day {}", Stamp::dateKey(date).toStdString());
}

QList<DayReport> Ledger::queryDays(const Filter &filter, bool includeNotes) const
{
    OvertimeAggregator aggregator{expectedWorkdayHours()};
    return Selector{m_store, m_currentYear}.select(filter, includeNotes, aggregator);
}

QList<IncompleteDay> Ledger::listIncomplete() const
{
    QList<IncompleteDay> incomplete;
    for (const auto &record : m_store.allRecords())
    {
        QStringList missing;
        if (!record.startTime())
            missing << QStringLiteral("start_time");
        if (!record.endTime())
            missing << QStringLiteral("end_time");
        if (!record.breakMinutes())
            missing << QStringLiteral("break_minutes");

        if (!missing.isEmpty())
            incomplete.append({record.date(), missing});
    }
    return incomplete;
}

QString Ledger::getSetting(const QString &key) const
{
    if (auto value = m_store.setting(key); value)
        return *value;

    throw Stamp::NotFoundError{"No config value set for key " + key.toStdString()};
}

void Ledger::setSetting(const QString &key, const QString &value)
{
    m_store.setSetting(key, value);
    logs::app()->info("Set {} = {}", key.toStdString(), value.toStdString());
}

void Ledger::deleteSetting(const QString &key)
{
    m_store.removeSetting(key);
    logs::app()->info("Removed config key {}", key.toStdString());
}

QList<QPair<QString, QString>> Ledger::settings() const
{
    return m_store.settings();
}

double Ledger::expectedWorkdayHours() const
{
    auto value = m_store.setting(Stamp::expectedWorkdayHoursKey);
    if (!value)
    {
        logs::app()->warn("{} is not set, using {}",
                          Stamp::expectedWorkdayHoursKey.toStdString(),
                          Stamp::defaultExpectedWorkdayHours);
        return Stamp::defaultExpectedWorkdayHours;
    }

    auto hours = Stamp::parseNumber(*value);
    if (!hours)
    {
        logs::app()->warn("{} = \"{}\" is not a number, using {}",
                          Stamp::expectedWorkdayHoursKey.toStdString(),
                          value->toStdString(),
                          Stamp::defaultExpectedWorkdayHours);
        return Stamp::defaultExpectedWorkdayHours;
    }
    return *hours;
}
