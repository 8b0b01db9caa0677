#ifndef LEDGER_H
#define LEDGER_H

#include <QDate>
#include <QList>
#include <QPair>
#include <QStringList>

#include "MergePolicy.h"
#include "OvertimeAggregator.h"
#include "Selector.h"

class RecordStore;

//! A day with at least one of start, end or break never set.
struct IncompleteDay
{
    QDate date;
    //! Column names of the missing fields, in the order start_time, end_time, break_minutes.
    QStringList missingFields;
};

//! The operations the command line works with. Writes go through MergePolicy into the store, reads through Selector
//! and OvertimeAggregator.
class Ledger
{
public:
    explicit Ledger(RecordStore &store, int currentYear = QDate::currentDate().year());

    void addOrUpdateDay(const QDate &date, const DayUpdate &update, bool overwrite);
    qint64 addNote(const QDate &date, const QString &text);
    void removeNote(qint64 id);
    void removeDay(const QDate &date);

    QList<DayReport> queryDays(const Filter &filter, bool includeNotes) const;
    QList<IncompleteDay> listIncomplete() const;

    //! Throws Stamp::NotFoundError if \a key is not set.
    QString getSetting(const QString &key) const;
    void setSetting(const QString &key, const QString &value);
    void deleteSetting(const QString &key);
    QList<QPair<QString, QString>> settings() const;

    //! The configured workday length, or the default if the setting is missing or not a number.
    double expectedWorkdayHours() const;

    RecordStore &store() { return m_store; }

private:
    RecordStore &m_store;
    int m_currentYear;
};

#endif // LEDGER_H
