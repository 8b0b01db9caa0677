#ifndef SELECTOR_H
#define SELECTOR_H

#include <QDate>
#include <QList>

#include <optional>

#include "OvertimeAggregator.h"

class RecordStore;

//! Which days a query returns. Exactly one kind is active per filter.
class Filter
{
public:
    enum class Kind
    {
        ExactDate,
        Month,
        Year,
        Unbounded,
    };

    static Filter exactDate(const QDate &date);
    //! Without a year, the month is looked up in whatever year is current when the filter is applied.
    static Filter month(int month, std::optional<int> year = std::nullopt);
    static Filter year(int year);
    static Filter unbounded();

    //! The key prefix a matching record starts with (the full key for an exact date, empty when unbounded).
    QString keyPrefix(int currentYear) const;
    bool matches(const DayRecord &record, int currentYear) const;

private:
    Filter(Kind kind, const QDate &date, int month, std::optional<int> year);

    Kind m_kind;
    QDate m_date;
    int m_month;
    std::optional<int> m_year;
};

class Selector
{
public:
    explicit Selector(const RecordStore &store, int currentYear = QDate::currentDate().year());

    //! Returns the days matching \a filter in ascending date order, with derived fields computed over the whole history
    //! so the running balance is right inside any window. With \a includeNotes every day carries its notes.
    QList<DayReport> select(const Filter &filter, bool includeNotes, const OvertimeAggregator &aggregator) const;

private:
    const RecordStore &m_store;
    int m_currentYear;
};

#endif // SELECTOR_H
