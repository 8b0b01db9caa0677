#include "Selector.h"

#include "Logger.h"
#include "RecordStore.h"
#include "Utils.h"

Filter::Filter(Kind kind, const QDate &date, int month, std::optional<int> year)
    : m_kind{kind},
      m_date{date},
      m_month{month},
      m_year{year}
{}

Filter Filter::exactDate(const QDate &date)
{
    return Filter{Kind::ExactDate, date, 0, std::nullopt};
}

Filter Filter::month(int month, std::optional<int> year)
{
    return Filter{Kind::Month, {}, month, year};
}

Filter Filter::year(int year)
{
    return Filter{Kind::Year, {}, 0, year};
}

Filter Filter::unbounded()
{
    return Filter{Kind::Unbounded, {}, 0, std::nullopt};
}

QString Filter::keyPrefix(int currentYear) const
{
    switch (m_kind)
    {
    case Kind::ExactDate:
        return Stamp::dateKey(m_date);
    case Kind::Month:
        return QStringLiteral("%1-%2-")
            .arg(m_year.value_or(currentYear), 4, 10, QLatin1Char{'0'})
            .arg(m_month, 2, 10, QLatin1Char{'0'});
    case Kind::Year:
        return QStringLiteral("%1-").arg(m_year.value_or(currentYear), 4, 10, QLatin1Char{'0'});
    case Kind::Unbounded:
    default:
        return {};
    }
}

bool Filter::matches(const DayRecord &record, int currentYear) const
{
    if (m_kind == Kind::ExactDate)
        return record.key() == keyPrefix(currentYear);
    return record.key().startsWith(keyPrefix(currentYear));
}

Selector::Selector(const RecordStore &store, int currentYear)
    : m_store{store},
      m_currentYear{currentYear}
{}

QList<DayReport> Selector::select(const Filter &filter, bool includeNotes, const OvertimeAggregator &aggregator) const
{
    auto history = aggregator.aggregate(m_store.allRecords());

    QList<DayReport> selected;
    for (auto &report : history)
    {
        if (!filter.matches(report.record, m_currentYear))
            continue;

        if (includeNotes)
            report.notes = m_store.notesFor(report.record.date());
        selected.append(report);
    }

    Stamp::logs::app()->debug("Selected {} of {} days (prefix \"{}\")",
                              selected.size(),
                              history.size(),
                              filter.keyPrefix(m_currentYear).toStdString());
    return selected;
}
