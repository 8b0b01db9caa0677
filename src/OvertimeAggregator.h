#ifndef OVERTIMEAGGREGATOR_H
#define OVERTIMEAGGREGATOR_H

#include <QList>

#include <optional>

#include "DayRecord.h"
#include "Note.h"

//! A stored day together with the values derived from it on read.
struct DayReport
{
    DayRecord record;
    std::optional<double> workingHours;
    std::optional<double> overtimeHours;
    double cumulativeOvertimeHours{0.};
    //! Only set when notes were requested. An empty list means the day has none.
    std::optional<QList<Note>> notes;
};

class OvertimeAggregator
{
public:
    explicit OvertimeAggregator(double expectedWorkdayHours);

    double expectedWorkdayHours() const { return m_expectedWorkdayHours; }

    //! Hours between start and end minus the break, or std::nullopt if either time is missing. Negative results are
    //! returned as they are.
    static std::optional<double> workingHours(const DayRecord &record);

    //! Computes the derived fields for every record of \a history in one pass, oldest first.
    //!
    //! The running balance starts at zero and only moves on days with both times set; every other day reports the
    //! balance of the nearest earlier day that had them. Values keep full precision; rounding is left to whoever
    //! prints them.
    QList<DayReport> aggregate(QList<DayRecord> history) const;

private:
    double m_expectedWorkdayHours;
};

#endif // OVERTIMEAGGREGATOR_H
