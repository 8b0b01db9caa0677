#include "OvertimeAggregator.h"

#include <algorithm>
#include <utility>

OvertimeAggregator::OvertimeAggregator(double expectedWorkdayHours)
    : m_expectedWorkdayHours{expectedWorkdayHours}
{}

std::optional<double> OvertimeAggregator::workingHours(const DayRecord &record)
{
    if (!record.hasWorkingTime())
        return std::nullopt;

    auto minutes = record.startTime()->secsTo(*record.endTime()) / 60.;
    return (minutes - record.breakMinutes().value_or(0.)) / 60.;
}

QList<DayReport> OvertimeAggregator::aggregate(QList<DayRecord> history) const
{
    std::stable_sort(history.begin(), history.end(), [](const DayRecord &a, const DayRecord &b) {
        return a.date() < b.date();
    });

    QList<DayReport> reports;
    reports.reserve(history.size());

    double cumulative{0.};
    for (const auto &record : std::as_const(history))
    {
        DayReport report{record, workingHours(record), std::nullopt, 0., std::nullopt};
        if (report.workingHours)
        {
            report.overtimeHours = *report.workingHours - m_expectedWorkdayHours;
            cumulative += *report.overtimeHours;
        }
        report.cumulativeOvertimeHours = cumulative;
        reports.append(report);
    }

    return reports;
}
