#include "MergePolicy.h"

DayRecord MergePolicy::apply(const QDate &date, const std::optional<DayRecord> &existing, const DayUpdate &update) const
{
    if (!existing)
        return DayRecord{date, update.startTime, update.endTime, update.breakMinutes};

    return DayRecord{date,
                     resolve(existing->startTime(), update.startTime),
                     resolve(existing->endTime(), update.endTime),
                     resolve(existing->breakMinutes(), update.breakMinutes)};
}
