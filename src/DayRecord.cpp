#include "DayRecord.h"

#include "Utils.h"

DayRecord::DayRecord(const QDate &date,
                     std::optional<QTime> startTime,
                     std::optional<QTime> endTime,
                     std::optional<double> breakMinutes,
                     QObject *parent)
    : QObject{parent},
      m_date{date},
      m_startTime{startTime},
      m_endTime{endTime},
      m_breakMinutes{breakMinutes}
{}

DayRecord::DayRecord(const QDate &date, QObject *parent)
    : DayRecord{date, std::nullopt, std::nullopt, std::nullopt, parent}
{}

DayRecord::DayRecord(const DayRecord &that)
    : QObject{that.parent()}
{
    *this = that;
}

DayRecord::DayRecord(QObject *parent)
    : QObject{parent}
{}

QString DayRecord::key() const
{
    return Stamp::dateKey(m_date);
}

DayRecord &DayRecord::operator=(const DayRecord &other)
{
    m_date = other.m_date;
    m_startTime = other.m_startTime;
    m_endTime = other.m_endTime;
    m_breakMinutes = other.m_breakMinutes;

    return *this;
}

bool DayRecord::operator==(const DayRecord &other) const
{
    return m_date == other.m_date && m_startTime == other.m_startTime && m_endTime == other.m_endTime &&
           m_breakMinutes == other.m_breakMinutes;
}
