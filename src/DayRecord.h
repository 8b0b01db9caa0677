#ifndef DAYRECORD_H
#define DAYRECORD_H

#include <QDate>
#include <QObject>
#include <QTime>

#include <optional>

class DayRecord : public QObject
{
    Q_OBJECT

public:
    DayRecord(const QDate &date,
              std::optional<QTime> startTime,
              std::optional<QTime> endTime,
              std::optional<double> breakMinutes,
              QObject *parent = nullptr);
    //! Creates a record with no times and no break, the shape a day has when a note arrives first.
    explicit DayRecord(const QDate &date, QObject *parent = nullptr);
    DayRecord(const DayRecord &that);
    DayRecord(QObject *parent = nullptr);

    QDate date() const { return m_date; }
    //! The ISO date string records are keyed and ordered by.
    QString key() const;
    std::optional<QTime> startTime() const { return m_startTime; }
    std::optional<QTime> endTime() const { return m_endTime; }
    std::optional<double> breakMinutes() const { return m_breakMinutes; }

    bool hasWorkingTime() const { return m_startTime.has_value() && m_endTime.has_value(); }

    DayRecord &operator=(const DayRecord &other);
    bool operator==(const DayRecord &other) const;
    bool operator!=(const DayRecord &other) const { return !(*this == other); }

private:
    QDate m_date;
    std::optional<QTime> m_startTime;
    std::optional<QTime> m_endTime;
    std::optional<double> m_breakMinutes;
};

#endif // DAYRECORD_H
