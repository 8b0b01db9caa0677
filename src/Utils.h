#ifndef UTILS_H
#define UTILS_H

#include <QDate>
#include <QString>
#include <QTime>

#include <optional>

namespace Stamp
{
    const auto dateFormat{QStringLiteral("yyyy-MM-dd")};
    const auto timeFormat{QStringLiteral("HH:mm")};

    const auto expectedWorkdayHoursKey{QStringLiteral("expected_workday_hours")};
    constexpr auto defaultExpectedWorkdayHours{7.8};

    //! Rounds half away from zero to two decimals. Only used where numbers are reported.
    double roundToHundredths(double value);

    QString dateKey(const QDate &date);

    //! Strict parsers for command-line input; std::nullopt if the text is not exactly in the expected format.
    std::optional<QDate> parseDate(const QString &text);
    std::optional<QTime> parseTime(const QString &text);
    std::optional<int> parseMonth(const QString &text);
    std::optional<int> parseYear(const QString &text);
    std::optional<bool> parseBool(const QString &text);
    //! Rejects nan and inf, which QString::toDouble() lets through.
    std::optional<double> parseNumber(const QString &text);
} // namespace Stamp

#endif // UTILS_H
