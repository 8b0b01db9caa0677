#include "Utils.h"

#include <cmath>

double Stamp::roundToHundredths(double value)
{
    return std::round(value * 100.) / 100.;
}

QString Stamp::dateKey(const QDate &date)
{
    return date.toString(dateFormat);
}

std::optional<QDate> Stamp::parseDate(const QString &text)
{
    if (text.size() != 10)
        return std::nullopt;

    auto date = QDate::fromString(text, dateFormat);
    if (!date.isValid())
        return std::nullopt;
    return date;
}

std::optional<QTime> Stamp::parseTime(const QString &text)
{
    if (text.size() != 5)
        return std::nullopt;

    auto time = QTime::fromString(text, timeFormat);
    if (!time.isValid())
        return std::nullopt;
    return time;
}

std::optional<int> Stamp::parseMonth(const QString &text)
{
    bool ok{false};
    auto month = text.toInt(&ok);
    if (text.size() != 2 || !ok || month < 1 || month > 12)
        return std::nullopt;
    return month;
}

std::optional<int> Stamp::parseYear(const QString &text)
{
    bool ok{false};
    auto year = text.toInt(&ok);
    if (text.size() != 4 || !ok || year < 1)
        return std::nullopt;
    return year;
}

std::optional<double> Stamp::parseNumber(const QString &text)
{
    bool ok{false};
    auto value = text.toDouble(&ok);
    if (!ok || !std::isfinite(value))
        return std::nullopt;
    return value;
}

std::optional<bool> Stamp::parseBool(const QString &text)
{
    const auto lower = text.trimmed().toLower();
    if (lower == QStringLiteral("true") || lower == QStringLiteral("yes") || lower == QStringLiteral("1"))
        return true;
    if (lower == QStringLiteral("false") || lower == QStringLiteral("no") || lower == QStringLiteral("0"))
        return false;
    return std::nullopt;
}
