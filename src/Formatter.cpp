#include "Formatter.h"

#include <algorithm>
#include <utility>

#include "Errors.h"
#include "JsonHelper.h"
#include "Utils.h"

using nlohmann::ordered_json;

namespace
{
    std::optional<double> rounded(const std::optional<double> &value)
    {
        if (!value)
            return std::nullopt;
        return Stamp::roundToHundredths(*value);
    }

    //! Two decimals at most, without trailing zeros: 7.5, -0.93, 30.
    QString formatNumber(double value)
    {
        auto text = QString::number(Stamp::roundToHundredths(value), 'f', 2);
        while (text.endsWith(QLatin1Char{'0'}))
            text.chop(1);
        if (text.endsWith(QLatin1Char{'.'}))
            text.chop(1);
        return text == QStringLiteral("-0") ? QStringLiteral("0") : text;
    }

    QString formatNumber(const std::optional<double> &value)
    {
        return value ? formatNumber(*value) : QString{};
    }

    QString formatTime(const std::optional<QTime> &time)
    {
        return time ? time->toString(Stamp::timeFormat) : QString{};
    }
} // namespace

std::unique_ptr<AbstractFormatter> AbstractFormatter::create(const QString &name)
{
    const auto lower = name.trimmed().toLower();
    if (lower == QStringLiteral("json"))
        return std::make_unique<JsonFormatter>();
    if (lower == QStringLiteral("table"))
        return std::make_unique<TableFormatter>();
    if (lower == QStringLiteral("markdown"))
        return std::make_unique<MarkdownFormatter>();

    throw Stamp::UsageError{"Format not supported: " + name.toStdString() + " (use one of " +
                            availableFormats().join(QStringLiteral(", ")).toStdString() + ")"};
}

QStringList AbstractFormatter::availableFormats()
{
    return {QStringLiteral("json"), QStringLiteral("table"), QStringLiteral("markdown")};
}

QString JsonFormatter::format(const QList<DayReport> &days) const
{
    auto j = ordered_json::array();
    for (const auto &day : days)
    {
        ordered_json entry;
        entry["date"] = day.record.date();
        entry["start_time"] = Stamp::optionalToJson<ordered_json>(day.record.startTime());
        entry["end_time"] = Stamp::optionalToJson<ordered_json>(day.record.endTime());
        entry["break_minutes"] = Stamp::optionalToJson<ordered_json>(day.record.breakMinutes());
        entry["working_hours"] = Stamp::optionalToJson<ordered_json>(rounded(day.workingHours));
        entry["overtime_hours"] = Stamp::optionalToJson<ordered_json>(rounded(day.overtimeHours));
        entry["cumulative_overtime_hours"] = Stamp::roundToHundredths(day.cumulativeOvertimeHours);

        if (day.notes)
        {
            auto notes = ordered_json::array();
            for (const auto &note : *day.notes)
            {
                ordered_json n;
                n["id"] = note.id();
                n["date"] = note.date();
                n["note"] = note.text();
                notes.push_back(n);
            }
            entry["notes"] = notes;
        }

        j.push_back(entry);
    }

    return QString::fromStdString(j.dump(4));
}

QString TableFormatter::format(const QList<DayReport> &days) const
{
    const bool withNotes =
        std::any_of(days.cbegin(), days.cend(), [](const DayReport &d) { return d.notes.has_value(); });

    QStringList headers{QStringLiteral("date"),
                        QStringLiteral("start_time"),
                        QStringLiteral("end_time"),
                        QStringLiteral("break_minutes"),
                        QStringLiteral("working_hours"),
                        QStringLiteral("overtime_hours"),
                        QStringLiteral("cumulative_overtime_hours")};
    if (withNotes)
        headers << QStringLiteral("note_id") << QStringLiteral("note");

    // date, times and note text are left-aligned, numbers right-aligned
    auto rightAligned = [](qsizetype column) { return column >= 3 && column <= 7; };

    QList<QStringList> rows;
    for (const auto &day : days)
    {
        QStringList row{day.record.key(),
                        formatTime(day.record.startTime()),
                        formatTime(day.record.endTime()),
                        formatNumber(day.record.breakMinutes()),
                        formatNumber(day.workingHours),
                        formatNumber(day.overtimeHours),
                        formatNumber(day.cumulativeOvertimeHours)};

        if (!withNotes)
            rows.append(row);
        else if (!day.notes || day.notes->isEmpty())
            rows.append(QStringList(row) << QString{} << QString{});
        else
            for (const auto &note : *day.notes)
                rows.append(QStringList(row) << QString::number(note.id()) << note.text());
    }

    QList<qsizetype> widths;
    for (const auto &header : std::as_const(headers))
        widths.append(header.size());
    for (const auto &row : std::as_const(rows))
        for (qsizetype i = 0; i < row.size(); ++i)
            widths[i] = std::max(widths[i], row[i].size());

    auto line = [&widths, &rightAligned](const QStringList &cells) {
        QStringList padded;
        for (qsizetype i = 0; i < cells.size(); ++i)
            padded << (rightAligned(i) ? cells[i].rightJustified(widths[i]) : cells[i].leftJustified(widths[i]));
        return QStringLiteral("| ") + padded.join(QStringLiteral(" | ")) + QStringLiteral(" |\n");
    };

    QStringList dashes;
    for (auto width : std::as_const(widths))
        dashes << QString(width + 2, QLatin1Char{'-'});

    QString table = line(headers);
    table += QStringLiteral("|") + dashes.join(QStringLiteral("|")) + QStringLiteral("|\n");
    for (const auto &row : std::as_const(rows))
        table += line(row);
    return table;
}

QString MarkdownFormatter::format(const QList<DayReport> &days) const
{
    QString md;
    for (const auto &day : days)
    {
        md += QStringLiteral("## %1 | %2 - %3\n\n")
                  .arg(day.record.key(), formatTime(day.record.startTime()), formatTime(day.record.endTime()));
        if (day.notes)
            for (const auto &note : *day.notes)
                md += QStringLiteral("- ") + note.text() + QStringLiteral("\n");
        md += QStringLiteral("\n\n");
    }
    return md;
}
