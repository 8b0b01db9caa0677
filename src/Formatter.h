#ifndef FORMATTER_H
#define FORMATTER_H

#include <QList>
#include <QString>
#include <QStringList>

#include <memory>

#include "OvertimeAggregator.h"

//! Turns query results into text. Derived hours are rounded to two decimals here and nowhere earlier.
class AbstractFormatter
{
public:
    virtual ~AbstractFormatter() = default;

    //! The value passed to `show --format` to pick this formatter.
    virtual QString name() const = 0;
    virtual QString format(const QList<DayReport> &days) const = 0;

    //! Picks a formatter by name, ignoring case. Throws Stamp::UsageError for anything unknown.
    static std::unique_ptr<AbstractFormatter> create(const QString &name);
    static QStringList availableFormats();
};

class JsonFormatter : public AbstractFormatter
{
public:
    QString name() const override { return QStringLiteral("json"); }
    QString format(const QList<DayReport> &days) const override;
};

//! A GitHub-flavoured pipe table. With notes there is one row per note.
class TableFormatter : public AbstractFormatter
{
public:
    QString name() const override { return QStringLiteral("table"); }
    QString format(const QList<DayReport> &days) const override;
};

class MarkdownFormatter : public AbstractFormatter
{
public:
    QString name() const override { return QStringLiteral("markdown"); }
    QString format(const QList<DayReport> &days) const override;
};

#endif // FORMATTER_H
