#include "DumpWriter.h"

#include <QDir>
#include <QFile>
#include <QTextStream>

#include "Errors.h"
#include "Logger.h"
#include "RecordStore.h"
#include "Utils.h"

namespace
{
    const auto separator{QStringLiteral(", ")};
}

DumpWriter::DumpWriter(const RecordStore &store)
    : m_store{store}
{}

QStringList DumpWriter::write(const QString &destination) const
{
    QDir dir{destination};
    if (!dir.exists())
        throw Stamp::UsageError{"Destination folder does not exist: " + destination.toStdString()};

    QStringList days{QStringList{QStringLiteral("date"),
                                 QStringLiteral("start_time"),
                                 QStringLiteral("end_time"),
                                 QStringLiteral("break_minutes")}
                         .join(separator)};
    for (const auto &record : m_store.allRecords())
    {
        days << QStringList{record.key(),
                            record.startTime() ? record.startTime()->toString(Stamp::timeFormat) : QString{},
                            record.endTime() ? record.endTime()->toString(Stamp::timeFormat) : QString{},
                            record.breakMinutes() ? QString::number(*record.breakMinutes()) : QString{}}
                    .join(separator);
    }

    QStringList notes{QStringList{QStringLiteral("id"), QStringLiteral("date"), QStringLiteral("note")}.join(separator)};
    for (const auto &note : m_store.allNotes())
        notes << QStringList{QString::number(note.id()), Stamp::dateKey(note.date()), note.text()}.join(separator);

    const QStringList paths{dir.filePath(QStringLiteral("work_hours.dump")), dir.filePath(QStringLiteral("notes.dump"))};
    writeFile(paths[0], days);
    writeFile(paths[1], notes);
    return paths;
}

void DumpWriter::writeFile(const QString &path, const QStringList &lines) const
{
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        Stamp::logs::app()->error("Could not write {}: {}", path.toStdString(), file.errorString().toStdString());
        throw Stamp::StorageError{"could not write " + path.toStdString()};
    }

    QTextStream out{&file};
    for (const auto &line : lines)
        out << line << '\n';

    Stamp::logs::app()->info("Dumped {} lines to {}", lines.size(), path.toStdString());
}
