#include "RecordStore.h"

#include <QDir>
#include <QFileInfo>
#include <QSqlError>
#include <QStringList>

#include "Errors.h"
#include "Logger.h"
#include "Utils.h"

namespace logs = Stamp::logs;

namespace
{
    const auto selectRecordColumns{QStringLiteral("SELECT date, start_time, end_time, break_minutes FROM work_hours")};
    const auto selectNoteColumns{QStringLiteral("SELECT id, date, note FROM notes")};

    QVariant toVariant(const std::optional<QTime> &time)
    {
        return time ? QVariant{time->toString(Stamp::timeFormat)} : QVariant{};
    }

    QVariant toVariant(const std::optional<double> &value)
    {
        return value ? QVariant{*value} : QVariant{};
    }
} // namespace

RecordStore::RecordStore(const QString &databasePath)
    : m_databasePath{databasePath},
      m_connectionName{QStringLiteral("stamp-%1").arg(++s_connectionCount)}
{
    QDir{}.mkpath(QFileInfo{m_databasePath}.absolutePath());

    try
    {
        auto db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
        db.setDatabaseName(m_databasePath);
        if (!db.open())
        {
            logs::store()->error("Unable to open database {}: {}",
                                 m_databasePath.toStdString(),
                                 db.lastError().text().toStdString());
            throw Stamp::StorageError{"unable to open database " + m_databasePath.toStdString()};
        }
        logs::store()->debug("Database opened: {}", m_databasePath.toStdString());

        createSchema();
    }
    catch (const Stamp::StorageError &)
    {
        QSqlDatabase::removeDatabase(m_connectionName);
        throw;
    }
}

RecordStore::~RecordStore()
{
    {
        auto db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen())
            db.close();
    }
    QSqlDatabase::removeDatabase(m_connectionName);
    logs::store()->trace("Closed connection {}", m_connectionName.toStdString());
}

std::optional<DayRecord> RecordStore::get(const QDate &date) const
{
    auto query = exec(selectRecordColumns + QStringLiteral(" WHERE date = ?"), {Stamp::dateKey(date)});
    if (!query.next())
        return std::nullopt;

    return recordFromQuery(query);
}

void RecordStore::upsert(const DayRecord &record)
{
    exec(QStringLiteral("INSERT OR REPLACE INTO work_hours (date, start_time, end_time, break_minutes) VALUES (?, ?, ?, ?)"),
         {record.key(), toVariant(record.startTime()), toVariant(record.endTime()), toVariant(record.breakMinutes())});
    logs::store()->debug("Stored day {}", record.key().toStdString());
}

void RecordStore::remove(const QDate &date)
{
    auto query = exec(QStringLiteral("DELETE FROM work_hours WHERE date = ?"), {Stamp::dateKey(date)});
    if (query.numRowsAffected() == 0)
        logs::store()->debug("No day {} to remove", Stamp::dateKey(date).toStdString());
}

qint64 RecordStore::addNote(const QDate &date, const QString &text)
{
    auto db = database();
    if (!db.transaction())
    {
        logs::store()->error("Could not start a transaction: {}", db.lastError().text().toStdString());
        throw Stamp::StorageError{db.lastError().text().toStdString()};
    }

    try
    {
        if (!get(date))
        {
            logs::store()->debug("No day {} yet, creating an empty one for the note", Stamp::dateKey(date).toStdString());
            upsert(DayRecord{date});
        }

        auto query = exec(QStringLiteral("INSERT INTO notes (date, note) VALUES (?, ?)"), {Stamp::dateKey(date), text});
        auto id = query.lastInsertId().toLongLong();

        if (!db.commit())
            throw Stamp::StorageError{db.lastError().text().toStdString()};

        logs::store()->debug("Added note {} for {}", id, Stamp::dateKey(date).toStdString());
        return id;
    }
    catch (const Stamp::StorageError &)
    {
        db.rollback();
        throw;
    }
}

void RecordStore::removeNote(qint64 id)
{
    auto query = exec(QStringLiteral("DELETE FROM notes WHERE id = ?"), {id});
    if (query.numRowsAffected() == 0)
        logs::store()->debug("No note {} to remove", id);
}

QList<DayRecord> RecordStore::allRecords(const Predicate &predicate) const
{
    QList<DayRecord> records;
    auto query = exec(selectRecordColumns + QStringLiteral(" ORDER BY date"));
    while (query.next())
    {
        auto record = recordFromQuery(query);
        if (!predicate || predicate(record))
            records.append(record);
    }
    return records;
}

QList<Note> RecordStore::notesFor(const QDate &date) const
{
    QList<Note> notes;
    auto query = exec(selectNoteColumns + QStringLiteral(" WHERE date = ? ORDER BY id"), {Stamp::dateKey(date)});
    while (query.next())
        notes.append(noteFromQuery(query));
    return notes;
}

QList<Note> RecordStore::allNotes() const
{
    QList<Note> notes;
    auto query = exec(selectNoteColumns + QStringLiteral(" ORDER BY id"));
    while (query.next())
        notes.append(noteFromQuery(query));
    return notes;
}

std::optional<QString> RecordStore::setting(const QString &key) const
{
    auto query = exec(QStringLiteral("SELECT value FROM config WHERE key = ?"), {key});
    if (!query.next())
        return std::nullopt;

    return query.value(0).toString();
}

void RecordStore::setSetting(const QString &key, const QString &value)
{
    exec(QStringLiteral("INSERT OR REPLACE INTO config (key, value) VALUES (?, ?)"), {key, value});
}

void RecordStore::removeSetting(const QString &key)
{
    exec(QStringLiteral("DELETE FROM config WHERE key = ?"), {key});
}

QList<QPair<QString, QString>> RecordStore::settings() const
{
    QList<QPair<QString, QString>> pairs;
    auto query = exec(QStringLiteral("SELECT key, value FROM config ORDER BY key"));
    while (query.next())
        pairs.append({query.value(0).toString(), query.value(1).toString()});
    return pairs;
}

QSqlDatabase RecordStore::database() const
{
    return QSqlDatabase::database(m_connectionName);
}

QSqlQuery RecordStore::exec(const QString &sql, const QVariantList &bindings) const
{
    QSqlQuery query{database()};
    if (!query.prepare(sql))
    {
        logs::store()->error("Could not prepare \"{}\": {}", sql.toStdString(), query.lastError().text().toStdString());
        throw Stamp::StorageError{query.lastError().text().toStdString()};
    }

    for (const auto &value : bindings)
        query.addBindValue(value);

    if (!query.exec())
    {
        logs::store()->error("Query \"{}\" failed: {}", sql.toStdString(), query.lastError().text().toStdString());
        throw Stamp::StorageError{query.lastError().text().toStdString()};
    }

    logs::store()->trace("{}", sql.toStdString());
    return query;
}

void RecordStore::createSchema()
{
    const bool seedConfig = !database().tables().contains(QStringLiteral("config"));

    exec(QStringLiteral("CREATE TABLE IF NOT EXISTS work_hours ("
                        "date TEXT PRIMARY KEY, "
                        "start_time TEXT, "
                        "end_time TEXT, "
                        "break_minutes REAL)"));
    exec(QStringLiteral("CREATE TABLE IF NOT EXISTS notes ("
                        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                        "date TEXT NOT NULL, "
                        "note TEXT)"));
    exec(QStringLiteral("CREATE TABLE IF NOT EXISTS config ("
                        "key TEXT PRIMARY KEY, "
                        "value TEXT)"));

    if (seedConfig)
    {
        setSetting(Stamp::expectedWorkdayHoursKey, QString::number(Stamp::defaultExpectedWorkdayHours));
        logs::store()->info("Initialized config with {} = {}",
                            Stamp::expectedWorkdayHoursKey.toStdString(),
                            Stamp::defaultExpectedWorkdayHours);
    }
}

DayRecord RecordStore::recordFromQuery(const QSqlQuery &query)
{
    auto time = [&query](int column) -> std::optional<QTime> {
        if (query.value(column).isNull())
            return std::nullopt;

        auto text = query.value(column).toString();
        auto parsed = QTime::fromString(text, Stamp::timeFormat);
        if (!parsed.isValid())
        {
            logs::store()->warn("Ignoring unreadable time \"{}\" stored for {}",
                                text.toStdString(),
                                query.value(0).toString().toStdString());
            return std::nullopt;
        }
        return parsed;
    };

    std::optional<double> breakMinutes;
    if (!query.value(3).isNull())
        breakMinutes = query.value(3).toDouble();

    return DayRecord{QDate::fromString(query.value(0).toString(), Stamp::dateFormat), time(1), time(2), breakMinutes};
}

Note RecordStore::noteFromQuery(const QSqlQuery &query)
{
    return Note{query.value(0).toLongLong(),
                QDate::fromString(query.value(1).toString(), Stamp::dateFormat),
                query.value(2).toString()};
}
