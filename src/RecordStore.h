#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include <QList>
#include <QPair>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QVariant>

#include <functional>
#include <optional>

#include "DayRecord.h"
#include "Note.h"

//! SQLite-backed storage for day records, notes and the ledger's key-value config.
//!
//! Every instance owns its own named QSQLITE connection, which is closed and removed on destruction. Deleting something
//! that does not exist is never an error.
class RecordStore
{
public:
    using Predicate = std::function<bool(const DayRecord &)>;

    explicit RecordStore(const QString &databasePath);
    ~RecordStore();

    RecordStore(const RecordStore &) = delete;
    RecordStore &operator=(const RecordStore &) = delete;

    std::optional<DayRecord> get(const QDate &date) const;
    //! Replaces whatever is stored for record.date() with \a record as a whole.
    void upsert(const DayRecord &record);
    void remove(const QDate &date);

    //! Creates an empty record for \a date first if there is none, then appends the note. Returns the new note's id.
    qint64 addNote(const QDate &date, const QString &text);
    void removeNote(qint64 id);

    //! Always ascending by date.
    QList<DayRecord> allRecords(const Predicate &predicate = {}) const;
    //! Ascending by id, i.e. insertion order.
    QList<Note> notesFor(const QDate &date) const;
    QList<Note> allNotes() const;

    std::optional<QString> setting(const QString &key) const;
    void setSetting(const QString &key, const QString &value);
    void removeSetting(const QString &key);
    QList<QPair<QString, QString>> settings() const;

private:
    QSqlDatabase database() const;
    QSqlQuery exec(const QString &sql, const QVariantList &bindings = {}) const;
    void createSchema();

    static DayRecord recordFromQuery(const QSqlQuery &query);
    static Note noteFromQuery(const QSqlQuery &query);

    QString m_databasePath;
    QString m_connectionName;

    static inline int s_connectionCount{0};
};

#endif // RECORDSTORE_H
