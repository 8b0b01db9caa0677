#ifndef DUMPWRITER_H
#define DUMPWRITER_H

#include <QString>
#include <QStringList>

class RecordStore;

//! Writes every stored day and note to plain-text `.dump` files, one table per file.
class DumpWriter
{
public:
    explicit DumpWriter(const RecordStore &store);

    //! Writes work_hours.dump and notes.dump into the existing directory \a destination and returns their paths.
    QStringList write(const QString &destination) const;

private:
    void writeFile(const QString &path, const QStringList &lines) const;

    const RecordStore &m_store;
};

#endif // DUMPWRITER_H
