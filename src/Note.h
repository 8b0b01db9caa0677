#ifndef NOTE_H
#define NOTE_H

#include <QDate>
#include <QObject>

class Note : public QObject
{
    Q_OBJECT

public:
    Note(qint64 id, const QDate &date, const QString &text, QObject *parent = nullptr);
    Note(const Note &that);
    Note(QObject *parent = nullptr);

    qint64 id() const { return m_id; }
    QDate date() const { return m_date; }
    QString text() const { return m_text; }

    Note &operator=(const Note &other);
    bool operator==(const Note &other) const { return m_id == other.m_id; }

private:
    qint64 m_id{-1};
    QDate m_date;
    QString m_text;
};

#endif // NOTE_H
