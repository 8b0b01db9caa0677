#include "Note.h"

Note::Note(qint64 id, const QDate &date, const QString &text, QObject *parent)
    : QObject{parent},
      m_id{id},
      m_date{date},
      m_text{text}
{}

Note::Note(const Note &that)
    : QObject{that.parent()}
{
    *this = that;
}

Note::Note(QObject *parent)
    : QObject{parent}
{}

Note &Note::operator=(const Note &other)
{
    m_id = other.m_id;
    m_date = other.m_date;
    m_text = other.m_text;

    return *this;
}
