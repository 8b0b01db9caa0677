#ifndef MERGEPOLICY_H
#define MERGEPOLICY_H

#include <QTime>

#include <optional>

#include "DayRecord.h"

//! A partial update for one day. Every field is independently present or absent.
struct DayUpdate
{
    std::optional<QTime> startTime;
    std::optional<QTime> endTime;
    std::optional<double> breakMinutes;
};

//! Combines a partial update with the record already stored for a day.
//!
//! Without an existing record the update's fields are taken as they are. With one, every field is resolved on its own:
//! - Overwrite: the incoming value wins when present, otherwise the stored value is kept.
//! - FillGaps: a stored value is never replaced; the incoming value only fills a field that was never set.
class MergePolicy
{
public:
    enum class Mode
    {
        Overwrite,
        FillGaps,
    };

    explicit MergePolicy(Mode mode)
        : m_mode{mode}
    {}

    static MergePolicy fromOverwriteFlag(bool overwrite) { return MergePolicy{overwrite ? Mode::Overwrite : Mode::FillGaps}; }

    DayRecord apply(const QDate &date, const std::optional<DayRecord> &existing, const DayUpdate &update) const;

private:
    template<class T>
    std::optional<T> resolve(const std::optional<T> &stored, const std::optional<T> &incoming) const
    {
        if (m_mode == Mode::Overwrite)
            return incoming ? incoming : stored;
        else
            return stored ? stored : incoming;
    }

    Mode m_mode;
};

#endif // MERGEPOLICY_H
