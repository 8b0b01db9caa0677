#ifndef JSONHELPER_H
#define JSONHELPER_H

#include <QDate>
#include <QString>
#include <QTime>

#include <optional>

#include <nlohmann/json.hpp>

#include "Utils.h"

// easy conversion of json <=> Qt types
namespace nlohmann
{
    template<>
    struct adl_serializer<QString>
    {
        template<class BasicJsonType>
        static void to_json(BasicJsonType &j, const QString &s)
        {
            j = s.toStdString();
        }

        template<class BasicJsonType>
        static void from_json(const BasicJsonType &j, QString &s)
        {
            s = QString::fromStdString(j.template get<std::string>());
        }
    };

    template<>
    struct adl_serializer<QDate>
    {
        template<class BasicJsonType>
        static void to_json(BasicJsonType &j, const QDate &d)
        {
            j = Stamp::dateKey(d).toStdString();
        }

        template<class BasicJsonType>
        static void from_json(const BasicJsonType &j, QDate &d)
        {
            d = QDate::fromString(QString::fromStdString(j.template get<std::string>()), Stamp::dateFormat);
        }
    };

    template<>
    struct adl_serializer<QTime>
    {
        template<class BasicJsonType>
        static void to_json(BasicJsonType &j, const QTime &t)
        {
            j = t.toString(Stamp::timeFormat).toStdString();
        }

        template<class BasicJsonType>
        static void from_json(const BasicJsonType &j, QTime &t)
        {
            t = QTime::fromString(QString::fromStdString(j.template get<std::string>()), Stamp::timeFormat);
        }
    };
} // namespace nlohmann

namespace Stamp
{
    //! An absent value becomes null.
    template<class BasicJsonType, class T>
    BasicJsonType optionalToJson(const std::optional<T> &value)
    {
        if (!value)
            return nullptr;
        return BasicJsonType(*value);
    }
} // namespace Stamp

#endif // JSONHELPER_H
