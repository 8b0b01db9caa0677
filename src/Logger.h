#pragma once

#include <QString>
#include <QtGlobal>

#include <spdlog/spdlog.h>

namespace Stamp::logs
{
    QString logFileLocation();
    void qtMessagesToSpdlog(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    void init(bool debugMode);

    //! Both loggers fall back to spdlog's default logger until init() has run.
    std::shared_ptr<spdlog::logger> app();
    std::shared_ptr<spdlog::logger> store();

} // namespace Stamp::logs
