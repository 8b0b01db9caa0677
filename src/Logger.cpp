#include "Logger.h"

#include <QDateTime>
#include <QDir>
#include <QStandardPaths>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <backward.hpp>

#include <csignal>
#include <fstream>

namespace Stamp::logs
{
    std::shared_ptr<spdlog::logger> _app, _store, _qt;

    extern "C" void crashHandler(int signal);
}

QString Stamp::logs::logFileLocation()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

void Stamp::logs::qtMessagesToSpdlog(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    auto formatted = qFormatLogMessage(type, context, msg);

    switch (type)
    {
    case QtDebugMsg:
        _qt->debug(formatted.toStdString());
        break;
    case QtInfoMsg:
        _qt->info(formatted.toStdString());
        break;
    case QtWarningMsg:
        _qt->warn(formatted.toStdString());
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        _qt->critical(formatted.toStdString());
        break;
    default:
        break;
    }
}

void Stamp::logs::init(bool debugMode)
{
    // stdout is reserved for command output
    auto console = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    console->set_level(debugMode ? spdlog::level::debug : spdlog::level::warn);
    std::vector<spdlog::sink_ptr> sinks = {console};

    std::string fileSinkError;
    QDir{}.mkpath(logFileLocation());
    try
    {
        auto file =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFileLocation().append("/Stamp.log").toStdString());
        file->set_level(spdlog::level::trace);
        sinks.push_back(file);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        fileSinkError = e.what();
    }

    _app = std::make_shared<spdlog::logger>("stamp", sinks.begin(), sinks.end());
    _app->set_level(spdlog::level::trace);
    _app->flush_on(spdlog::level::trace);
    _store = std::make_shared<spdlog::logger>("store", sinks.begin(), sinks.end());
    _store->set_level(spdlog::level::trace);
    _store->flush_on(spdlog::level::trace);
    _qt = std::make_shared<spdlog::logger>("qt", sinks.begin(), sinks.end());
    _qt->set_level(spdlog::level::trace);
    _qt->flush_on(spdlog::level::trace);

    if (!fileSinkError.empty())
        _app->warn("Logging to the console only, could not open the log file: {}", fileSinkError);

    qInstallMessageHandler(Stamp::logs::qtMessagesToSpdlog);
    std::signal(SIGILL, crashHandler);
    std::signal(SIGSEGV, crashHandler);
    std::signal(SIGABRT, crashHandler);
    std::signal(SIGFPE, crashHandler);
}

std::shared_ptr<spdlog::logger> Stamp::logs::app()
{
    return _app ? _app : spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Stamp::logs::store()
{
    return _store ? _store : spdlog::default_logger();
}

void Stamp::logs::crashHandler(int signal)
{
    _store->flush();
    _app->critical("Crash signal detected! {}", signal);
    _app->critical("stack trace:");

    using namespace backward;

    StackTrace st;
    st.load_here(100);
    Printer p;
    p.address = true;
    p.object = true;
    p.print(st);

    auto filename{logFileLocation().toStdString() + "/backtrace-" +
                  std::to_string(QDateTime::currentDateTime().toMSecsSinceEpoch()) + ".txt"};
    std::ofstream dump{filename};
    if (dump)
    {
        p.print(st, dump);
        _app->critical("Also dumped stack trace to {}", filename);
    }

    _app->flush();
    _qt->flush();

    std::signal(signal, SIG_DFL);
    std::raise(signal);
}
