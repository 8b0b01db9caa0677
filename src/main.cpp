#include <QCoreApplication>
#include <QTextStream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>

#include "CommandRunner.h"
#include "Logger.h"
#include "Settings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication::setApplicationName(QStringLiteral("Stamp"));
    QCoreApplication::setOrganizationName(QStringLiteral("Stamp"));

#if defined(IS_DEBUG_BUILD)
    // debug mode will always be on in debug builds
    Stamp::logs::init(true);
#else
    bool debugMode{false};
    for (int i = 0; i < argc; ++i)
        if (std::strcmp(argv[i], "--debug") == 0)
        {
            debugMode = true;
            break;
        }
    Stamp::logs::init(debugMode);
#endif

    QCoreApplication a{argc, argv};
    a.setApplicationVersion(QStringLiteral(VERSION_STR));

    Stamp::logs::app()->trace("Starting Stamp {}...", VERSION_STR);

    int retCode{0};
    try
    {
        Settings::init();

        QTextStream out{stdout};
        QTextStream err{stderr};
        retCode = CommandRunner{out, err}.run(QCoreApplication::arguments());
    }
    catch (const nlohmann::json::exception &e)
    {
        Stamp::logs::app()->critical("Unhandled exception: {}", e.what());
        retCode = 2;
    }

    Stamp::logs::app()->trace("quitting with {}", retCode);
    spdlog::shutdown();

    return retCode;
}
