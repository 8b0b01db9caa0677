#include "CommandRunner.h"

#include <QCoreApplication>

#include "DumpWriter.h"
#include "Errors.h"
#include "Formatter.h"
#include "Ledger.h"
#include "Logger.h"
#include "RecordStore.h"
#include "Settings.h"
#include "Utils.h"

namespace logs = Stamp::logs;

namespace
{
    const QStringList commands{QStringLiteral("add"),
                               QStringLiteral("rm"),
                               QStringLiteral("show"),
                               QStringLiteral("dump"),
                               QStringLiteral("check"),
                               QStringLiteral("config")};

    const auto now{QStringLiteral("now")};

    [[noreturn]] void usageError(const QString &message)
    {
        throw Stamp::UsageError{message.toStdString()};
    }

    QDate requireDate(const QString &text)
    {
        if (auto date = Stamp::parseDate(text); date)
            return *date;
        usageError(QObject::tr("Value %1 not valid. Please use format YYYY-MM-DD.").arg(text));
    }

    QTime requireTime(const QString &text, const QDateTime &clock)
    {
        if (text == now)
            return QTime{clock.time().hour(), clock.time().minute()};
        if (auto time = Stamp::parseTime(text); time)
            return *time;
        usageError(QObject::tr("Value %1 not valid. Please use format HH:MM or \"now\".").arg(text));
    }

    double requireMinutes(const QString &text)
    {
        const auto minutes = Stamp::parseNumber(text);
        if (!minutes || *minutes < 0)
            usageError(QObject::tr("Value %1 not valid. Please give the break in minutes.").arg(text));
        return *minutes;
    }

    QString requireValue(const QCommandLineParser &parser, const QCommandLineOption &option)
    {
        if (!parser.isSet(option))
            usageError(QObject::tr("Missing required option --%1.").arg(option.names().constLast()));
        return parser.value(option);
    }
} // namespace

CommandRunner::CommandRunner(QTextStream &out, QTextStream &err)
    : m_out{out},
      m_err{err},
      m_clock{[] { return QDateTime::currentDateTime(); }}
{}

int CommandRunner::run(const QStringList &arguments)
{
    const auto exitCode = execute(arguments);
    m_out.flush();
    m_err.flush();
    return exitCode;
}

int CommandRunner::execute(const QStringList &arguments)
{
    try
    {
        QCommandLineParser parser;
        parser.setApplicationDescription(QObject::tr("Keeps a ledger of work hours, breaks, overtime and notes."));
        parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

        QCommandLineOption debugOption{QStringLiteral("debug"), QObject::tr("Print debug information to the command line.")};
        QCommandLineOption databaseOption{QStringLiteral("database"),
                                          QObject::tr("Use the ledger database at <path>."),
                                          QStringLiteral("path")};
        parser.addOption(debugOption);
        parser.addOption(databaseOption);
        const auto helpOption = parser.addHelpOption();
        const auto versionOption = parser.addVersionOption();
        parser.addPositionalArgument(QStringLiteral("command"),
                                     QObject::tr("One of: %1.").arg(commands.join(QStringLiteral(", "))),
                                     QStringLiteral("<command> [options]"));

        if (!parser.parse(arguments))
            usageError(parser.errorText());

        if (parser.isSet(helpOption))
        {
            m_out << parser.helpText();
            return Success;
        }
        if (parser.isSet(versionOption))
        {
            m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
            return Success;
        }

        auto positional = parser.positionalArguments();
        if (positional.isEmpty())
        {
            m_out << parser.helpText();
            return Success;
        }

        const auto command = positional.takeFirst();
        if (!commands.contains(command))
            usageError(QObject::tr("Unknown command: %1").arg(command));

        QString databasePath;
        if (parser.isSet(databaseOption))
            databasePath = parser.value(databaseOption);
        else if (auto settings = Settings::instance(); settings)
            databasePath = settings->databasePath();
        else
            databasePath = Settings::defaultDatabasePath();

        logs::app()->debug("Running {} against {}", command.toStdString(), databasePath.toStdString());

        RecordStore store{databasePath};
        Ledger ledger{store, m_clock().date().year()};

        if (command == QStringLiteral("add"))
            add(ledger, positional);
        else if (command == QStringLiteral("rm"))
            remove(ledger, positional);
        else if (command == QStringLiteral("show"))
            show(ledger, positional);
        else if (command == QStringLiteral("dump"))
            dump(ledger, positional);
        else if (command == QStringLiteral("check"))
            check(ledger, positional);
        else
            config(ledger, positional);

        return Success;
    }
    catch (const Stamp::UsageError &e)
    {
        logs::app()->debug("Usage error: {}", e.what());
        m_err << "stamp: error: " << e.what() << '\n';
        return UsageFailure;
    }
    catch (const Stamp::NotFoundError &e)
    {
        m_err << "stamp: error: " << e.what() << '\n';
        return NotFound;
    }
    catch (const Stamp::StorageError &e)
    {
        logs::app()->critical("Storage error: {}", e.what());
        m_err << "stamp: error: " << e.what() << '\n';
        return StorageFailure;
    }
}

bool CommandRunner::parseSubcommand(QCommandLineParser &parser, const QString &command, const QStringList &arguments)
{
    const auto helpOption = parser.addHelpOption();

    if (!parser.parse(QStringList{QStringLiteral("stamp ") + command} + arguments))
        usageError(parser.errorText());

    if (parser.isSet(helpOption))
    {
        m_out << parser.helpText();
        return false;
    }

    if (!parser.positionalArguments().isEmpty())
        usageError(QObject::tr("Unexpected argument: %1").arg(parser.positionalArguments().constFirst()));

    return true;
}

void CommandRunner::add(Ledger &ledger, const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Add or update the hours of a day, optionally with a note."));

    QCommandLineOption dateOption{{QStringLiteral("d"), QStringLiteral("date")},
                                  QObject::tr("Date in YYYY-MM-DD format. Defaults to today."),
                                  QStringLiteral("date")};
    QCommandLineOption startOption{{QStringLiteral("s"), QStringLiteral("start")},
                                   QObject::tr("Start time in HH:MM format, or \"now\"."),
                                   QStringLiteral("time")};
    QCommandLineOption endOption{{QStringLiteral("e"), QStringLiteral("end")},
                                 QObject::tr("End time in HH:MM format, or \"now\"."),
                                 QStringLiteral("time")};
    QCommandLineOption breakOption{{QStringLiteral("b"), QStringLiteral("break")},
                                   QObject::tr("Break duration in minutes."),
                                   QStringLiteral("minutes")};
    QCommandLineOption noteOption{{QStringLiteral("n"), QStringLiteral("note")},
                                  QObject::tr("Add a note for the day."),
                                  QStringLiteral("text")};
    QCommandLineOption overwriteOption{{QStringLiteral("o"), QStringLiteral("overwrite")},
                                       QObject::tr("Replace values that are already stored (true or false). Defaults to true."),
                                       QStringLiteral("bool"),
                                       QStringLiteral("true")};
    parser.addOptions({dateOption, startOption, endOption, breakOption, noteOption, overwriteOption});

    if (!parseSubcommand(parser, QStringLiteral("add"), arguments))
        return;

    if (!parser.isSet(startOption) && !parser.isSet(endOption) && !parser.isSet(breakOption) && !parser.isSet(noteOption))
        usageError(QObject::tr("At least one of --start, --end, --break or --note needs to be set."));

    const auto clock = m_clock();
    const auto date = parser.isSet(dateOption) ? requireDate(parser.value(dateOption)) : clock.date();

    const auto overwrite = Stamp::parseBool(parser.value(overwriteOption));
    if (!overwrite)
        usageError(QObject::tr("Value %1 not valid for --overwrite. Please use true or false.").arg(parser.value(overwriteOption)));

    DayUpdate update;
    if (parser.isSet(startOption))
        update.startTime = requireTime(parser.value(startOption), clock);
    if (parser.isSet(endOption))
        update.endTime = requireTime(parser.value(endOption), clock);
    if (parser.isSet(breakOption))
        update.breakMinutes = requireMinutes(parser.value(breakOption));

    ledger.addOrUpdateDay(date, update, *overwrite);

    if (parser.isSet(noteOption))
    {
        const auto id = ledger.addNote(date, parser.value(noteOption));
        logs::app()->debug("Added note {} for {}", id, Stamp::dateKey(date).toStdString());
    }
}

void CommandRunner::remove(Ledger &ledger, const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Remove a note by id, or a day by date."));

    QCommandLineOption idOption{{QStringLiteral("i"), QStringLiteral("id")}, QObject::tr("Id of the note to remove."), QStringLiteral("id")};
    QCommandLineOption dateOption{{QStringLiteral("d"), QStringLiteral("date")},
                                  QObject::tr("Date of the day to remove, in YYYY-MM-DD format."),
                                  QStringLiteral("date")};
    parser.addOptions({idOption, dateOption});

    if (!parseSubcommand(parser, QStringLiteral("rm"), arguments))
        return;

    if (parser.isSet(idOption) == parser.isSet(dateOption))
        usageError(QObject::tr("Exactly one of --id or --date needs to be set."));

    if (parser.isSet(idOption))
    {
        bool ok = false;
        const auto id = parser.value(idOption).toLongLong(&ok);
        if (!ok)
            usageError(QObject::tr("Value %1 not valid. Please give a numeric note id.").arg(parser.value(idOption)));
        ledger.removeNote(id);
    }
    else
    {
        ledger.removeDay(requireDate(parser.value(dateOption)));
    }
}

void CommandRunner::show(Ledger &ledger, const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Show days with their working hours and overtime. Defaults to the current month."));

    QCommandLineOption dateOption{{QStringLiteral("d"), QStringLiteral("date")},
                                  QObject::tr("Show a single day, in YYYY-MM-DD format."),
                                  QStringLiteral("date")};
    QCommandLineOption monthOption{{QStringLiteral("m"), QStringLiteral("month")},
                                   QObject::tr("Show a month, in MM format. Uses the current year unless --year is set."),
                                   QStringLiteral("month")};
    QCommandLineOption yearOption{{QStringLiteral("y"), QStringLiteral("year")},
                                  QObject::tr("Show a year, in YYYY format."),
                                  QStringLiteral("year")};
    QCommandLineOption allOption{{QStringLiteral("a"), QStringLiteral("all")}, QObject::tr("Show every day.")};
    QCommandLineOption notesOption{{QStringLiteral("n"), QStringLiteral("notes")}, QObject::tr("Include notes.")};
    QCommandLineOption formatOption{{QStringLiteral("f"), QStringLiteral("format")},
                                    QObject::tr("Output format: %1.").arg(AbstractFormatter::availableFormats().join(QStringLiteral(", "))),
                                    QStringLiteral("format")};
    parser.addOptions({dateOption, monthOption, yearOption, allOption, notesOption, formatOption});

    if (!parseSubcommand(parser, QStringLiteral("show"), arguments))
        return;

    const bool hasDate = parser.isSet(dateOption);
    const bool hasMonth = parser.isSet(monthOption);
    const bool hasYear = parser.isSet(yearOption);
    const bool hasAll = parser.isSet(allOption);

    if (hasDate && (hasMonth || hasYear || hasAll))
        usageError(QObject::tr("If --date is set, --month, --year and --all must not be set."));
    if (hasMonth && hasAll)
        usageError(QObject::tr("If --month is set, --date and --all must not be set."));
    if (hasYear && hasAll)
        usageError(QObject::tr("If --year is set, --date and --all must not be set."));

    QString formatName{QStringLiteral("table")};
    if (parser.isSet(formatOption))
        formatName = parser.value(formatOption);
    else if (auto settings = Settings::instance(); settings)
        formatName = settings->defaultFormat();
    const auto formatter = AbstractFormatter::create(formatName);

    std::optional<int> year;
    if (hasYear)
    {
        year = Stamp::parseYear(parser.value(yearOption));
        if (!year)
            usageError(QObject::tr("Value %1 not valid. Please use format YYYY.").arg(parser.value(yearOption)));
    }

    auto filter = Filter::unbounded();
    if (hasDate)
    {
        filter = Filter::exactDate(requireDate(parser.value(dateOption)));
    }
    else if (hasMonth)
    {
        const auto month = Stamp::parseMonth(parser.value(monthOption));
        if (!month)
            usageError(QObject::tr("Value %1 not valid. Please use format MM.").arg(parser.value(monthOption)));
        filter = Filter::month(*month, year);
    }
    else if (hasYear)
    {
        filter = Filter::year(*year);
    }
    else if (!hasAll)
    {
        const auto today = m_clock().date();
        filter = Filter::month(today.month(), today.year());
    }

    auto text = formatter->format(ledger.queryDays(filter, parser.isSet(notesOption)));
    if (!text.isEmpty() && !text.endsWith('\n'))
        text += '\n';
    m_out << text;
}

void CommandRunner::dump(Ledger &ledger, const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Write every day and note to .dump files."));

    QCommandLineOption destinationOption{{QStringLiteral("d"), QStringLiteral("destination")},
                                         QObject::tr("Existing folder to write the dump files to."),
                                         QStringLiteral("folder")};
    parser.addOption(destinationOption);

    if (!parseSubcommand(parser, QStringLiteral("dump"), arguments))
        return;

    const auto paths = DumpWriter{ledger.store()}.write(requireValue(parser, destinationOption));
    logs::app()->debug("Dump written to {}", paths.join(QStringLiteral(", ")).toStdString());
}

void CommandRunner::check(Ledger &ledger, const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("List days with a missing start time, end time or break."));

    if (!parseSubcommand(parser, QStringLiteral("check"), arguments))
        return;

    for (const auto &day : ledger.listIncomplete())
    {
        for (const auto &field : day.missingFields)
            m_out << "Missing " << field << " for " << Stamp::dateKey(day.date) << '\n';
    }
}

void CommandRunner::config(Ledger &ledger, const QStringList &arguments)
{
    auto rest = arguments;
    if (rest.isEmpty() || rest.constFirst().startsWith('-'))
    {
        if (rest.contains(QStringLiteral("-h")) || rest.contains(QStringLiteral("--help")))
        {
            m_out << QObject::tr("Usage: stamp config <set|list|rm> [options]\n"
                                 "Read and change ledger settings such as %1.\n")
                         .arg(Stamp::expectedWorkdayHoursKey);
            return;
        }
        usageError(QObject::tr("Missing config action: set, list or rm."));
    }

    const auto action = rest.takeFirst();

    QCommandLineParser parser;
    QCommandLineOption keyOption{{QStringLiteral("k"), QStringLiteral("key")}, QObject::tr("Setting name."), QStringLiteral("key")};
    QCommandLineOption valueOption{{QStringLiteral("v"), QStringLiteral("value")}, QObject::tr("Setting value."), QStringLiteral("value")};

    if (action == QStringLiteral("set"))
    {
        parser.setApplicationDescription(QObject::tr("Set a ledger setting."));
        parser.addOptions({keyOption, valueOption});
        if (!parseSubcommand(parser, QStringLiteral("config set"), rest))
            return;

        const auto key = requireValue(parser, keyOption);
        const auto value = requireValue(parser, valueOption);
        if (key == Stamp::expectedWorkdayHoursKey && !Stamp::parseNumber(value))
            usageError(QObject::tr("Value %1 not valid for %2. Please give a number of hours.").arg(value, key));
        ledger.setSetting(key, value);
    }
    else if (action == QStringLiteral("list"))
    {
        parser.setApplicationDescription(QObject::tr("List ledger settings, or a single one."));
        parser.addOption(keyOption);
        if (!parseSubcommand(parser, QStringLiteral("config list"), rest))
            return;

        if (parser.isSet(keyOption))
        {
            const auto key = parser.value(keyOption);
            m_out << key << " = " << ledger.getSetting(key) << '\n';
            return;
        }

        for (const auto &[key, value] : ledger.settings())
            m_out << key << " = " << value << '\n';
    }
    else if (action == QStringLiteral("rm"))
    {
        parser.setApplicationDescription(QObject::tr("Remove a ledger setting."));
        parser.addOption(keyOption);
        if (!parseSubcommand(parser, QStringLiteral("config rm"), rest))
            return;

        ledger.deleteSetting(requireValue(parser, keyOption));
    }
    else
    {
        usageError(QObject::tr("Unknown config action: %1 (use set, list or rm)").arg(action));
    }
}
