#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QCommandLineParser>
#include <QDateTime>
#include <QStringList>
#include <QTextStream>

#include <functional>

class Ledger;

//! The `stamp` command line. Parses one invocation, runs it against the ledger and reports failures as exit codes.
class CommandRunner
{
public:
    enum ExitCode
    {
        Success = 0,
        UsageFailure = 1,
        NotFound = 1,
        StorageFailure = 2,
    };

    CommandRunner(QTextStream &out, QTextStream &err);

    //! \a arguments starts with the program name, like QCoreApplication::arguments().
    int run(const QStringList &arguments);

    //! Where "today" and "now" come from. Defaults to the local wall clock.
    void setClock(std::function<QDateTime()> clock) { m_clock = std::move(clock); }

private:
    int execute(const QStringList &arguments);

    //! Returns false if the subcommand's help was printed instead.
    bool parseSubcommand(QCommandLineParser &parser, const QString &command, const QStringList &arguments);

    void add(Ledger &ledger, const QStringList &arguments);
    void remove(Ledger &ledger, const QStringList &arguments);
    void show(Ledger &ledger, const QStringList &arguments);
    void dump(Ledger &ledger, const QStringList &arguments);
    void check(Ledger &ledger, const QStringList &arguments);
    void config(Ledger &ledger, const QStringList &arguments);

    QTextStream &m_out;
    QTextStream &m_err;
    std::function<QDateTime()> m_clock;
};

#endif // COMMANDRUNNER_H
