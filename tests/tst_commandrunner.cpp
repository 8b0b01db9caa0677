#include <QtTest>

#include <nlohmann/json.hpp>

#include <memory>

#include "CommandRunner.h"
#include "Settings.h"

class CommandRunnerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QVERIFY(m_settingsDir.isValid());
        Settings::init(m_settingsDir.filePath(QStringLiteral("stamp.ini")));
    }

    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
    }

    void cleanup()
    {
        m_dir.reset();
    }

    void addThenShow()
    {
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "09:00", "-e", "17:00", "-b", "30"}), 0);
        QCOMPARE(m_out, QString{});

        QCOMPARE(run({"show", "-m", "03", "-y", "2024", "-f", "json"}), 0);
        const auto j = nlohmann::json::parse(m_out.toStdString());
        QCOMPARE(j.size(), std::size_t{1});
        QCOMPARE(j[0]["working_hours"].get<double>(), 7.5);
        QCOMPARE(j[0]["overtime_hours"].get<double>(), -0.3);
    }

    void nowUsesClock()
    {
        QCOMPARE(run({"add", "-s", "now", "-n", "started"}), 0);
        QCOMPARE(run({"show", "-d", "2024-03-15", "-n", "-f", "json"}), 0);

        const auto j = nlohmann::json::parse(m_out.toStdString());
        QCOMPARE(j[0]["start_time"].get<std::string>(), std::string{"10:30"});
        QCOMPARE(j[0]["notes"][0]["note"].get<std::string>(), std::string{"started"});
    }

    void fillGapsWithOverwriteOff()
    {
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "07:00"}), 0);
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "12:00", "-e", "16:00", "-o", "false"}), 0);
        QCOMPARE(run({"show", "-d", "2024-03-04", "-f", "json"}), 0);

        const auto j = nlohmann::json::parse(m_out.toStdString());
        QCOMPARE(j[0]["start_time"].get<std::string>(), std::string{"07:00"});
        QCOMPARE(j[0]["end_time"].get<std::string>(), std::string{"16:00"});
    }

    void defaultShowIsCurrentMonth()
    {
        QCOMPARE(run({"add", "-d", "2024-02-28", "-s", "09:00"}), 0);
        QCOMPARE(run({"add", "-d", "2024-03-01", "-s", "09:00"}), 0);
        QCOMPARE(run({"show", "-f", "markdown"}), 0);
        QCOMPARE(m_out, QStringLiteral("## 2024-03-01 | 09:00 - \n\n\n\n"));

        QCOMPARE(run({"show", "-a", "-f", "markdown"}), 0);
        QVERIFY(m_out.startsWith(QStringLiteral("## 2024-02-28")));
    }

    void tableIsDefaultFormat()
    {
        QCOMPARE(run({"add", "-d", "2024-03-04", "-b", "15"}), 0);
        QCOMPARE(run({"show"}), 0);
        QVERIFY(m_out.startsWith(QStringLiteral("| date ")));
        QVERIFY(m_out.endsWith(QLatin1Char{'\n'}));
    }

    void usageErrors_data()
    {
        QTest::addColumn<QStringList>("arguments");

        QTest::newRow("unknown command") << QStringList{"frobnicate"};
        QTest::newRow("nothing to add") << QStringList{"add", "-d", "2024-03-04"};
        QTest::newRow("bad date") << QStringList{"add", "-d", "2024-3-4", "-s", "09:00"};
        QTest::newRow("bad time") << QStringList{"add", "-s", "9:00"};
        QTest::newRow("bad overwrite") << QStringList{"add", "-s", "09:00", "-o", "maybe"};
        QTest::newRow("date with month") << QStringList{"show", "-d", "2024-03-04", "-m", "03"};
        QTest::newRow("month with all") << QStringList{"show", "-m", "03", "-a"};
        QTest::newRow("year with all") << QStringList{"show", "-y", "2024", "-a"};
        QTest::newRow("bad month") << QStringList{"show", "-m", "13"};
        QTest::newRow("bad format") << QStringList{"show", "-f", "xml"};
        QTest::newRow("rm without target") << QStringList{"rm"};
        QTest::newRow("rm with both") << QStringList{"rm", "-i", "1", "-d", "2024-03-04"};
        QTest::newRow("unknown option") << QStringList{"check", "--verbose"};
        QTest::newRow("nan break") << QStringList{"add", "-b", "nan"};
        QTest::newRow("infinite break") << QStringList{"add", "-b", "inf"};
        QTest::newRow("negative break") << QStringList{"add", "-b", "-5"};
        QTest::newRow("nan workday") << QStringList{"config", "set", "-k", "expected_workday_hours", "-v", "nan"};
        QTest::newRow("infinite workday") << QStringList{"config", "set", "-k", "expected_workday_hours", "-v", "inf"};
        QTest::newRow("non-numeric workday") << QStringList{"config", "set", "-k", "expected_workday_hours", "-v", "long"};
        QTest::newRow("config without action") << QStringList{"config"};
        QTest::newRow("dump to nowhere") << QStringList{"dump", "-d", "/nonexistent/stamp-dump"};
    }

    void usageErrors()
    {
        QFETCH(QStringList, arguments);
        QCOMPARE(run(arguments), 1);
        QVERIFY(m_err.startsWith(QStringLiteral("stamp: error: ")));
    }

    void removeDayAndNote()
    {
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "09:00", "-n", "one"}), 0);
        QCOMPARE(run({"rm", "-i", "1"}), 0);
        QCOMPARE(run({"rm", "-i", "1"}), 0);
        QCOMPARE(run({"rm", "-d", "2024-03-04"}), 0);
        QCOMPARE(run({"show", "-a", "-f", "json"}), 0);
        QCOMPARE(m_out, QStringLiteral("[]\n"));
    }

    void check()
    {
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "09:00", "-e", "17:00"}), 0);
        QCOMPARE(run({"add", "-d", "2024-03-05", "-n", "sick"}), 0);
        QCOMPARE(run({"check"}), 0);
        QCOMPARE(m_out,
                 QStringLiteral("Missing break_minutes for 2024-03-04\n"
                                "Missing start_time for 2024-03-05\n"
                                "Missing end_time for 2024-03-05\n"
                                "Missing break_minutes for 2024-03-05\n"));
    }

    void config()
    {
        QCOMPARE(run({"config", "list"}), 0);
        QCOMPARE(m_out, QStringLiteral("expected_workday_hours = 7.8\n"));

        QCOMPARE(run({"config", "set", "-k", "expected_workday_hours", "-v", "8"}), 0);
        QCOMPARE(run({"config", "list", "-k", "expected_workday_hours"}), 0);
        QCOMPARE(m_out, QStringLiteral("expected_workday_hours = 8\n"));

        QCOMPARE(run({"config", "rm", "-k", "expected_workday_hours"}), 0);
        QCOMPARE(run({"config", "list", "-k", "expected_workday_hours"}), 1);
        QVERIFY(m_err.contains(QStringLiteral("expected_workday_hours")));
    }

    void dump()
    {
        QTemporaryDir target;
        QVERIFY(target.isValid());
        QCOMPARE(run({"add", "-d", "2024-03-04", "-s", "09:00"}), 0);
        QCOMPARE(run({"dump", "-d", target.path()}), 0);
        QVERIFY(QFile::exists(target.filePath(QStringLiteral("work_hours.dump"))));
        QVERIFY(QFile::exists(target.filePath(QStringLiteral("notes.dump"))));
    }

    void help()
    {
        QCOMPARE(run({"--help"}), 0);
        QVERIFY(m_out.contains(QStringLiteral("--database")));

        QCOMPARE(run({}), 0);
        QVERIFY(m_out.contains(QStringLiteral("command")));

        QCOMPARE(run({"show", "--help"}), 0);
        QVERIFY(m_out.contains(QStringLiteral("--format")));
    }

    void unopenableDatabase()
    {
        QStringList arguments{QStringLiteral("stamp"), QStringLiteral("--database"), m_dir->path(), QStringLiteral("check")};
        QTextStream out{&m_out};
        QTextStream err{&m_err};
        m_out.clear();
        m_err.clear();
        QCOMPARE(CommandRunner(out, err).run(arguments), 2);
    }

private:
    int run(const QStringList &arguments)
    {
        m_out.clear();
        m_err.clear();

        QTextStream out{&m_out};
        QTextStream err{&m_err};
        CommandRunner runner{out, err};
        runner.setClock([] { return QDateTime{QDate{2024, 3, 15}, QTime{10, 30, 42}}; });

        const auto databasePath = m_dir->filePath(QStringLiteral("ledger.db"));
        return runner.run(QStringList{QStringLiteral("stamp"), QStringLiteral("--database"), databasePath} + arguments);
    }

    QTemporaryDir m_settingsDir;
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_out;
    QString m_err;
};

QTEST_GUILESS_MAIN(CommandRunnerTest)
#include "tst_commandrunner.moc"
