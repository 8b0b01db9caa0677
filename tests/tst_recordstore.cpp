#include <QtTest>

#include <memory>

#include "Errors.h"
#include "RecordStore.h"
#include "Utils.h"

class RecordStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
        m_store = std::make_unique<RecordStore>(m_dir->filePath(QStringLiteral("ledger.db")));
    }

    void cleanup()
    {
        m_store.reset();
        m_dir.reset();
    }

    void createsMissingFolders()
    {
        const auto path = m_dir->filePath(QStringLiteral("nested/deeper/ledger.db"));
        RecordStore store{path};
        QVERIFY(QFile::exists(path));
    }

    void seedsWorkdayLengthOnce()
    {
        QCOMPARE(m_store->setting(Stamp::expectedWorkdayHoursKey).value(), QStringLiteral("7.8"));

        m_store->removeSetting(Stamp::expectedWorkdayHoursKey);
        m_store.reset();

        // reopening an existing ledger must not bring the removed value back
        RecordStore reopened{m_dir->filePath(QStringLiteral("ledger.db"))};
        QVERIFY(!reopened.setting(Stamp::expectedWorkdayHoursKey));
    }

    void upsertReplacesWholeRecord()
    {
        const QDate date{2024, 5, 6};
        QVERIFY(!m_store->get(date));

        m_store->upsert(DayRecord{date, QTime{9, 0}, QTime{17, 0}, 30.});
        m_store->upsert(DayRecord{date, QTime{10, 0}, std::nullopt, std::nullopt});

        auto record = m_store->get(date);
        QVERIFY(record);
        QCOMPARE(record->startTime().value(), QTime(10, 0));
        QVERIFY(!record->endTime());
        QVERIFY(!record->breakMinutes());
    }

    void fractionalBreaksSurvive()
    {
        const QDate date{2024, 5, 6};
        m_store->upsert(DayRecord{date, std::nullopt, std::nullopt, 12.5});
        QCOMPARE(m_store->get(date)->breakMinutes().value(), 12.5);
    }

    void unreadableTimesAreAbsent()
    {
        const QDate date{2024, 5, 8};
        m_store->upsert(DayRecord{date, QTime{9, 0}, QTime{17, 0}, 30.});

        {
            auto db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), QStringLiteral("raw"));
            db.setDatabaseName(m_dir->filePath(QStringLiteral("ledger.db")));
            QVERIFY(db.open());
            QSqlQuery query{db};
            QVERIFY(query.exec(QStringLiteral("UPDATE work_hours SET start_time = '9am' WHERE date = '2024-05-08'")));
        }
        QSqlDatabase::removeDatabase(QStringLiteral("raw"));

        auto record = m_store->get(date);
        QVERIFY(record);
        QVERIFY(!record->startTime());
        QCOMPARE(record->endTime().value(), QTime(17, 0));
        QVERIFY(!record->hasWorkingTime());
    }

    void removingMissingThingsIsNoop()
    {
        m_store->remove(QDate{2020, 1, 1});
        m_store->removeNote(4242);
        m_store->removeSetting(QStringLiteral("nothing"));
        QVERIFY(m_store->allRecords().isEmpty());
    }

    void removeKeepsNotes()
    {
        const QDate date{2024, 5, 6};
        m_store->addNote(date, QStringLiteral("standup"));
        m_store->remove(date);

        QVERIFY(!m_store->get(date));
        QCOMPARE(m_store->notesFor(date).size(), 1);
    }

    void noteCreatesEmptyDay()
    {
        const QDate date{2024, 5, 7};
        const auto id = m_store->addNote(date, QStringLiteral("first"));
        QVERIFY(id > 0);

        auto record = m_store->get(date);
        QVERIFY(record);
        QVERIFY(!record->startTime());
        QVERIFY(!record->endTime());
        QVERIFY(!record->breakMinutes());
    }

    void noteLeavesExistingDayAlone()
    {
        const QDate date{2024, 5, 7};
        const DayRecord day{date, QTime{8, 15}, QTime{16, 45}, 20.};
        m_store->upsert(day);
        m_store->addNote(date, QStringLiteral("review"));
        QCOMPARE(m_store->get(date).value(), day);
    }

    void noteIdsAreNeverReused()
    {
        const QDate date{2024, 5, 7};
        const auto first = m_store->addNote(date, QStringLiteral("a"));
        const auto second = m_store->addNote(date, QStringLiteral("b"));
        QVERIFY(second > first);

        m_store->removeNote(second);
        const auto third = m_store->addNote(date, QStringLiteral("c"));
        QVERIFY(third > second);

        const auto notes = m_store->notesFor(date);
        QCOMPARE(notes.size(), 2);
        QCOMPARE(notes[0].text(), QStringLiteral("a"));
        QCOMPARE(notes[1].text(), QStringLiteral("c"));
        QCOMPARE(notes[1].id(), third);
    }

    void recordsAreOrderedByDate()
    {
        m_store->upsert(DayRecord{QDate{2024, 2, 1}});
        m_store->upsert(DayRecord{QDate{2023, 12, 31}});
        m_store->upsert(DayRecord{QDate{2024, 1, 15}});

        auto records = m_store->allRecords();
        QCOMPARE(records.size(), 3);
        QCOMPARE(records[0].date(), QDate(2023, 12, 31));
        QCOMPARE(records[1].date(), QDate(2024, 1, 15));
        QCOMPARE(records[2].date(), QDate(2024, 2, 1));

        auto in2024 = m_store->allRecords([](const DayRecord &r) { return r.date().year() == 2024; });
        QCOMPARE(in2024.size(), 2);
    }

    void settingsRoundTrip()
    {
        m_store->setSetting(QStringLiteral("team"), QStringLiteral("core"));
        m_store->setSetting(QStringLiteral("team"), QStringLiteral("infra"));
        QCOMPARE(m_store->setting(QStringLiteral("team")).value(), QStringLiteral("infra"));

        auto all = m_store->settings();
        QCOMPARE(all.size(), 2);
        QCOMPARE(all[0].first, Stamp::expectedWorkdayHoursKey);
        QCOMPARE(all[1].first, QStringLiteral("team"));
    }

    void unopenableDatabaseThrows()
    {
        // a directory cannot be opened as a database file
        QVERIFY_THROWS_EXCEPTION(Stamp::StorageError, RecordStore{m_dir->path()});
    }

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<RecordStore> m_store;
};

QTEST_GUILESS_MAIN(RecordStoreTest)
#include "tst_recordstore.moc"
