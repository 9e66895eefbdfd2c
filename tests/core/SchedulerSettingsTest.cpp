#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include <memory>

#include "timeblock/core/SchedulerSettings.hpp"

using namespace timeblock;

class SchedulerSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void emptyStoreGivesDefaultWindows();
    void windowsRoundTripThroughIni();
    void entriesWithoutIdAreSkipped();
    void decodeSkipsMalformedParts();
    void encodeSchedule();
    void optionsDefaultWhenUnset();
    void optionsRoundTrip();
    void unknownOptionValuesKeepDefaults();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<QSettings> m_settings;
};

void SchedulerSettingsTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settings = std::make_unique<QSettings>(m_dir->filePath(QStringLiteral("timeblock.ini")), QSettings::IniFormat);
}

void SchedulerSettingsTest::cleanup()
{
    m_settings.reset();
    m_dir.reset();
}

void SchedulerSettingsTest::emptyStoreGivesDefaultWindows()
{
    core::SchedulerSettings settings(*m_settings);
    const auto windows = settings.loadTimeWindows();
    QCOMPARE(windows.size(), static_cast<size_t>(2));
    QCOMPARE(windows[0].id, QStringLiteral("work"));
    QCOMPARE(windows[1].id, QStringLiteral("personal"));
}

void SchedulerSettingsTest::windowsRoundTripThroughIni()
{
    data::TimeWindow focus;
    focus.id = QStringLiteral("focus");
    focus.name = QStringLiteral("Deep focus");
    focus.color = QStringLiteral("#8e44ad");
    focus.priority = 12;
    focus.schedule[2].append(data::TimeRange{ 8 * 60, 11 * 60 + 30 });
    focus.schedule[2].append(data::TimeRange{ 14 * 60, 16 * 60 });
    focus.schedule[4].append(data::TimeRange{ 22 * 60, data::kMinutesPerDay });

    {
        core::SchedulerSettings settings(*m_settings);
        settings.saveTimeWindows({ focus });
        m_settings->sync();
    }

    QSettings reopened(m_settings->fileName(), QSettings::IniFormat);
    core::SchedulerSettings settings(reopened);
    const auto windows = settings.loadTimeWindows();
    QCOMPARE(windows.size(), static_cast<size_t>(1));

    const auto &loaded = windows.front();
    QCOMPARE(loaded.id, focus.id);
    QCOMPARE(loaded.name, focus.name);
    QCOMPARE(loaded.color, focus.color);
    QCOMPARE(loaded.priority, 12);
    QCOMPARE(loaded.schedule.keys(), QList<int>({ 2, 4 }));
    QCOMPARE(loaded.rangesFor(2).size(), 2);
    QCOMPARE(loaded.rangesFor(2).at(0).endMinute, 690);
    QCOMPARE(loaded.rangesFor(2).at(1).startMinute, 840);
    QCOMPARE(loaded.rangesFor(4).at(0).endMinute, data::kMinutesPerDay);
}

void SchedulerSettingsTest::entriesWithoutIdAreSkipped()
{
    m_settings->beginWriteArray(QStringLiteral("timeWindows"), 2);
    m_settings->setArrayIndex(0);
    m_settings->setValue(QStringLiteral("name"), QStringLiteral("Nameless"));
    m_settings->setArrayIndex(1);
    m_settings->setValue(QStringLiteral("id"), QStringLiteral("gym"));
    m_settings->setValue(QStringLiteral("priority"), 3);
    m_settings->setValue(QStringLiteral("schedule"), QStringLiteral("6=07:00-08:30"));
    m_settings->endArray();

    core::SchedulerSettings settings(*m_settings);
    const auto windows = settings.loadTimeWindows();
    QCOMPARE(windows.size(), static_cast<size_t>(1));
    QCOMPARE(windows[0].id, QStringLiteral("gym"));
    QCOMPARE(windows[0].name, QStringLiteral("gym"));
    QCOMPARE(windows[0].rangesFor(6).at(0).startMinute, 420);
}

void SchedulerSettingsTest::decodeSkipsMalformedParts()
{
    const auto schedule = core::SchedulerSettings::decodeSchedule(
        QStringLiteral("1=09:00-17:00;x=10:00-11:00;9=10:00-11:00;2=12:00-10:00,13:00-14:00;3=25:00-26:00;5"));

    QCOMPARE(schedule.keys(), QList<int>({ 1, 2 }));
    QCOMPARE(schedule.value(1).size(), 1);
    QCOMPARE(schedule.value(2).size(), 1);
    QCOMPARE(schedule.value(2).at(0).startMinute, 13 * 60);
}

void SchedulerSettingsTest::encodeSchedule()
{
    QMap<int, QVector<data::TimeRange>> schedule;
    schedule[1].append(data::TimeRange{ 540, 1020 });
    schedule[2].append(data::TimeRange{ 540, 1020 });
    schedule[2].append(data::TimeRange{ 1080, 1200 });
    schedule[3];

    QCOMPARE(core::SchedulerSettings::encodeSchedule(schedule),
             QStringLiteral("1=09:00-17:00;2=09:00-17:00,18:00-20:00"));
}

void SchedulerSettingsTest::optionsDefaultWhenUnset()
{
    core::SchedulerSettings settings(*m_settings);
    const auto options = settings.loadSchedulerOptions();
    QVERIFY(options.urgencyFormula == scheduling::UrgencyFormula::Logarithmic);
    QVERIFY(options.slotOrdering == scheduling::SlotOrdering::Chronological);
}

void SchedulerSettingsTest::optionsRoundTrip()
{
    core::SchedulerSettings settings(*m_settings);
    scheduling::SchedulerOptions options;
    options.urgencyFormula = scheduling::UrgencyFormula::Linear;
    options.slotOrdering = scheduling::SlotOrdering::Rules;
    settings.saveSchedulerOptions(options);

    QCOMPARE(m_settings->value(QStringLiteral("scheduler/urgencyFormula")).toString(), QStringLiteral("linear"));

    const auto loaded = settings.loadSchedulerOptions();
    QVERIFY(loaded.urgencyFormula == scheduling::UrgencyFormula::Linear);
    QVERIFY(loaded.slotOrdering == scheduling::SlotOrdering::Rules);
}

void SchedulerSettingsTest::unknownOptionValuesKeepDefaults()
{
    m_settings->setValue(QStringLiteral("scheduler/urgencyFormula"), QStringLiteral("exponential"));
    m_settings->setValue(QStringLiteral("scheduler/slotOrdering"), QStringLiteral("RULES"));

    core::SchedulerSettings settings(*m_settings);
    const auto options = settings.loadSchedulerOptions();
    QVERIFY(options.urgencyFormula == scheduling::UrgencyFormula::Logarithmic);
    QVERIFY(options.slotOrdering == scheduling::SlotOrdering::Rules);
}

QTEST_GUILESS_MAIN(SchedulerSettingsTest)
#include "SchedulerSettingsTest.moc"
