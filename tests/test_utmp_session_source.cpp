#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <cstring>
#include <ctime>
#include <vector>

#include <utmp.h>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "sessions/utmp_session_source.hpp"

using sessionwatch::ProcessStatus;
using sessionwatch::SessionSet;
using sessionwatch::UtmpSessionSource;

namespace {

constexpr pid_t kAlivePid = 100;
constexpr pid_t kForeignPid = 200;
constexpr pid_t kGonePid = 300;

struct utmp makeRecord(short type, const char *user, const char *line,
                       const char *host, pid_t pid, std::time_t loginTime)
{
    struct utmp record;
    std::memset(&record, 0, sizeof(record));
    record.ut_type = type;
    record.ut_pid = pid;
    std::strncpy(record.ut_user, user, sizeof(record.ut_user));
    std::strncpy(record.ut_line, line, sizeof(record.ut_line));
    std::strncpy(record.ut_host, host, sizeof(record.ut_host));
    record.ut_tv.tv_sec = static_cast<decltype(record.ut_tv.tv_sec)>(loginTime);
    return record;
}

ProcessStatus fakeProbe(pid_t pid)
{
    switch (pid) {
    case kAlivePid:
        return ProcessStatus::Alive;
    case kForeignPid:
        return ProcessStatus::AliveNotPermitted;
    default:
        return ProcessStatus::Gone;
    }
}

} // namespace

class UtmpSessionSourceTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testUserProcessRecordsOnly();
    void testDeadSkippedAndIgnoredFlagged();
    void testCurrentAndPermissionFlags();
    void testMissingFileThrows();
    void testTruncatedFileThrows();
    void testEmptyFileHasNoSessions();
    void testRealProbeSkipsExitedProcess();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeUtmp(const QString &name, const std::vector<struct utmp> &records);
};

void UtmpSessionSourceTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    sessionwatch::logging::initLogging(QStringLiteral("sessionwatch-test"), false);
}

void UtmpSessionSourceTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString UtmpSessionSourceTests::writeUtmp(const QString &name,
                                          const std::vector<struct utmp> &records)
{
    const QString path = m_tempDir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    for (const auto &record : records) {
        file.write(reinterpret_cast<const char *>(&record), sizeof(record));
    }
    return path;
}

void UtmpSessionSourceTests::testUserProcessRecordsOnly()
{
    const QString path = writeUtmp(QStringLiteral("types"), {
        makeRecord(BOOT_TIME, "reboot", "~", "6.1.0", 0, 1700000000),
        makeRecord(INIT_PROCESS, "", "tty1", "", kAlivePid, 1700000000),
        makeRecord(LOGIN_PROCESS, "LOGIN", "tty3", "", kAlivePid, 1700000000),
        makeRecord(USER_PROCESS, "alice", "tty2", "", kAlivePid, 1700000100),
        makeRecord(DEAD_PROCESS, "", "pts/1", "", kGonePid, 1700000000),
    });
    QVERIFY(!path.isEmpty());

    UtmpSessionSource source(path, {}, QString(), fakeProbe);
    const SessionSet sessions = source.listSessions();
    QCOMPARE(sessions.size(), static_cast<size_t>(1));

    const auto &session = *sessions.begin();
    QCOMPARE(QString::fromStdString(session.user), QStringLiteral("alice"));
    QCOMPARE(QString::fromStdString(session.line), QStringLiteral("tty2"));
    QCOMPARE(QString::fromStdString(session.id), QStringLiteral("tty2#100"));
    QCOMPARE(session.pid, kAlivePid);
    QCOMPARE(std::chrono::system_clock::to_time_t(session.loginTime),
             static_cast<std::time_t>(1700000100));
}

void UtmpSessionSourceTests::testDeadSkippedAndIgnoredFlagged()
{
    const QString path = writeUtmp(QStringLiteral("filtered"), {
        makeRecord(USER_PROCESS, "alice", ":0", ":0", kAlivePid, 1700000000),
        makeRecord(USER_PROCESS, "gdm", ":1", "login screen", kAlivePid + 1, 1700000000),
        makeRecord(USER_PROCESS, "bob", "pts/0", "10.0.0.5", kGonePid, 1700000000),
        makeRecord(USER_PROCESS, "carol", "pts/1", "jump.example", kForeignPid, 1700000000),
    });

    UtmpSessionSource source(path, {QStringLiteral("login screen")}, QString(),
                             [](pid_t pid) {
                                 return pid == kAlivePid + 1 ? ProcessStatus::Alive
                                                             : fakeProbe(pid);
                             });
    const SessionSet sessions = source.listSessions();
    QCOMPARE(sessions.size(), static_cast<size_t>(3));
    QVERIFY(sessions.contains(":0#100"));
    QVERIFY(sessions.contains("pts/1#200"));
    QVERIFY(!sessions.contains("pts/0#300"));

    const auto *greeter = sessions.find(":1#101");
    QVERIFY(greeter);
    QVERIFY(greeter->ignored);
    QVERIFY(greeter->canTerminate);
    QVERIFY(!sessions.find(":0#100")->ignored);
    QVERIFY(!sessions.find("pts/1#200")->ignored);
}

void UtmpSessionSourceTests::testCurrentAndPermissionFlags()
{
    const QString path = writeUtmp(QStringLiteral("flags"), {
        makeRecord(USER_PROCESS, "alice", ":0", ":0", kAlivePid, 1700000000),
        makeRecord(USER_PROCESS, "root", "pts/4", "", kForeignPid, 1700000000),
    });

    UtmpSessionSource source(path, {}, QStringLiteral(":0"), fakeProbe);
    const SessionSet sessions = source.listSessions();
    QCOMPARE(sessions.size(), static_cast<size_t>(2));

    const auto *mine = sessions.find(":0#100");
    QVERIFY(mine);
    QVERIFY(mine->isCurrent);
    QVERIFY(mine->canTerminate);
    QCOMPARE(QString::fromStdString(mine->host), QStringLiteral(":0"));

    const auto *other = sessions.find("pts/4#200");
    QVERIFY(other);
    QVERIFY(!other->isCurrent);
    QVERIFY(!other->canTerminate);
}

void UtmpSessionSourceTests::testMissingFileThrows()
{
    UtmpSessionSource source(m_tempDir.filePath(QStringLiteral("does-not-exist")),
                             {}, QString(), fakeProbe);
    QVERIFY_EXCEPTION_THROWN(source.listSessions(), sessionwatch::SessionQueryError);
}

void UtmpSessionSourceTests::testTruncatedFileThrows()
{
    const QString path = writeUtmp(QStringLiteral("truncated"), {
        makeRecord(USER_PROCESS, "alice", "tty2", "", kAlivePid, 1700000000),
    });
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
    file.write("partial");
    file.close();

    UtmpSessionSource source(path, {}, QString(), fakeProbe);
    QVERIFY_EXCEPTION_THROWN(source.listSessions(), sessionwatch::SessionQueryError);
}

void UtmpSessionSourceTests::testEmptyFileHasNoSessions()
{
    const QString path = writeUtmp(QStringLiteral("empty"), {});
    UtmpSessionSource source(path, {}, QString(), fakeProbe);
    QVERIFY(source.listSessions().empty());
}

void UtmpSessionSourceTests::testRealProbeSkipsExitedProcess()
{
    // Above the largest pid_max Linux allows, so never a live process.
    const pid_t exitedPid = 0x7ffffff0;
    const pid_t self = static_cast<pid_t>(QCoreApplication::applicationPid());
    const QString path = writeUtmp(QStringLiteral("real-probe"), {
        makeRecord(USER_PROCESS, "alice", "pts/7", "", self, 1700000000),
        makeRecord(USER_PROCESS, "bob", "pts/8", "", exitedPid, 1700000000),
    });

    UtmpSessionSource source(path, {}, QString());
    const SessionSet sessions = source.listSessions();
    QCOMPARE(sessions.size(), static_cast<size_t>(1));
    QVERIFY(sessions.begin()->canTerminate);
    QCOMPARE(QString::fromStdString(sessions.begin()->user), QStringLiteral("alice"));

    QVERIFY(sessionwatch::probeProcess(exitedPid) == ProcessStatus::Gone);
    QVERIFY(sessionwatch::probeProcess(0) == ProcessStatus::Gone);
}

QTEST_GUILESS_MAIN(UtmpSessionSourceTests)
#include "test_utmp_session_source.moc"
