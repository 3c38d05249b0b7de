#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTimeZone>
#include <QtTest>

#ifndef Q_MOC_RUN
import corebridge.tests.support;
#endif

namespace {
AgentCoreSwitchLog makeLog(qint64 hostId, const QDateTime& createdAt, const QString& switchId)
{
    AgentCoreSwitchLog log;
    log.switchId = switchId;
    log.agentHostId = hostId;
    log.fromInstanceId = QStringLiteral("node-1");
    log.toCoreType = QStringLiteral("xray");
    log.createdAt = createdAt;
    return log;
}

AgentCoreInstance makeInstance(qint64 hostId, const QString& instanceId)
{
    AgentCoreInstance instance;
    instance.agentHostId = hostId;
    instance.instanceId = instanceId;
    instance.coreType = QStringLiteral("sing-box");
    instance.configHash = QStringLiteral("abc");
    instance.listenPorts = {443, 8443};
    return instance;
}

SwitchLogUpdate terminal(SwitchStatus status, const QString& message)
{
    SwitchLogUpdate update;
    update.status = status;
    update.message = message;
    update.completedAt = QDateTime(QDate(2026, 1, 1), QTime(13, 0), QTimeZone::UTC);
    return update;
}
}

class TestLocalStore : public QObject
{
    Q_OBJECT

private slots:
    void persistsAcrossInstances();
    void sequencesNeverMoveBackwards();
    void instanceIdsAreUniquePerHost();
    void terminalLogsAreImmutable();
    void listsLogsNewestFirst();
    void filtersAndPagesLogs();
    void removingTemplateClearsAssignments();
    void reportsCorruptFile();
    void missingEntitiesAreNotFound();
};

void TestLocalStore::persistsAcrossInstances()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/store.json"));

    qint64 hostId = 0;
    {
        LocalStore store(path);
        QVERIFY(store.load());
        const std::optional<qint64> id = store.saveHost(makeHost(QStringLiteral("sing-box"), QStringLiteral("1.8.0")));
        QVERIFY(id.has_value());
        hostId = id.value();
        QVERIFY(store.setInventory(hostId, {makeRealityInbound()}, {makeUser(1, QStringLiteral("u1@example.com"))}));
        QVERIFY(store.coreInstances().create(makeInstance(hostId, QStringLiteral("node-1")), nullptr));
        QVERIFY(store.switchLogs().create(makeLog(hostId, QDateTime(QDate(2026, 1, 1), QTime(12, 0), QTimeZone::UTC),
                                                  QStringLiteral("s-1")), nullptr).has_value());
    }
    QVERIFY(QFile::exists(path));

    LocalStore reopened(path);
    PipelineError error;
    QVERIFY2(reopened.load(&error), qPrintable(error.toString()));

    const std::optional<AgentHost> host = reopened.agentHosts().findById(hostId, nullptr);
    QVERIFY(host.has_value());
    QCOMPARE(host->coreVersion, QStringLiteral("1.8.0"));
    QCOMPARE(host->token, QStringLiteral("secret-token"));

    const QList<Inbound> inbounds = reopened.inventory().inboundsForHost(hostId);
    QCOMPARE(inbounds.size(), 1);
    QVERIFY(inbounds.constFirst().hasReality());
    QCOMPARE(reopened.inventory().usersForHost(hostId).size(), 1);

    const std::optional<AgentCoreInstance> instance =
        reopened.coreInstances().findByHostAndInstance(hostId, QStringLiteral("node-1"), nullptr);
    QVERIFY(instance.has_value());
    QCOMPARE(instance->listenPorts, (QList<int> {443, 8443}));
    QCOMPARE(instance->status, InstanceStatus::Running);

    const SwitchLogPage page = reopened.switchLogs().list(SwitchLogFilter {});
    QCOMPARE(page.total, 1);
    QCOMPARE(page.rows.constFirst().switchId, QStringLiteral("s-1"));
    QCOMPARE(page.rows.constFirst().status, SwitchStatus::Pending);
}

void TestLocalStore::sequencesNeverMoveBackwards()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("store.json"));

    qint64 firstTemplate = 0;
    {
        LocalStore store(path);
        ConfigTemplate tmpl;
        tmpl.name = QStringLiteral("a");
        tmpl.type = QStringLiteral("sing-box");
        tmpl.content = singBoxTemplate();
        const std::optional<ConfigTemplate> first = store.configTemplates().create(tmpl, nullptr);
        const std::optional<ConfigTemplate> second = store.configTemplates().create(tmpl, nullptr);
        QVERIFY(first.has_value() && second.has_value());
        QVERIFY(second->id > first->id);
        firstTemplate = first->id;
        QVERIFY(store.configTemplates().remove(second->id, nullptr));
    }

    LocalStore reopened(path);
    QVERIFY(reopened.load());
    ConfigTemplate tmpl;
    tmpl.name = QStringLiteral("c");
    tmpl.type = QStringLiteral("xray");
    const std::optional<ConfigTemplate> third = reopened.configTemplates().create(tmpl, nullptr);
    QVERIFY(third.has_value());
    QCOMPARE(third->id, firstTemplate + 2);
}

void TestLocalStore::instanceIdsAreUniquePerHost()
{
    LocalStore store;
    QVERIFY(store.coreInstances().create(makeInstance(1, QStringLiteral("node-1")), nullptr));
    QVERIFY(store.coreInstances().create(makeInstance(2, QStringLiteral("node-1")), nullptr));

    PipelineError error;
    QVERIFY(!store.coreInstances().create(makeInstance(1, QStringLiteral("node-1")), &error));
    QCOMPARE(error.code, ErrorCode::Conflict);
    QCOMPARE(store.coreInstances().listByHost(1).size(), 1);

    QVERIFY(store.coreInstances().updateStatus(1, QStringLiteral("node-1"), InstanceStatus::Stopped, QString(), nullptr));
    QCOMPARE(store.coreInstances().findByHostAndInstance(1, QStringLiteral("node-1"), nullptr)->status, InstanceStatus::Stopped);
    QCOMPARE(store.coreInstances().findByHostAndInstance(2, QStringLiteral("node-1"), nullptr)->status, InstanceStatus::Running);
}

void TestLocalStore::terminalLogsAreImmutable()
{
    LocalStore store;
    const std::optional<qint64> id = store.switchLogs().create(
        makeLog(1, QDateTime(QDate(2026, 1, 1), QTime(12, 0), QTimeZone::UTC), QStringLiteral("s-1")), nullptr);
    QVERIFY(id.has_value());

    SwitchLogUpdate progress;
    progress.status = SwitchStatus::InProgress;
    QVERIFY(store.switchLogs().updateStatus(id.value(), progress, nullptr));
    QVERIFY(!store.switchLogs().findById(id.value(), nullptr)->completedAt.has_value());

    SwitchLogUpdate done = terminal(SwitchStatus::Completed, QStringLiteral("ok"));
    done.toInstanceId = QStringLiteral("node-2");
    QVERIFY(store.switchLogs().updateStatus(id.value(), done, nullptr));

    PipelineError error;
    QVERIFY(!store.switchLogs().updateStatus(id.value(), terminal(SwitchStatus::Failed, QStringLiteral("late")), &error));
    QCOMPARE(error.code, ErrorCode::Conflict);
    QVERIFY(error.message.contains(QStringLiteral("already completed")));

    const std::optional<AgentCoreSwitchLog> log = store.switchLogs().findById(id.value(), nullptr);
    QCOMPARE(log->status, SwitchStatus::Completed);
    QCOMPARE(log->message, QStringLiteral("ok"));
    QCOMPARE(log->toInstanceId, QStringLiteral("node-2"));
    QCOMPARE(log->completedAt, done.completedAt);
}

void TestLocalStore::listsLogsNewestFirst()
{
    LocalStore store;
    const QDateTime base(QDate(2026, 1, 1), QTime(12, 0), QTimeZone::UTC);
    const qint64 older = store.switchLogs().create(makeLog(1, base, QStringLiteral("older")), nullptr).value();
    const qint64 newer = store.switchLogs().create(makeLog(1, base.addSecs(60), QStringLiteral("newer")), nullptr).value();
    const qint64 tie = store.switchLogs().create(makeLog(1, base, QStringLiteral("tie")), nullptr).value();
    QVERIFY(older < newer && newer < tie);

    const SwitchLogPage page = store.switchLogs().list(SwitchLogFilter {});
    QCOMPARE(page.rows.size(), 3);
    QCOMPARE(page.rows.at(0).id, newer);
    QCOMPARE(page.rows.at(1).id, tie);
    QCOMPARE(page.rows.at(2).id, older);
}

void TestLocalStore::filtersAndPagesLogs()
{
    LocalStore store;
    const QDateTime base(QDate(2026, 1, 1), QTime(12, 0), QTimeZone::UTC);
    for (int i = 0; i < 5; ++i) {
        store.switchLogs().create(makeLog(1, base.addSecs(i * 60), QStringLiteral("h1-%1").arg(i)), nullptr);
    }
    const qint64 otherHost = store.switchLogs().create(makeLog(2, base, QStringLiteral("h2")), nullptr).value();
    QVERIFY(store.switchLogs().updateStatus(otherHost, terminal(SwitchStatus::Failed, QStringLiteral("boom")), nullptr));

    SwitchLogFilter filter;
    filter.agentHostId = 1;
    filter.limit = 2;
    filter.offset = 1;
    SwitchLogPage page = store.switchLogs().list(filter);
    QCOMPARE(page.total, 5);
    QCOMPARE(page.rows.size(), 2);
    QCOMPARE(page.rows.at(0).switchId, QStringLiteral("h1-3"));
    QCOMPARE(page.rows.at(1).switchId, QStringLiteral("h1-2"));

    filter.offset = 0;
    filter.limit = 50;
    filter.start = base.addSecs(60);
    filter.end = base.addSecs(180);
    page = store.switchLogs().list(filter);
    QCOMPARE(page.total, 3);

    SwitchLogFilter byStatus;
    byStatus.status = SwitchStatus::Failed;
    page = store.switchLogs().list(byStatus);
    QCOMPARE(page.total, 1);
    QCOMPARE(page.rows.constFirst().agentHostId, qint64(2));
}

void TestLocalStore::removingTemplateClearsAssignments()
{
    LocalStore store;
    ConfigTemplate tmpl;
    tmpl.name = QStringLiteral("base");
    tmpl.type = QStringLiteral("sing-box");
    const qint64 templateId = store.configTemplates().create(tmpl, nullptr)->id;

    AgentHost host = makeHost(QStringLiteral("sing-box"), QStringLiteral("1.8.0"));
    const qint64 hostId = store.saveHost(host).value();
    QVERIFY(store.agentHosts().setConfigTemplate(hostId, templateId, nullptr));
    QCOMPARE(store.agentHosts().findById(hostId, nullptr)->configTemplateId, std::optional<qint64>(templateId));

    QVERIFY(store.configTemplates().remove(templateId, nullptr));
    QVERIFY(!store.agentHosts().findById(hostId, nullptr)->configTemplateId.has_value());
}

void TestLocalStore::reportsCorruptFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("store.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    LocalStore store(path);
    PipelineError error;
    QVERIFY(!store.load(&error));
    QCOMPARE(error.code, ErrorCode::Storage);
}

void TestLocalStore::missingEntitiesAreNotFound()
{
    LocalStore store;
    PipelineError error;
    QVERIFY(!store.agentHosts().findById(42, &error).has_value());
    QCOMPARE(error.code, ErrorCode::NotFound);
    QVERIFY(!store.configTemplates().remove(42, &error));
    QCOMPARE(error.code, ErrorCode::NotFound);
    QVERIFY(!store.switchLogs().updateStatus(42, SwitchLogUpdate {}, &error));
    QCOMPARE(error.code, ErrorCode::NotFound);
    QVERIFY(!store.coreInstances().remove(1, QStringLiteral("node-9"), &error));
    QCOMPARE(error.code, ErrorCode::NotFound);
}

QTEST_GUILESS_MAIN(TestLocalStore)
#include "tst_localstore.moc"
