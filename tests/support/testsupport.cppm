/*!
 * @file        testsupport.cppm
 * @brief       Fakes shared by the QtTest suites.
 *
 * @details
 * Scripted agent, call-order recorder, failing repository decorators and
 * a manual clock for driving the switch orchestrator deterministically.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimeZone>

#include <functional>
#include <memory>
#include <optional>

export module corebridge.tests.support;
export import corebridge.backend.agentcoreservice;
export import corebridge.backend.localstore;

/**
 * @class CallRecorder
 * @brief Ordered list of events, e.g. `log:pending` then `agent:switch_core`.
 */
export class CallRecorder
{
public:
    void record(const QString& event);
    QStringList events() const;
    qsizetype indexOf(const QString& event) const;
    void clear();

private:
    mutable QMutex m_mutex;
    QStringList m_events;
};

/**
 * @class ManualClock
 * @brief Clock that advances by a fixed step on every reading.
 */
export class ManualClock
{
public:
    explicit ManualClock(const QDateTime& start = QDateTime(QDate(2026, 1, 1), QTime(12, 0), QTimeZone::UTC),
                         qint64 stepMs = 1000);

    QDateTime now();
    QDateTime peek() const;
    void advance(qint64 msecs);
    Clock clock();

private:
    mutable QMutex m_mutex;
    QDateTime m_current;
    qint64 m_stepMs = 0;
};

/**
 * @struct RecordedSwitch
 * @brief One switch_core call observed by the fake agent.
 */
export struct RecordedSwitch {
    AgentClientConfig config;
    AgentSwitchRequest request;
};

/**
 * @class FakeAgent
 * @brief Scripted agent shared by every client its factory creates.
 */
export class FakeAgent
{
public:
    using SwitchHandler = std::function<std::optional<AgentSwitchResponse>(const CallContext&,
                                                                           const AgentSwitchRequest&,
                                                                           PipelineError *)>;

    explicit FakeAgent(CallRecorder *recorder = nullptr);

    //! Succeed and report @p newInstanceId.
    void respondOk(const QString& newInstanceId, const QString& message = QStringLiteral("ok"));
    //! Answer with ok=false.
    void respondFailure(const QString& error, const QString& message = QString());
    //! Fail without a response.
    void failTransport(ErrorCode code, const QString& message);
    void setSwitchHandler(SwitchHandler handler);
    void setCores(const QList<CoreInfo>& cores);

    QList<RecordedSwitch> switchCalls() const;
    int getCoresCalls() const;
    AgentClientFactory factory();

private:
    class Client;

    struct State {
        mutable QMutex mutex;
        CallRecorder *recorder = nullptr;
        SwitchHandler handler;
        QList<CoreInfo> cores;
        QList<RecordedSwitch> switchCalls;
        int getCoresCalls = 0;
    };

    std::shared_ptr<State> m_state;
};

/**
 * @class FailingSwitchLogRepository
 * @brief Switch log repository whose writes can be made to fail.
 */
export class FailingSwitchLogRepository : public AgentCoreSwitchLogRepository
{
public:
    FailingSwitchLogRepository(AgentCoreSwitchLogRepository& inner, CallRecorder *recorder = nullptr);

    void setFailCreate(bool fail);
    void setFailStatus(SwitchStatus status, bool fail = true);

    std::optional<qint64> create(const AgentCoreSwitchLog& log, PipelineError *error) override;
    bool updateStatus(qint64 id, const SwitchLogUpdate& update, PipelineError *error) override;
    std::optional<AgentCoreSwitchLog> findById(qint64 id, PipelineError *error) const override;
    SwitchLogPage list(const SwitchLogFilter& filter) const override;

private:
    AgentCoreSwitchLogRepository& m_inner;
    CallRecorder *m_recorder = nullptr;
    bool m_failCreate = false;
    QSet<int> m_failStatuses;
};

/**
 * @class FailingInstanceRepository
 * @brief Instance repository whose writes can be made to fail.
 */
export class FailingInstanceRepository : public AgentCoreInstanceRepository
{
public:
    explicit FailingInstanceRepository(AgentCoreInstanceRepository& inner);

    void setFailCreate(bool fail);
    void setFailUpdateStatus(bool fail);

    bool create(const AgentCoreInstance& instance, PipelineError *error) override;
    std::optional<AgentCoreInstance> findByHostAndInstance(qint64 hostId,
                                                           const QString& instanceId,
                                                           PipelineError *error) const override;
    QList<AgentCoreInstance> listByHost(qint64 hostId) const override;
    bool updateStatus(qint64 hostId,
                      const QString& instanceId,
                      InstanceStatus status,
                      const QString& errorMessage,
                      PipelineError *error) override;
    bool remove(qint64 hostId, const QString& instanceId, PipelineError *error) override;

private:
    AgentCoreInstanceRepository& m_inner;
    bool m_failCreate = false;
    bool m_failUpdateStatus = false;
};

//! Host with address, token and engine facts filled in.
export AgentHost makeHost(const QString& coreType, const QString& coreVersion,
                          const QStringList& capabilities = QStringList(),
                          const QStringList& buildTags = QStringList());

//! VLESS + Reality inbound on port 443.
export Inbound makeRealityInbound(const QString& tag = QStringLiteral("vless-reality"));

//! Plain VMess over websocket on port 8080.
export Inbound makeVmessInbound(const QString& tag = QStringLiteral("vmess-ws"));

export UserConfig makeUser(qint64 id, const QString& email);

//! Minimal valid sing-box template using the inbound helper.
export QString singBoxTemplate();

//! Minimal valid Xray template using the inbound helper.
export QString xrayTemplate();
