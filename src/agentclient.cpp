module;
#include <QDeadlineTimer>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMutexLocker>
#include <QString>

#include <memory>

module corebridge.backend.agentclient;
import corebridge.backend.jsonsupport;

QString normalizeAgentAddress(const QString& address, quint16 defaultPort)
{
    const QString trimmed = address.trimmed();
    if (trimmed.isEmpty()) {
        return trimmed;
    }

    if (trimmed.startsWith(QLatin1Char('['))) {
        const qsizetype close = trimmed.indexOf(QLatin1Char(']'));
        if (close >= 0 && close + 1 < trimmed.size() && trimmed.at(close + 1) == QLatin1Char(':')) {
            return trimmed;
        }
        return QStringLiteral("%1:%2").arg(trimmed).arg(defaultPort);
    }

    const qsizetype colons = trimmed.count(QLatin1Char(':'));
    if (colons == 1) {
        return trimmed;
    }
    if (colons > 1) {
        return QStringLiteral("[%1]:%2").arg(trimmed).arg(defaultPort);
    }
    return QStringLiteral("%1:%2").arg(trimmed).arg(defaultPort);
}

QJsonObject CoreInfo::toJson() const
{
    return QJsonObject {
        {QStringLiteral("type"), type},
        {QStringLiteral("version"), version},
        {QStringLiteral("installed"), installed},
        {QStringLiteral("capabilities"), toJsonArray(capabilities)}
    };
}

CoreInfo CoreInfo::fromJson(const QJsonObject& json)
{
    CoreInfo info;
    info.type = json.value(QStringLiteral("type")).toString().trimmed();
    info.version = json.value(QStringLiteral("version")).toString().trimmed();
    info.installed = json.value(QStringLiteral("installed")).toBool();
    info.capabilities = jsonStringList(json.value(QStringLiteral("capabilities")));
    return info;
}

CallContext::CallContext()
    : CallContext(QDeadlineTimer(QDeadlineTimer::Forever))
{
}

CallContext::CallContext(const QDeadlineTimer& deadline)
    : m_deadline(deadline)
    , m_state(std::make_shared<State>())
{
}

CallContext CallContext::withTimeout(qint64 msecs)
{
    return CallContext(QDeadlineTimer(msecs));
}

QDeadlineTimer CallContext::deadline() const
{
    return m_deadline;
}

int CallContext::remainingMs(int capMs) const
{
    const int cap = qMax(0, capMs);
    if (m_deadline.isForever()) {
        return cap;
    }
    return static_cast<int>(qBound<qint64>(0, m_deadline.remainingTime(), cap));
}

bool CallContext::isCancelled() const
{
    return m_state->cancelled.load();
}

QString CallContext::cancelReason() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->reason;
}

void CallContext::cancel(const QString& reason) const
{
    QMutexLocker locker(&m_state->mutex);
    if (m_state->cancelled.load()) {
        return;
    }
    m_state->reason = reason.trimmed().isEmpty() ? QStringLiteral("cancelled by caller") : reason.trimmed();
    m_state->cancelled.store(true);
}
