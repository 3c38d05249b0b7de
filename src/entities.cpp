module;
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

module corebridge.backend.entities;
import corebridge.backend.jsonsupport;

namespace {
QString toIsoString(const QDateTime& value)
{
    return value.isValid() ? value.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIsoString(const QJsonValue& value)
{
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}

void insertOptionalId(QJsonObject& json, const QString& key, const std::optional<qint64>& value)
{
    if (value.has_value()) {
        json.insert(key, value.value());
    }
}

std::optional<qint64> optionalId(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toInteger();
}

void insertOptionalTime(QJsonObject& json, const QString& key, const std::optional<QDateTime>& value)
{
    if (value.has_value() && value->isValid()) {
        json.insert(key, toIsoString(value.value()));
    }
}

std::optional<QDateTime> optionalTime(const QJsonObject& json, const QString& key)
{
    const QDateTime value = fromIsoString(json.value(key));
    if (!value.isValid()) {
        return std::nullopt;
    }
    return value;
}
}

QString instanceStatusName(InstanceStatus status)
{
    switch (status) {
    case InstanceStatus::Running:
        return QStringLiteral("running");
    case InstanceStatus::Stopped:
        return QStringLiteral("stopped");
    }
    return QStringLiteral("stopped");
}

std::optional<InstanceStatus> parseInstanceStatus(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("running")) {
        return InstanceStatus::Running;
    }
    if (normalized == QStringLiteral("stopped")) {
        return InstanceStatus::Stopped;
    }
    return std::nullopt;
}

QString switchStatusName(SwitchStatus status)
{
    switch (status) {
    case SwitchStatus::Pending:
        return QStringLiteral("pending");
    case SwitchStatus::InProgress:
        return QStringLiteral("in_progress");
    case SwitchStatus::Completed:
        return QStringLiteral("completed");
    case SwitchStatus::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

std::optional<SwitchStatus> parseSwitchStatus(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("pending")) {
        return SwitchStatus::Pending;
    }
    if (normalized == QStringLiteral("in_progress")) {
        return SwitchStatus::InProgress;
    }
    if (normalized == QStringLiteral("completed")) {
        return SwitchStatus::Completed;
    }
    if (normalized == QStringLiteral("failed")) {
        return SwitchStatus::Failed;
    }
    return std::nullopt;
}

bool isTerminalStatus(SwitchStatus status)
{
    return status == SwitchStatus::Completed || status == SwitchStatus::Failed;
}

AgentCapabilities AgentHost::agentCapabilities() const
{
    return AgentCapabilities::resolve(coreType, coreVersion, capabilities, buildTags);
}

QJsonObject AgentHost::toJson() const
{
    QJsonObject json {
        {QStringLiteral("id"), id},
        {QStringLiteral("name"), name},
        {QStringLiteral("host"), host},
        {QStringLiteral("token"), token},
        {QStringLiteral("core_type"), coreType},
        {QStringLiteral("core_version"), coreVersion},
        {QStringLiteral("capabilities"), toJsonArray(capabilities)},
        {QStringLiteral("build_tags"), toJsonArray(buildTags)}
    };
    insertOptionalId(json, QStringLiteral("config_template_id"), configTemplateId);
    return json;
}

AgentHost AgentHost::fromJson(const QJsonObject& json)
{
    AgentHost host;
    host.id = json.value(QStringLiteral("id")).toInteger();
    host.name = json.value(QStringLiteral("name")).toString();
    host.host = json.value(QStringLiteral("host")).toString().trimmed();
    host.token = json.value(QStringLiteral("token")).toString();
    host.coreType = json.value(QStringLiteral("core_type")).toString().trimmed();
    host.coreVersion = json.value(QStringLiteral("core_version")).toString().trimmed();
    host.capabilities = jsonStringList(json.value(QStringLiteral("capabilities")));
    host.buildTags = jsonStringList(json.value(QStringLiteral("build_tags")));
    host.configTemplateId = optionalId(json, QStringLiteral("config_template_id"));
    return host;
}

QJsonObject ConfigTemplate::toJson() const
{
    return QJsonObject {
        {QStringLiteral("id"), id},
        {QStringLiteral("name"), name},
        {QStringLiteral("description"), description},
        {QStringLiteral("type"), type},
        {QStringLiteral("content"), content},
        {QStringLiteral("min_version"), minVersion},
        {QStringLiteral("capabilities"), toJsonArray(capabilities)},
        {QStringLiteral("schema_version"), schemaVersion},
        {QStringLiteral("is_valid"), isValid},
        {QStringLiteral("validation_error"), validationError},
        {QStringLiteral("created_at"), toIsoString(createdAt)},
        {QStringLiteral("updated_at"), toIsoString(updatedAt)}
    };
}

ConfigTemplate ConfigTemplate::fromJson(const QJsonObject& json)
{
    ConfigTemplate tmpl;
    tmpl.id = json.value(QStringLiteral("id")).toInteger();
    tmpl.name = json.value(QStringLiteral("name")).toString();
    tmpl.description = json.value(QStringLiteral("description")).toString();
    tmpl.type = json.value(QStringLiteral("type")).toString();
    tmpl.content = json.value(QStringLiteral("content")).toString();
    tmpl.minVersion = json.value(QStringLiteral("min_version")).toString();
    tmpl.capabilities = jsonStringList(json.value(QStringLiteral("capabilities")));
    tmpl.schemaVersion = json.value(QStringLiteral("schema_version")).toInt(1);
    tmpl.isValid = json.value(QStringLiteral("is_valid")).toBool();
    tmpl.validationError = json.value(QStringLiteral("validation_error")).toString();
    tmpl.createdAt = fromIsoString(json.value(QStringLiteral("created_at")));
    tmpl.updatedAt = fromIsoString(json.value(QStringLiteral("updated_at")));
    return tmpl;
}

QJsonObject AgentCoreInstance::toJson() const
{
    QJsonArray ports;
    for (const int port : listenPorts) {
        ports.append(port);
    }

    QJsonObject json {
        {QStringLiteral("agent_host_id"), agentHostId},
        {QStringLiteral("instance_id"), instanceId},
        {QStringLiteral("core_type"), coreType},
        {QStringLiteral("status"), instanceStatusName(status)},
        {QStringLiteral("config_hash"), configHash},
        {QStringLiteral("listen_ports"), ports},
        {QStringLiteral("error_message"), errorMessage},
        {QStringLiteral("created_at"), toIsoString(createdAt)},
        {QStringLiteral("updated_at"), toIsoString(updatedAt)}
    };
    insertOptionalId(json, QStringLiteral("config_template_id"), configTemplateId);
    insertOptionalTime(json, QStringLiteral("last_heartbeat_at"), lastHeartbeatAt);
    return json;
}

AgentCoreInstance AgentCoreInstance::fromJson(const QJsonObject& json)
{
    AgentCoreInstance instance;
    instance.agentHostId = json.value(QStringLiteral("agent_host_id")).toInteger();
    instance.instanceId = json.value(QStringLiteral("instance_id")).toString();
    instance.coreType = json.value(QStringLiteral("core_type")).toString();
    instance.status = parseInstanceStatus(json.value(QStringLiteral("status")).toString()).value_or(InstanceStatus::Stopped);
    instance.configTemplateId = optionalId(json, QStringLiteral("config_template_id"));
    instance.configHash = json.value(QStringLiteral("config_hash")).toString();
    for (const QJsonValue& port : json.value(QStringLiteral("listen_ports")).toArray()) {
        instance.listenPorts.append(port.toInt());
    }
    instance.lastHeartbeatAt = optionalTime(json, QStringLiteral("last_heartbeat_at"));
    instance.errorMessage = json.value(QStringLiteral("error_message")).toString();
    instance.createdAt = fromIsoString(json.value(QStringLiteral("created_at")));
    instance.updatedAt = fromIsoString(json.value(QStringLiteral("updated_at")));
    return instance;
}

QJsonObject AgentCoreSwitchLog::toJson() const
{
    QJsonObject json {
        {QStringLiteral("id"), id},
        {QStringLiteral("switch_id"), switchId},
        {QStringLiteral("agent_host_id"), agentHostId},
        {QStringLiteral("from_instance_id"), fromInstanceId},
        {QStringLiteral("to_instance_id"), toInstanceId},
        {QStringLiteral("from_core_type"), fromCoreType},
        {QStringLiteral("to_core_type"), toCoreType},
        {QStringLiteral("status"), switchStatusName(status)},
        {QStringLiteral("message"), message},
        {QStringLiteral("detail"), detail},
        {QStringLiteral("created_at"), toIsoString(createdAt)}
    };
    insertOptionalId(json, QStringLiteral("operator_id"), operatorId);
    insertOptionalTime(json, QStringLiteral("completed_at"), completedAt);
    return json;
}

AgentCoreSwitchLog AgentCoreSwitchLog::fromJson(const QJsonObject& json)
{
    AgentCoreSwitchLog log;
    log.id = json.value(QStringLiteral("id")).toInteger();
    log.switchId = json.value(QStringLiteral("switch_id")).toString();
    log.agentHostId = json.value(QStringLiteral("agent_host_id")).toInteger();
    log.fromInstanceId = json.value(QStringLiteral("from_instance_id")).toString();
    log.toInstanceId = json.value(QStringLiteral("to_instance_id")).toString();
    log.fromCoreType = json.value(QStringLiteral("from_core_type")).toString();
    log.toCoreType = json.value(QStringLiteral("to_core_type")).toString();
    log.status = parseSwitchStatus(json.value(QStringLiteral("status")).toString()).value_or(SwitchStatus::Failed);
    log.message = json.value(QStringLiteral("message")).toString();
    log.detail = json.value(QStringLiteral("detail")).toString();
    log.operatorId = optionalId(json, QStringLiteral("operator_id"));
    log.createdAt = fromIsoString(json.value(QStringLiteral("created_at")));
    log.completedAt = optionalTime(json, QStringLiteral("completed_at"));
    return log;
}
