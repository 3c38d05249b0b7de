module;
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVersionNumber>

#include <algorithm>
#include <optional>

module corebridge.backend.capability;

namespace {
const QList<CapabilityRequirement>& singBoxRequirements()
{
    static const QList<CapabilityRequirement> table {
        {QString(Capability::Reality), QStringLiteral("1.3.0"), {}},
        {QString(Capability::Multiplex), QStringLiteral("1.3.0"), {}},
        {QString(Capability::Brutal), QStringLiteral("1.7.0"), {}},
        {QString(Capability::Ech), QStringLiteral("1.8.0"), {}},
        {QString(Capability::V2RayApi), QStringLiteral("1.0.0"), QStringLiteral("with_v2ray_api")},
        {QString(Capability::Quic), QStringLiteral("1.0.0"), {}},
        {QString(Capability::Http3), QStringLiteral("1.8.0"), {}}
    };
    return table;
}

const QList<CapabilityRequirement>& xrayRequirements()
{
    static const QList<CapabilityRequirement> table {
        {QString(Capability::Reality), QStringLiteral("1.8.0"), {}},
        {QString(Capability::Xtls), QStringLiteral("1.0.0"), {}},
        {QString(Capability::Stats), QStringLiteral("1.0.0"), {}},
        {QString(Capability::V2RayApi), QStringLiteral("1.0.0"), {}},
        {QString(Capability::SplitHttp), QStringLiteral("1.8.11"), {}},
        {QString(Capability::Meek), QStringLiteral("1.6.0"), {}},
        {QString(Capability::Mkcp), QStringLiteral("1.0.0"), {}},
        {QString(Capability::Quic), QStringLiteral("1.3.0"), {}},
        {QString(Capability::Multiplex), QStringLiteral("1.8.0"), {}},
        {QString(Capability::GeoIp), QStringLiteral("1.0.0"), {}},
        {QString(Capability::GeoSite), QStringLiteral("1.0.0"), {}},
        {QString(Capability::DomainSocket), QStringLiteral("1.0.0"), {}},
        {QString(Capability::Wireguard), QStringLiteral("1.8.0"), {}}
    };
    return table;
}

const QList<BuildTagCapability>& singBoxBuildTags()
{
    static const QList<BuildTagCapability> table {
        {QStringLiteral("with_quic"), QString(Capability::Quic)},
        {QStringLiteral("with_wireguard"), QString(Capability::Wireguard)},
        {QStringLiteral("with_utls"), QString(Capability::Utls)},
        {QStringLiteral("with_ech"), QString(Capability::Ech)},
        {QStringLiteral("with_gvisor"), QString(Capability::Tun)},
        {QStringLiteral("with_dhcp"), QString(Capability::Dhcp)}
    };
    return table;
}

const QList<BuildTagCapability>& xrayBuildTags()
{
    static const QList<BuildTagCapability> table {
        {QStringLiteral("with_geoip"), QString(Capability::GeoIp)},
        {QStringLiteral("with_geosite"), QString(Capability::GeoSite)}
    };
    return table;
}

bool containsTag(const QStringList& tags, const QString& tag)
{
    return std::any_of(tags.cbegin(), tags.cend(), [&tag](const QString& entry) {
        return entry.trimmed().compare(tag, Qt::CaseInsensitive) == 0;
    });
}

QStringList sortedTokens(const QSet<QString>& tokens)
{
    QStringList out(tokens.cbegin(), tokens.cend());
    out.sort();
    return out;
}
}

QString normalizeCapability(const QString& token)
{
    QString normalized = token.trimmed().toLower();
    normalized.replace(QLatin1Char('-'), QLatin1Char('_'));
    return normalized;
}

const QList<CapabilityRequirement>& capabilityRequirements(CoreEngine engine)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return singBoxRequirements();
    case CoreEngine::Xray:
        return xrayRequirements();
    }
    return singBoxRequirements();
}

const QList<BuildTagCapability>& buildTagCapabilities(CoreEngine engine)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return singBoxBuildTags();
    case CoreEngine::Xray:
        return xrayBuildTags();
    }
    return singBoxBuildTags();
}

std::optional<CapabilityRequirement> findCapabilityRequirement(CoreEngine engine, const QString& token)
{
    const QString normalized = normalizeCapability(token);
    for (const CapabilityRequirement& requirement : capabilityRequirements(engine)) {
        if (requirement.token == normalized) {
            return requirement;
        }
    }
    return std::nullopt;
}

std::optional<QVersionNumber> parseCoreVersion(const QString& version)
{
    QString text = version.trimmed();
    if (text.startsWith(QLatin1Char('v'), Qt::CaseInsensitive)) {
        text.remove(0, 1);
    }
    if (text.isEmpty() || !text.at(0).isDigit()) {
        return std::nullopt;
    }

    qsizetype suffixIndex = 0;
    const QVersionNumber parsed = QVersionNumber::fromString(text, &suffixIndex);
    if (parsed.isNull()) {
        return std::nullopt;
    }

    const QString suffix = text.mid(suffixIndex);
    if (!suffix.isEmpty() && !suffix.startsWith(QLatin1Char('-')) && !suffix.startsWith(QLatin1Char('+'))) {
        return std::nullopt;
    }

    return parsed.normalized();
}

QStringList deriveCapabilities(const QString& coreType,
                               const QString& coreVersion,
                               const QStringList& buildTags)
{
    const std::optional<CoreEngine> engine = parseCoreEngine(coreType);
    const std::optional<QVersionNumber> version = parseCoreVersion(coreVersion);
    if (!engine.has_value() || !version.has_value()) {
        return {};
    }

    QSet<QString> tokens;
    for (const CapabilityRequirement& requirement : capabilityRequirements(engine.value())) {
        const std::optional<QVersionNumber> minimum = parseCoreVersion(requirement.minVersion);
        if (!minimum.has_value() || QVersionNumber::compare(version.value(), minimum.value()) < 0) {
            continue;
        }
        if (!requirement.buildTag.isEmpty() && !containsTag(buildTags, requirement.buildTag)) {
            continue;
        }
        tokens.insert(requirement.token);
    }

    for (const BuildTagCapability& entry : buildTagCapabilities(engine.value())) {
        if (containsTag(buildTags, entry.buildTag)) {
            tokens.insert(entry.token);
        }
    }

    return sortedTokens(tokens);
}

AgentCapabilities AgentCapabilities::resolve(const QString& coreType,
                                             const QString& coreVersion,
                                             const QStringList& reportedCapabilities,
                                             const QStringList& buildTags)
{
    AgentCapabilities caps;
    caps.coreType = coreType.trimmed();
    caps.coreVersion = coreVersion.trimmed();
    for (const QString& tag : buildTags) {
        if (!tag.trimmed().isEmpty()) {
            caps.buildTags.append(tag.trimmed());
        }
    }

    for (const QString& token : reportedCapabilities) {
        const QString normalized = normalizeCapability(token);
        if (!normalized.isEmpty()) {
            caps.capabilities.insert(normalized);
        }
    }

    if (caps.capabilities.isEmpty() && !caps.coreVersion.isEmpty()) {
        const QStringList derived = deriveCapabilities(caps.coreType, caps.coreVersion, caps.buildTags);
        caps.capabilities = QSet<QString>(derived.cbegin(), derived.cend());
    }

    return caps;
}

std::optional<CoreEngine> AgentCapabilities::engine() const
{
    return parseCoreEngine(coreType);
}

bool AgentCapabilities::supportsCapability(const QString& token) const
{
    return capabilities.contains(normalizeCapability(token));
}

bool AgentCapabilities::hasBuildTag(const QString& tag) const
{
    return containsTag(buildTags, tag.trimmed());
}

bool AgentCapabilities::hasVersion() const
{
    return !coreVersion.isEmpty();
}

bool AgentCapabilities::supportsVersion(const QString& minVersion) const
{
    if (minVersion.trimmed().isEmpty()) {
        return true;
    }
    if (!hasVersion()) {
        return false;
    }

    const std::optional<QVersionNumber> current = parseCoreVersion(coreVersion);
    const std::optional<QVersionNumber> minimum = parseCoreVersion(minVersion);
    if (!current.has_value() || !minimum.has_value()) {
        return false;
    }

    return QVersionNumber::compare(current.value(), minimum.value()) >= 0;
}

QStringList AgentCapabilities::sortedCapabilities() const
{
    return sortedTokens(capabilities);
}

QString AgentCapabilities::requirementText(const QString& token) const
{
    const std::optional<CoreEngine> coreEngine = engine();
    if (!coreEngine.has_value()) {
        return QStringLiteral("a supported core");
    }

    const QString name = coreEngineName(coreEngine.value());
    const std::optional<CapabilityRequirement> requirement =
        findCapabilityRequirement(coreEngine.value(), token);
    if (!requirement.has_value()) {
        return QStringLiteral("%1 build with %2").arg(name, normalizeCapability(token));
    }
    if (!requirement->buildTag.isEmpty()) {
        return QStringLiteral("%1 >= %2 with build tag %3")
            .arg(name, requirement->minVersion, requirement->buildTag);
    }
    return QStringLiteral("%1 >= %2").arg(name, requirement->minVersion);
}
