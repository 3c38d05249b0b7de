module;
#include <QList>
#include <QString>

#include <optional>

module corebridge.backend.coreengine;

QString coreEngineName(CoreEngine engine)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return QStringLiteral("sing-box");
    case CoreEngine::Xray:
        return QStringLiteral("xray");
    }
    return {};
}

std::optional<CoreEngine> parseCoreEngine(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QStringLiteral("sing-box")
        || normalized == QStringLiteral("singbox")
        || normalized == QStringLiteral("sing_box")) {
        return CoreEngine::SingBox;
    }
    if (normalized == QStringLiteral("xray") || normalized == QStringLiteral("xray-core")) {
        return CoreEngine::Xray;
    }
    return std::nullopt;
}

QList<CoreEngine> supportedCoreEngines()
{
    // Xray first: its inbounds are more distinctive than sing-box's.
    return {CoreEngine::Xray, CoreEngine::SingBox};
}
