#include <QtTest>

#include <utility>

#ifndef Q_MOC_RUN
import corebridge.backend.capabilityfilter;
import corebridge.tests.support;
#endif

namespace {
//! Features still enabled on an inbound after filtering.
QStringList enabledFeatures(const Inbound& inbound)
{
    return inbound.deriveRequiredCapabilities();
}

Inbound fullFeatureInbound()
{
    Inbound inbound = makeRealityInbound();
    MultiplexSettings mux;
    mux.enabled = true;
    mux.brutal = BrutalSettings {true, 100, 100};
    inbound.multiplex = mux;
    inbound.refreshRequiredCapabilities();
    return inbound;
}
}

class TestCapability : public QObject
{
    Q_OBJECT

private slots:
    void parsesVersions_data();
    void parsesVersions();
    void derivesFromVersionTables();
    void derivationFailsClosed();
    void buildTagsUnlockFeatures();
    void reportedCapabilitiesAreAuthoritative();
    void requirementTextNamesEngineAndVersion();
    void filterIsMonotonic();
    void filterDisablesUnsupportedFeatures();
    void filterDisablesStatsWithoutApiTag();
    void compatibilityRejectsOldVersion();
    void compatibilityFlagsUnknownVersion();
    void compatibilityRejectsInvalidMinimum();
    void compatibilityWarnsAboutMissingCapabilities();
};

void TestCapability::parsesVersions_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("plain") << QStringLiteral("1.8.0") << QStringLiteral("1.8");
    QTest::newRow("prefix") << QStringLiteral("v1.10.2") << QStringLiteral("1.10.2");
    QTest::newRow("prerelease") << QStringLiteral("1.11.0-beta.3") << QStringLiteral("1.11");
    QTest::newRow("build") << QStringLiteral("25.1.30+abc") << QStringLiteral("25.1.30");
    QTest::newRow("garbage") << QStringLiteral("latest") << QString();
    QTest::newRow("trailing") << QStringLiteral("1.8.x") << QString();
    QTest::newRow("empty") << QString() << QString();
}

void TestCapability::parsesVersions()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);

    const std::optional<QVersionNumber> version = parseCoreVersion(input);
    if (expected.isEmpty()) {
        QVERIFY(!version.has_value());
        return;
    }
    QVERIFY(version.has_value());
    QCOMPARE(version->toString(), expected);
}

void TestCapability::derivesFromVersionTables()
{
    const QStringList old = deriveCapabilities(QStringLiteral("sing-box"), QStringLiteral("1.2.9"), {});
    QVERIFY(!old.contains(QStringLiteral("reality")));
    QVERIFY(old.contains(QStringLiteral("quic")));

    const QStringList current = deriveCapabilities(QStringLiteral("sing-box"), QStringLiteral("1.8.0"), {});
    QVERIFY(current.contains(QStringLiteral("reality")));
    QVERIFY(current.contains(QStringLiteral("multiplex")));
    QVERIFY(current.contains(QStringLiteral("brutal")));
    QVERIFY(current.contains(QStringLiteral("ech")));
    QVERIFY(!current.contains(QStringLiteral("v2ray_api")));

    const QStringList xray = deriveCapabilities(QStringLiteral("xray"), QStringLiteral("1.6.0"), {});
    QVERIFY(!xray.contains(QStringLiteral("reality")));
    QVERIFY(xray.contains(QStringLiteral("stats")));
    QVERIFY(xray.contains(QStringLiteral("meek")));

    QStringList sorted = current;
    sorted.sort();
    QCOMPARE(current, sorted);
}

void TestCapability::derivationFailsClosed()
{
    QVERIFY(deriveCapabilities(QStringLiteral("sing-box"), QStringLiteral("nightly"), {}).isEmpty());
    QVERIFY(deriveCapabilities(QStringLiteral("sing-box"), QString(), {QStringLiteral("with_quic")}).isEmpty());
    QVERIFY(deriveCapabilities(QStringLiteral("clash"), QStringLiteral("1.8.0"), {}).isEmpty());

    const AgentCapabilities caps = AgentCapabilities::resolve(QStringLiteral("xray"), QStringLiteral("unknown"), {}, {});
    QVERIFY(caps.capabilities.isEmpty());
    QVERIFY(!caps.supportsVersion(QStringLiteral("1.0.0")));
}

void TestCapability::buildTagsUnlockFeatures()
{
    const QStringList withoutTag = deriveCapabilities(QStringLiteral("sing-box"), QStringLiteral("1.9.0"), {});
    QVERIFY(!withoutTag.contains(QStringLiteral("v2ray_api")));
    QVERIFY(!withoutTag.contains(QStringLiteral("utls")));

    const QStringList withTags = deriveCapabilities(QStringLiteral("sing-box"), QStringLiteral("1.9.0"),
                                                    {QStringLiteral("with_v2ray_api"), QStringLiteral("with_utls")});
    QVERIFY(withTags.contains(QStringLiteral("v2ray_api")));
    QVERIFY(withTags.contains(QStringLiteral("utls")));
}

void TestCapability::reportedCapabilitiesAreAuthoritative()
{
    const AgentCapabilities caps = AgentCapabilities::resolve(QStringLiteral("sing-box"), QStringLiteral("1.10.0"),
                                                              {QStringLiteral(" Multiplex "), QStringLiteral("v2ray-api")}, {});
    QVERIFY(caps.supportsCapability(QStringLiteral("multiplex")));
    QVERIFY(caps.supportsCapability(QStringLiteral("v2ray_api")));
    QVERIFY(!caps.supportsCapability(QStringLiteral("reality")));
    QVERIFY(caps.supportsVersion(QStringLiteral("1.8.0")));
}

void TestCapability::requirementTextNamesEngineAndVersion()
{
    const AgentCapabilities singBox = AgentCapabilities::resolve(QStringLiteral("sing-box"), QString(), {}, {});
    QCOMPARE(singBox.requirementText(QStringLiteral("reality")), QStringLiteral("sing-box >= 1.3.0"));
    QCOMPARE(singBox.requirementText(QStringLiteral("v2ray_api")),
             QStringLiteral("sing-box >= 1.0.0 with build tag with_v2ray_api"));

    const AgentCapabilities xray = AgentCapabilities::resolve(QStringLiteral("xray"), QString(), {}, {});
    QCOMPARE(xray.requirementText(QStringLiteral("reality")), QStringLiteral("xray >= 1.8.0"));
}

void TestCapability::filterIsMonotonic()
{
    const Inbound inbound = fullFeatureInbound();
    const QStringList versions {
        QStringLiteral("1.0.0"), QStringLiteral("1.3.0"), QStringLiteral("1.7.0"), QStringLiteral("1.10.0")
    };

    QStringList previous;
    for (const QString& version : versions) {
        const AgentCapabilities caps = AgentCapabilities::resolve(QStringLiteral("sing-box"), version, {}, {});
        const CapabilityFilter filter(caps);
        const QStringList enabled = enabledFeatures(filter.filterInbound(inbound, nullptr));

        for (const QString& feature : std::as_const(previous)) {
            QVERIFY2(enabled.contains(feature), qPrintable(QStringLiteral("%1 lost at %2").arg(feature, version)));
        }
        for (const QString& feature : enabled) {
            QVERIFY(caps.supportsCapability(feature));
        }
        previous = enabled;
    }
    QCOMPARE(previous.size(), 3);
}

void TestCapability::filterDisablesUnsupportedFeatures()
{
    const CapabilityFilter filter(AgentCapabilities::resolve(QStringLiteral("sing-box"), QStringLiteral("1.5.0"), {}, {}));
    QStringList warnings;
    const Inbound filtered = filter.filterInbound(fullFeatureInbound(), &warnings);

    QVERIFY(filtered.hasReality());
    QVERIFY(filtered.hasMultiplex());
    QVERIFY(!filtered.hasBrutal());
    QCOMPARE(warnings.size(), 1);
    QVERIFY(warnings.constFirst().contains(QStringLiteral("Brutal")));
    QVERIFY(warnings.constFirst().contains(QStringLiteral("sing-box >= 1.7.0")));
    QVERIFY(!filtered.requiredCapabilities.contains(QStringLiteral("brutal")));
}

void TestCapability::filterDisablesStatsWithoutApiTag()
{
    TemplateContext context = TemplateContext::sample();
    context.server.statsEnabled = true;

    const CapabilityFilter plain(AgentCapabilities::resolve(QStringLiteral("sing-box"), QStringLiteral("1.10.0"), {}, {}));
    const FilterResult stripped = plain.filterContext(context);
    QVERIFY(!stripped.context.server.statsEnabled);
    QVERIFY(!stripped.warnings.isEmpty());

    const CapabilityFilter tagged(AgentCapabilities::resolve(QStringLiteral("sing-box"), QStringLiteral("1.10.0"), {},
                                                            {QStringLiteral("with_v2ray_api")}));
    const FilterResult kept = tagged.filterContext(context);
    QVERIFY(kept.context.server.statsEnabled);
    QVERIFY(kept.context.agent.capabilities.contains(QStringLiteral("v2ray_api")));
}

void TestCapability::compatibilityRejectsOldVersion()
{
    const CapabilityFilter filter(AgentCapabilities::resolve(QStringLiteral("xray"), QStringLiteral("1.6.0"), {}, {}));
    const CompatibilityResult result = filter.checkTemplateCompatibility(QStringLiteral("1.8.0"), {QStringLiteral("reality")});
    QVERIFY(!result.compatible);
    QVERIFY(!result.versionUnknown);
    QCOMPARE(result.errors.size(), 1);
    QVERIFY(result.errors.constFirst().contains(QStringLiteral("below the required minimum 1.8.0")));
    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.constFirst().contains(QStringLiteral("reality")));
}

void TestCapability::compatibilityFlagsUnknownVersion()
{
    const CapabilityFilter filter(AgentCapabilities::resolve(QStringLiteral("xray"), QString(), {}, {}));
    const CompatibilityResult result = filter.checkTemplateCompatibility(QStringLiteral("1.8.0"), {});
    QVERIFY(!result.compatible);
    QVERIFY(result.versionUnknown);
    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.warnings.size(), 1);
}

void TestCapability::compatibilityRejectsInvalidMinimum()
{
    const CapabilityFilter filter(AgentCapabilities::resolve(QStringLiteral("xray"), QStringLiteral("1.8.0"), {}, {}));
    const CompatibilityResult result = filter.checkTemplateCompatibility(QStringLiteral("soon"), {});
    QVERIFY(!result.compatible);
    QCOMPARE(result.errors.size(), 1);
}

void TestCapability::compatibilityWarnsAboutMissingCapabilities()
{
    const CapabilityFilter filter(AgentCapabilities::resolve(QStringLiteral("sing-box"), QStringLiteral("1.10.0"), {}, {}));
    const CompatibilityResult result = filter.checkTemplateCompatibility(QString(), {QStringLiteral("v2ray_api"), QStringLiteral("reality")});
    QVERIFY(result.compatible);
    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.constFirst().contains(QStringLiteral("with build tag with_v2ray_api")));
}

QTEST_GUILESS_MAIN(TestCapability)
#include "tst_capability.moc"
