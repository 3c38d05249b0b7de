#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtTest>

#ifndef Q_MOC_RUN
import corebridge.backend.templateengine;
import corebridge.tests.support;
#endif

namespace {
TemplateContext makeContext()
{
    TemplateContext context;
    context.inbounds = {makeRealityInbound(), makeVmessInbound()};
    context.users = {makeUser(1, QStringLiteral("u1@example.com")), makeUser(2, QStringLiteral("u2@example.com"))};
    context.outbounds = {OutboundConfig {QStringLiteral("direct"), QStringLiteral("direct"), {}}};
    context.agent.id = 7;
    context.agent.name = QStringLiteral("edge-1");
    context.agent.coreType = QStringLiteral("sing-box");
    context.agent.capabilities = {QStringLiteral("reality"), QStringLiteral("multiplex")};
    context.server.logLevel = QStringLiteral("warn");
    return context;
}

QJsonObject renderObject(const QString& content, const TemplateContext& context)
{
    TemplateError error;
    const std::optional<QByteArray> rendered = TemplateEngine::render(content, context, &error);
    if (!rendered.has_value()) {
        qWarning().noquote() << error.toString();
        return {};
    }
    return QJsonDocument::fromJson(rendered.value()).object();
}
}

class TestTemplateEngine : public QObject
{
    Q_OBJECT

private slots:
    void rendersPathsAndQuoting();
    void pipelinesFeedLastArgument();
    void rangeExposesLoopVariables();
    void ifElseUsesCapabilities();
    void trimMarkersAndComments();
    void unresolvedPlaceholderIsFatal();
    void unknownFunctionIsSyntaxError();
    void missingEndIsSyntaxError();
    void nonJsonOutputIsRejected();
    void inboundHelperUsesContextUsers();
    void codecHelperReportsDroppedFields();
    void renderingIsDeterministic();
    void previewUsesSampleContext();
    void functionNamesAreSorted();
};

void TestTemplateEngine::rendersPathsAndQuoting()
{
    const QJsonObject object = renderObject(
        QStringLiteral(R"({"level": {{ quote .server.log_level }}, "id": {{ $.agent.id }}, "name": "{{ .agent.name | upper }}"})"),
        makeContext());
    QCOMPARE(object.value(QStringLiteral("level")).toString(), QStringLiteral("warn"));
    QCOMPARE(object.value(QStringLiteral("id")).toInt(), 7);
    QCOMPARE(object.value(QStringLiteral("name")).toString(), QStringLiteral("EDGE-1"));
}

void TestTemplateEngine::pipelinesFeedLastArgument()
{
    const QJsonObject object = renderObject(
        QStringLiteral(R"({"dns": {{ .server.dns_override | default "1.1.1.1" | quote }}, "tags": {{ join "," (inboundTags) | quote }}})"),
        makeContext());
    QCOMPARE(object.value(QStringLiteral("dns")).toString(), QStringLiteral("1.1.1.1"));
    QCOMPARE(object.value(QStringLiteral("tags")).toString(), QStringLiteral("vless-reality,vmess-ws"));
}

void TestTemplateEngine::rangeExposesLoopVariables()
{
    const QJsonObject object = renderObject(
        QStringLiteral(R"({"tags": [{{ range .inbounds }}{{ if not $first }},{{ end }}{{ quote .tag }}{{ end }}], "count": {{ len .users }}})"),
        makeContext());
    const QJsonArray tags = object.value(QStringLiteral("tags")).toArray();
    QCOMPARE(tags.size(), 2);
    QCOMPARE(tags.at(0).toString(), QStringLiteral("vless-reality"));
    QCOMPARE(tags.at(1).toString(), QStringLiteral("vmess-ws"));
    QCOMPARE(object.value(QStringLiteral("count")).toInt(), 2);
}

void TestTemplateEngine::ifElseUsesCapabilities()
{
    const QString content = QStringLiteral(
        R"({"mux": {{ if hasCap "multiplex" }}true{{ else }}false{{ end }}, "ech": {{ if hasCap "ech" }}true{{ else }}false{{ end }}})");
    const QJsonObject object = renderObject(content, makeContext());
    QVERIFY(object.value(QStringLiteral("mux")).toBool());
    QVERIFY(!object.value(QStringLiteral("ech")).toBool());
}

void TestTemplateEngine::trimMarkersAndComments()
{
    TemplateError error;
    const std::optional<QString> text = TemplateEngine::renderText(
        QStringLiteral("a  {{- /* note */ -}}  b {{- \" c\" }}"), makeContext(), &error);
    QVERIFY2(text.has_value(), qPrintable(error.toString()));
    QCOMPARE(text.value(), QStringLiteral("ab c"));
}

void TestTemplateEngine::unresolvedPlaceholderIsFatal()
{
    TemplateError error;
    const std::optional<QByteArray> rendered = TemplateEngine::render(
        QStringLiteral("{\n\"a\": {{ .server.nope }}\n}"), makeContext(), &error);
    QVERIFY(!rendered.has_value());
    QCOMPARE(error.kind, TemplateErrorKind::Execution);
    QCOMPARE(error.line, 2);
    QVERIFY(error.message.contains(QStringLiteral("nope")));
    QVERIFY(error.toString().startsWith(QStringLiteral("template execution error at line 2")));
}

void TestTemplateEngine::unknownFunctionIsSyntaxError()
{
    TemplateError error;
    QVERIFY(!TemplateEngine::checkSyntax(QStringLiteral("{{ frobnicate .x }}"), &error));
    QCOMPARE(error.kind, TemplateErrorKind::Syntax);
    QVERIFY(error.message.contains(QStringLiteral("frobnicate")));
}

void TestTemplateEngine::missingEndIsSyntaxError()
{
    TemplateError error;
    QVERIFY(!TemplateEngine::checkSyntax(QStringLiteral("{{ if .server.stats_enabled }}x"), &error));
    QCOMPARE(error.kind, TemplateErrorKind::Syntax);
    QVERIFY(error.message.contains(QStringLiteral("{{end}}")));

    QVERIFY(!TemplateEngine::checkSyntax(QStringLiteral("{{ .server.log_level"), &error));
    QCOMPARE(error.message, QStringLiteral("unclosed action"));
}

void TestTemplateEngine::nonJsonOutputIsRejected()
{
    TemplateError error;
    const std::optional<QByteArray> rendered = TemplateEngine::render(
        QStringLiteral("{\"level\": {{ .server.log_level }}}"), makeContext(), &error);
    QVERIFY(!rendered.has_value());
    QCOMPARE(error.kind, TemplateErrorKind::InvalidJson);
    QVERIFY(error.toString().startsWith(QStringLiteral("invalid JSON output")));
}

void TestTemplateEngine::inboundHelperUsesContextUsers()
{
    const QJsonObject object = renderObject(QStringLiteral(R"({"inbounds": {{ singboxInbounds | json }}})"), makeContext());
    const QJsonArray inbounds = object.value(QStringLiteral("inbounds")).toArray();
    QCOMPARE(inbounds.size(), 2);

    const QJsonArray users = inbounds.at(0).toObject().value(QStringLiteral("users")).toArray();
    QCOMPARE(users.size(), 2);
    QCOMPARE(users.at(0).toObject().value(QStringLiteral("uuid")).toString(), makeUser(1, QString()).uuid);
}

void TestTemplateEngine::codecHelperReportsDroppedFields()
{
    TemplateContext context = makeContext();
    MultiplexSettings mux;
    mux.enabled = true;
    context.inbounds.first().multiplex = mux;
    context.inbounds.first().refreshRequiredCapabilities();

    QStringList warnings;
    TemplateError error;
    const std::optional<QByteArray> rendered = TemplateEngine::render(
        QStringLiteral(R"({"inbounds": {{ xrayInbounds | json }}})"), context, &error, &warnings);
    QVERIFY2(rendered.has_value(), qPrintable(error.toString()));
    QVERIFY(!warnings.filter(QStringLiteral("multiplex")).isEmpty());
}

void TestTemplateEngine::renderingIsDeterministic()
{
    const TemplateContext context = makeContext();
    const std::optional<QByteArray> first = TemplateEngine::render(singBoxTemplate(), context);
    const std::optional<QByteArray> second = TemplateEngine::render(singBoxTemplate(), context);
    QVERIFY(first.has_value());
    QCOMPARE(first, second);
}

void TestTemplateEngine::previewUsesSampleContext()
{
    TemplateError error;
    const std::optional<QByteArray> rendered = TemplateEngine::previewRender(xrayTemplate(), &error);
    QVERIFY2(rendered.has_value(), qPrintable(error.toString()));
    const QJsonArray inbounds = QJsonDocument::fromJson(rendered.value()).object().value(QStringLiteral("inbounds")).toArray();
    QCOMPARE(inbounds.size(), TemplateContext::sample().inbounds.size());
}

void TestTemplateEngine::functionNamesAreSorted()
{
    const QStringList names = TemplateEngine::functionNames();
    QStringList sorted = names;
    sorted.sort();
    QCOMPARE(names, sorted);
    QVERIFY(names.contains(QStringLiteral("singboxInbounds")));
    QVERIFY(names.contains(QStringLiteral("xrayRouting")));
}

QTEST_GUILESS_MAIN(TestTemplateEngine)
#include "tst_templateengine.moc"
