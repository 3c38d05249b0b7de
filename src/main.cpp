#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QTextStream>

#include <functional>
#include <optional>
#include <utility>

import corebridge.backend.agenthostservice;
import corebridge.backend.appsettings;
import corebridge.backend.configtemplateservice;
import corebridge.backend.jsonlineagentclient;
import corebridge.backend.localstore;
import corebridge.backend.templateengine;

namespace {
QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printJson(const QJsonValue& value)
{
    const QJsonDocument doc = value.isArray() ? QJsonDocument(value.toArray()) : QJsonDocument(value.toObject());
    out() << QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
    out().flush();
}

void printWarnings(const QStringList& warnings)
{
    for (const QString& warning : warnings) {
        err() << "warning: " << warning << Qt::endl;
    }
}

int fail(const QString& message)
{
    err() << "error: " << message << Qt::endl;
    return 1;
}

int fail(const PipelineError& error)
{
    err() << "error: " << error.toString() << Qt::endl;
    return error.code == ErrorCode::NotFound ? 3 : 1;
}

bool readFile(const QString& path, QByteArray *data, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorMessage = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }
    *data = file.readAll();
    return true;
}

std::optional<qint64> parseId(const QString& value, const QString& what, QString *errorMessage)
{
    bool ok = false;
    const qint64 id = value.toLongLong(&ok);
    if (!ok || id < 0) {
        *errorMessage = QStringLiteral("Invalid %1 '%2'").arg(what, value);
        return std::nullopt;
    }
    return id;
}

std::optional<QList<int>> parsePorts(const QStringList& values, QString *errorMessage)
{
    QList<int> ports;
    for (const QString& value : values) {
        bool ok = false;
        const int port = value.toInt(&ok);
        if (!ok) {
            *errorMessage = QStringLiteral("Invalid port '%1'").arg(value);
            return std::nullopt;
        }
        ports.append(port);
    }
    return ports;
}

QJsonArray inboundsToJson(const QList<Inbound>& inbounds)
{
    QJsonArray array;
    for (const Inbound& inbound : inbounds) {
        array.append(inbound.toJson());
    }
    return array;
}

QJsonObject switchResultToJson(const SwitchResult& result)
{
    QJsonObject json {
        {QStringLiteral("success"), result.success},
        {QStringLiteral("new_instance_id"), result.newInstanceId},
        {QStringLiteral("message"), result.message},
        {QStringLiteral("error"), result.error},
        {QStringLiteral("switch_log_id"), result.switchLogId},
        {QStringLiteral("switch_id"), result.switchId},
        {QStringLiteral("from_instance_id"), result.fromInstanceId},
        {QStringLiteral("to_core_type"), result.toCoreType}
    };
    if (result.completedAt.has_value()) {
        json.insert(QStringLiteral("completed_at"), result.completedAt->toString(Qt::ISODateWithMs));
    }
    return json;
}

// Users of a native config, one per distinct credential.
QList<UserConfig> usersFromInbounds(const QList<Inbound>& inbounds)
{
    QList<UserConfig> users;
    QSet<QString> seen;
    for (const Inbound& inbound : inbounds) {
        for (const InboundUser& user : inbound.users) {
            const QString key = user.uuid.isEmpty() ? user.password : user.uuid;
            if (key.isEmpty() || seen.contains(key)) {
                continue;
            }
            seen.insert(key);

            UserConfig config;
            config.id = users.size() + 1;
            config.uuid = user.uuid;
            config.email = user.name;
            config.password = user.password;
            config.flow = user.flow;
            users.append(config);
        }
    }
    return users;
}

struct Tool {
    QCommandLineParser& parser;
    QStringList args;
    AppSettings settings;
    LocalStore *store = nullptr;

    QString option(const QString& name) const { return parser.value(name).trimmed(); }
    bool requireArgs(int count, const QString& usage) const
    {
        if (args.size() < count) {
            err() << "usage: corebridge " << usage << Qt::endl;
            return false;
        }
        return true;
    }
};

int runDetect(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("detect <file>"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    const std::optional<CoreEngine> engine = ConverterRegistry::detect(raw, &message);
    if (!engine.has_value()) {
        return fail(message);
    }
    out() << coreEngineName(engine.value()) << Qt::endl;
    return 0;
}

int runParse(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("parse <file> [--engine <type>]"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    const QString engine = tool.option(QStringLiteral("engine"));
    const std::optional<CodecParseResult> parsed = engine.isEmpty()
        ? ConverterRegistry::parseAny(QFileInfo(tool.args.at(0)).fileName(), raw, &message)
        : ConverterRegistry::parse(raw, engine, &message);
    if (!parsed.has_value()) {
        return fail(message);
    }
    printWarnings(parsed->warnings);
    printJson(inboundsToJson(parsed->inbounds));
    return 0;
}

int runConvert(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("convert <file> --from <type> --to <type>"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    const std::optional<ConversionResult> converted = ConverterRegistry::convertConfig(
        tool.option(QStringLiteral("from")), tool.option(QStringLiteral("to")), raw, &message);
    if (!converted.has_value()) {
        return fail(message);
    }
    printWarnings(converted->warnings);
    out() << QString::fromUtf8(converted->config);
    out().flush();
    return 0;
}

int runCaps(Tool& tool)
{
    const QString core = tool.option(QStringLiteral("core"));
    if (!parseCoreEngine(core).has_value()) {
        return fail(QStringLiteral("Unsupported core type '%1'").arg(core));
    }
    const QStringList capabilities = deriveCapabilities(
        core, tool.option(QStringLiteral("version")), tool.parser.values(QStringLiteral("tag")));
    printJson(QJsonArray::fromStringList(capabilities));
    return 0;
}

int printValidation(const ValidationResult& result)
{
    printWarnings(result.warnings);
    for (const QString& error : result.errors) {
        err() << "error: " << error << Qt::endl;
    }
    if (!result.valid) {
        return 1;
    }
    out() << "valid" << Qt::endl;
    return 0;
}

int runValidateTemplate(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("validate-template <file> --type <type>"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    return printValidation(
        TemplateValidator::validateTemplate(QString::fromUtf8(raw), tool.option(QStringLiteral("type"))));
}

int runValidateConfig(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("validate-config <file> --type <type>"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    return printValidation(TemplateValidator::validateFinalConfig(raw, tool.option(QStringLiteral("type"))));
}

int runPreview(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("preview <file>"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }
    TemplateError error;
    QStringList warnings;
    const std::optional<QByteArray> rendered = TemplateEngine::previewRender(QString::fromUtf8(raw), &error, &warnings);
    printWarnings(warnings);
    if (!rendered.has_value()) {
        return fail(error.toString());
    }
    out() << QString::fromUtf8(rendered.value());
    out().flush();
    return 0;
}

int runAddHost(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("add-host <name> <address> [--token --core --version --capability... --tag...]"))) {
        return 2;
    }
    AgentHost host;
    host.name = tool.args.at(0);
    host.host = tool.args.at(1);
    host.token = tool.option(QStringLiteral("token"));
    host.coreType = tool.option(QStringLiteral("core"));
    host.coreVersion = tool.option(QStringLiteral("version"));
    host.capabilities = tool.parser.values(QStringLiteral("capability"));
    host.buildTags = tool.parser.values(QStringLiteral("tag"));

    PipelineError error;
    const std::optional<qint64> id = tool.store->saveHost(host, &error);
    if (!id.has_value()) {
        return fail(error);
    }
    out() << id.value() << Qt::endl;
    return 0;
}

int runHosts(Tool& tool)
{
    QJsonArray array;
    for (const AgentHost& host : tool.store->hosts()) {
        QJsonObject json = host.toJson();
        json.remove(QStringLiteral("token"));
        array.append(json);
    }
    printJson(array);
    return 0;
}

int runSetInventory(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("set-inventory <host> <config-file>"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }
    QByteArray raw;
    if (!readFile(tool.args.at(1), &raw, &message)) {
        return fail(message);
    }
    const std::optional<CodecParseResult> parsed =
        ConverterRegistry::parseAny(QFileInfo(tool.args.at(1)).fileName(), raw, &message);
    if (!parsed.has_value()) {
        return fail(message);
    }
    printWarnings(parsed->warnings);

    PipelineError error;
    if (!tool.store->agentHosts().findById(hostId.value(), &error).has_value()) {
        return fail(error);
    }
    if (!tool.store->setInventory(hostId.value(), parsed->inbounds, usersFromInbounds(parsed->inbounds), &error)) {
        return fail(error);
    }
    out() << parsed->inbounds.size() << " inbounds" << Qt::endl;
    return 0;
}

int runTemplates(Tool& tool)
{
    const ConfigTemplateService service(tool.store->configTemplates());
    QJsonArray array;
    for (const ConfigTemplate& tmpl : service.list()) {
        QJsonObject json = tmpl.toJson();
        json.remove(QStringLiteral("content"));
        array.append(json);
    }
    printJson(array);
    return 0;
}

int runAddTemplate(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("add-template <file> --type <type> [--name --min-version --capability...]"))) {
        return 2;
    }
    QByteArray raw;
    QString message;
    if (!readFile(tool.args.at(0), &raw, &message)) {
        return fail(message);
    }

    CreateTemplateRequest request;
    request.name = tool.option(QStringLiteral("name"));
    if (request.name.isEmpty()) {
        request.name = QFileInfo(tool.args.at(0)).completeBaseName();
    }
    request.description = tool.option(QStringLiteral("description"));
    request.type = tool.option(QStringLiteral("type"));
    request.content = QString::fromUtf8(raw);
    request.minVersion = tool.option(QStringLiteral("min-version"));
    request.capabilities = tool.parser.values(QStringLiteral("capability"));

    ConfigTemplateService service(tool.store->configTemplates());
    PipelineError error;
    const std::optional<ConfigTemplate> created = service.create(request, &error);
    if (!created.has_value()) {
        return fail(error);
    }
    if (!created->isValid) {
        err() << "warning: template stored with validation errors: " << created->validationError << Qt::endl;
    }
    out() << created->id << Qt::endl;
    return 0;
}

std::optional<std::pair<qint64, qint64>> hostAndTemplate(Tool& tool, QString *message)
{
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), message);
    const std::optional<qint64> templateId = parseId(tool.args.at(1), QStringLiteral("template id"), message);
    if (!hostId.has_value() || !templateId.has_value()) {
        return std::nullopt;
    }
    return std::make_pair(hostId.value(), templateId.value());
}

int runAssign(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("assign <host> <template>"))) {
        return 2;
    }
    QString message;
    const auto ids = hostAndTemplate(tool, &message);
    if (!ids.has_value()) {
        return fail(message);
    }
    AgentHostService service(tool.store->agentHosts(), tool.store->configTemplates(), tool.store->inventory());
    QStringList warnings;
    PipelineError error;
    const bool assigned = service.assignTemplate(ids->first, ids->second, &warnings, &error);
    printWarnings(warnings);
    if (!assigned) {
        return fail(error);
    }
    out() << "assigned" << Qt::endl;
    return 0;
}

int runCheck(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("check <host> <template>"))) {
        return 2;
    }
    QString message;
    const auto ids = hostAndTemplate(tool, &message);
    if (!ids.has_value()) {
        return fail(message);
    }
    const AgentHostService service(tool.store->agentHosts(), tool.store->configTemplates(), tool.store->inventory());
    PipelineError error;
    const std::optional<CompatibilityResult> result = service.checkTemplateCompatibility(ids->first, ids->second, &error);
    if (!result.has_value()) {
        return fail(error);
    }
    printJson(QJsonObject {
        {QStringLiteral("compatible"), result->compatible},
        {QStringLiteral("version_unknown"), result->versionUnknown},
        {QStringLiteral("warnings"), QJsonArray::fromStringList(result->warnings)},
        {QStringLiteral("errors"), QJsonArray::fromStringList(result->errors)}
    });
    return result->compatible ? 0 : 1;
}

int runGenerate(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("generate <host>"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }
    const AgentHostService service(tool.store->agentHosts(), tool.store->configTemplates(), tool.store->inventory());
    std::optional<GeneratedConfig> generated;
    PipelineError error;
    if (!service.generateConfig(hostId.value(), &generated, &error)) {
        return fail(error);
    }
    if (!generated.has_value()) {
        err() << "no template assigned, the agent keeps its local config" << Qt::endl;
        return 0;
    }
    printWarnings(generated->warnings);
    out() << QString::fromUtf8(generated->config);
    out().flush();
    return 0;
}

CallContext callContext(const Tool& tool)
{
    bool ok = false;
    const qint64 timeout = tool.option(QStringLiteral("timeout")).toLongLong(&ok);
    return ok && timeout > 0 ? CallContext::withTimeout(timeout) : CallContext();
}

AgentCoreService coreService(Tool& tool)
{
    return AgentCoreService(tool.store->agentHosts(),
                            tool.store->configTemplates(),
                            tool.store->coreInstances(),
                            tool.store->switchLogs(),
                            tool.store->inventory(),
                            JsonLineAgentClient::factory(),
                            tool.settings.serviceOptions());
}

int runCores(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("cores <host>"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }
    AgentCoreService service = coreService(tool);
    PipelineError error;
    const std::optional<QList<CoreInfo>> cores = service.getCores(hostId.value(), callContext(tool), &error);
    if (!cores.has_value()) {
        return fail(error);
    }
    QJsonArray array;
    for (const CoreInfo& core : cores.value()) {
        array.append(core.toJson());
    }
    printJson(array);
    return 0;
}

int runInstances(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("instances <host>"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }
    const AgentCoreService service = coreService(tool);
    PipelineError error;
    const std::optional<QList<AgentCoreInstance>> instances = service.getInstances(hostId.value(), &error);
    if (!instances.has_value()) {
        return fail(error);
    }
    QJsonArray array;
    for (const AgentCoreInstance& instance : instances.value()) {
        array.append(instance.toJson());
    }
    printJson(array);
    return 0;
}

// Shared by create-instance and switch.
bool readConfigOptions(Tool& tool, QByteArray *configJson, std::optional<qint64> *templateId, QList<int> *ports, QString *message)
{
    const QString configFile = tool.option(QStringLiteral("config-file"));
    if (!configFile.isEmpty() && !readFile(configFile, configJson, message)) {
        return false;
    }
    const QString templateValue = tool.option(QStringLiteral("template"));
    if (!templateValue.isEmpty()) {
        const std::optional<qint64> id = parseId(templateValue, QStringLiteral("template id"), message);
        if (!id.has_value()) {
            return false;
        }
        *templateId = id;
    }
    const std::optional<QList<int>> parsed = parsePorts(tool.parser.values(QStringLiteral("port")), message);
    if (!parsed.has_value()) {
        return false;
    }
    *ports = parsed.value();
    return true;
}

std::optional<qint64> operatorId(const Tool& tool)
{
    bool ok = false;
    const qint64 id = tool.option(QStringLiteral("operator")).toLongLong(&ok);
    return ok ? std::optional<qint64>(id) : std::nullopt;
}

int runCreateInstance(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("create-instance <host> <instance> --core <type> [--config-file --template --port...]"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }

    CreateInstanceRequest request;
    request.agentHostId = hostId.value();
    request.instanceId = tool.args.at(1);
    request.coreType = tool.option(QStringLiteral("core"));
    request.operatorId = operatorId(tool);
    if (!readConfigOptions(tool, &request.configJson, &request.configTemplateId, &request.listenPorts, &message)) {
        return fail(message);
    }

    AgentCoreService service = coreService(tool);
    SwitchResult result;
    PipelineError error;
    const std::optional<AgentCoreInstance> instance = service.createInstance(request, callContext(tool), &error, &result);
    printWarnings(result.reconciliationWarnings);
    if (!instance.has_value()) {
        return fail(error);
    }
    printJson(instance->toJson());
    return 0;
}

int runDeleteInstance(Tool& tool)
{
    if (!tool.requireArgs(2, QStringLiteral("delete-instance <host> <instance>"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }
    AgentCoreService service = coreService(tool);
    PipelineError error;
    if (!service.deleteInstance(hostId.value(), tool.args.at(1), &error)) {
        return fail(error);
    }
    out() << "deleted" << Qt::endl;
    return 0;
}

int runSwitch(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("switch <host> --from <instance> --to <type> [--config-file --template --port... --zero-downtime]"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }

    SwitchCoreRequest request;
    request.agentHostId = hostId.value();
    request.fromInstanceId = tool.option(QStringLiteral("from"));
    request.toCoreType = tool.option(QStringLiteral("to"));
    request.zeroDowntime = tool.parser.isSet(QStringLiteral("zero-downtime"));
    request.operatorId = operatorId(tool);
    if (!readConfigOptions(tool, &request.configJson, &request.configTemplateId, &request.listenPorts, &message)) {
        return fail(message);
    }

    AgentCoreService service = coreService(tool);
    PipelineError error;
    const std::optional<SwitchResult> result = service.switchCore(request, callContext(tool), &error);
    if (!result.has_value()) {
        return fail(error);
    }
    printWarnings(result->reconciliationWarnings);
    printJson(switchResultToJson(result.value()));
    return result->success ? 0 : 1;
}

int runLogs(Tool& tool)
{
    if (!tool.requireArgs(1, QStringLiteral("logs <host> [--status --limit --offset]"))) {
        return 2;
    }
    QString message;
    const std::optional<qint64> hostId = parseId(tool.args.at(0), QStringLiteral("host id"), &message);
    if (!hostId.has_value()) {
        return fail(message);
    }

    SwitchLogFilter filter;
    filter.agentHostId = hostId.value();
    const QString status = tool.option(QStringLiteral("status"));
    if (!status.isEmpty()) {
        filter.status = parseSwitchStatus(status);
        if (!filter.status.has_value()) {
            return fail(QStringLiteral("Unknown switch status '%1'").arg(status));
        }
    }
    filter.limit = tool.option(QStringLiteral("limit")).toInt();
    filter.offset = tool.option(QStringLiteral("offset")).toInt();

    const AgentCoreService service = coreService(tool);
    PipelineError error;
    const std::optional<SwitchLogPage> page = service.getSwitchLogs(filter, &error);
    if (!page.has_value()) {
        return fail(error);
    }
    QJsonArray rows;
    for (const AgentCoreSwitchLog& log : page->rows) {
        rows.append(log.toJson());
    }
    printJson(QJsonObject {{QStringLiteral("total"), page->total}, {QStringLiteral("rows"), rows}});
    return 0;
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("genyleap.com"));
    QCoreApplication::setApplicationName(QStringLiteral("CoreBridge"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Agent core configuration pipeline"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Subcommand to run."));
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("Settings INI file."), QStringLiteral("file")},
        {QStringLiteral("data-dir"), QStringLiteral("Store directory."), QStringLiteral("dir")},
        {QStringLiteral("log-level"), QStringLiteral("debug, info, warning or critical."), QStringLiteral("level")},
        {QStringLiteral("engine"), QStringLiteral("Engine of the input file."), QStringLiteral("type")},
        {QStringLiteral("from"), QStringLiteral("Source engine, or instance to replace."), QStringLiteral("value")},
        {QStringLiteral("to"), QStringLiteral("Target engine."), QStringLiteral("type")},
        {QStringLiteral("core"), QStringLiteral("Engine type."), QStringLiteral("type")},
        {QStringLiteral("version"), QStringLiteral("Engine version."), QStringLiteral("version")},
        {QStringLiteral("tag"), QStringLiteral("Build tag, repeatable."), QStringLiteral("tag")},
        {QStringLiteral("capability"), QStringLiteral("Capability token, repeatable."), QStringLiteral("token")},
        {QStringLiteral("token"), QStringLiteral("Agent credential."), QStringLiteral("token")},
        {QStringLiteral("type"), QStringLiteral("Template or config engine."), QStringLiteral("type")},
        {QStringLiteral("name"), QStringLiteral("Template name."), QStringLiteral("name")},
        {QStringLiteral("description"), QStringLiteral("Template description."), QStringLiteral("text")},
        {QStringLiteral("min-version"), QStringLiteral("Minimum engine version."), QStringLiteral("version")},
        {QStringLiteral("config-file"), QStringLiteral("Explicit engine config payload."), QStringLiteral("file")},
        {QStringLiteral("template"), QStringLiteral("Template id."), QStringLiteral("id")},
        {QStringLiteral("port"), QStringLiteral("Listen port, repeatable."), QStringLiteral("port")},
        {QStringLiteral("zero-downtime"), QStringLiteral("Start the new instance before stopping the old one.")},
        {QStringLiteral("operator"), QStringLiteral("Operator id recorded in the switch log."), QStringLiteral("id")},
        {QStringLiteral("status"), QStringLiteral("Switch status filter."), QStringLiteral("status")},
        {QStringLiteral("limit"), QStringLiteral("Page size."), QStringLiteral("n")},
        {QStringLiteral("offset"), QStringLiteral("Page offset."), QStringLiteral("n")},
        {QStringLiteral("timeout"), QStringLiteral("Deadline of agent calls in milliseconds."), QStringLiteral("ms")}
    });
    parser.process(app);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const QString command = positional.takeFirst();

    Tool tool {parser, positional, AppSettings()};
    tool.settings.load(parser.value(QStringLiteral("config")));
    if (parser.isSet(QStringLiteral("data-dir"))) {
        tool.settings.setDataDirectory(parser.value(QStringLiteral("data-dir")));
    }
    if (parser.isSet(QStringLiteral("log-level"))) {
        tool.settings.setLogLevel(parser.value(QStringLiteral("log-level")));
    }
    if (!configureLogging(tool.settings.logLevel())) {
        err() << "warning: unknown log level '" << tool.settings.logLevel() << "', using info" << Qt::endl;
    }

    const QHash<QString, std::function<int(Tool&)>> offline {
        {QStringLiteral("detect"), runDetect},
        {QStringLiteral("parse"), runParse},
        {QStringLiteral("convert"), runConvert},
        {QStringLiteral("caps"), runCaps},
        {QStringLiteral("validate-template"), runValidateTemplate},
        {QStringLiteral("preview"), runPreview},
        {QStringLiteral("validate-config"), runValidateConfig}
    };
    const QHash<QString, std::function<int(Tool&)>> stored {
        {QStringLiteral("add-host"), runAddHost},
        {QStringLiteral("hosts"), runHosts},
        {QStringLiteral("set-inventory"), runSetInventory},
        {QStringLiteral("templates"), runTemplates},
        {QStringLiteral("add-template"), runAddTemplate},
        {QStringLiteral("assign"), runAssign},
        {QStringLiteral("check"), runCheck},
        {QStringLiteral("generate"), runGenerate},
        {QStringLiteral("cores"), runCores},
        {QStringLiteral("instances"), runInstances},
        {QStringLiteral("create-instance"), runCreateInstance},
        {QStringLiteral("delete-instance"), runDeleteInstance},
        {QStringLiteral("switch"), runSwitch},
        {QStringLiteral("logs"), runLogs}
    };

    if (offline.contains(command)) {
        return offline.value(command)(tool);
    }
    if (!stored.contains(command)) {
        return fail(QStringLiteral("Unknown command '%1'").arg(command));
    }

    if (!QDir().mkpath(tool.settings.dataDirectory())) {
        return fail(QStringLiteral("Cannot create data directory %1").arg(tool.settings.dataDirectory()));
    }
    LocalStore store(tool.settings.storePath());
    PipelineError error;
    if (!store.load(&error)) {
        return fail(error);
    }
    tool.store = &store;
    return stored.value(command)(tool);
}
