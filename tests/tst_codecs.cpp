#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtTest>

#ifndef Q_MOC_RUN
import corebridge.backend.converterregistry;
import corebridge.backend.jsonsupport;
import corebridge.backend.singboxcodec;
import corebridge.backend.xraycodec;
#endif

namespace {
const QByteArray kXrayReality = R"({
  // exported from a panel
  "log": {"loglevel": "warning"},
  "inbounds": [
    {
      "tag": "vless-reality",
      "port": 443,
      "protocol": "vless",
      "settings": {
        "clients": [{"id": "11111111-1111-1111-1111-111111111111", "email": "alice@example.com", "flow": "xtls-rprx-vision"}],
        "decryption": "none"
      },
      "streamSettings": {
        "network": "tcp",
        "security": "reality",
        "realitySettings": {
          "dest": "www.microsoft.com:443",
          "serverNames": ["www.microsoft.com", "microsoft.com"],
          "privateKey": "private-key",
          "publicKey": "public-key",
          "fingerprint": "chrome",
          "shortIds": ["6ba85179e30d4fc2"],
        }
      }
    },
  ]
})";

const QByteArray kSingBoxMux = R"({
  "inbounds": [
    {
      "type": "vmess",
      "tag": "vmess-ws",
      "listen": "::",
      "listen_port": 8080,
      "users": [{"name": "bob@example.com", "uuid": "22222222-2222-2222-2222-222222222222"}],
      "transport": {"type": "ws", "path": "/ws"},
      "multiplex": {"enabled": true, "padding": true, "brutal": {"enabled": true, "up_mbps": 100, "down_mbps": 100}}
    }
  ]
})";

bool anyContains(const QStringList& warnings, const QString& needle)
{
    for (const QString& warning : warnings) {
        if (warning.contains(needle)) {
            return true;
        }
    }
    return false;
}
}

class TestCodecs : public QObject
{
    Q_OBJECT

private slots:
    void stripsCommentsAndTrailingCommas();
    void keepsCommentMarkersInsideStrings();
    void detectsEngine();
    void rejectsUnrecognizedFormat();
    void parsesXrayReality();
    void skipsMalformedElements();
    void xrayToSingBoxReportsDroppedFields();
    void singBoxToXrayDropsMultiplex();
    void convertRejectsBadInput();
    void portsOutOfRangeAreReported();
};

void TestCodecs::stripsCommentsAndTrailingCommas()
{
    const QByteArray raw = "{\n  // line\n  \"a\": 1, /* block */\n  \"b\": [1, 2,],\n}";
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(stripJsonComments(raw), &error);
    QCOMPARE(error.error, QJsonParseError::NoError);
    QCOMPARE(doc.object().value(QStringLiteral("a")).toInt(), 1);
    QCOMPARE(doc.object().value(QStringLiteral("b")).toArray().size(), 2);
}

void TestCodecs::keepsCommentMarkersInsideStrings()
{
    const QByteArray raw = R"({"url": "http://example.com/*x*/", "q": "say \"//hi\""})";
    const std::optional<QJsonDocument> doc = parseJsonDocument(raw);
    QVERIFY(doc.has_value());
    QCOMPARE(doc->object().value(QStringLiteral("url")).toString(), QStringLiteral("http://example.com/*x*/"));
    QCOMPARE(doc->object().value(QStringLiteral("q")).toString(), QStringLiteral("say \"//hi\""));
}

void TestCodecs::detectsEngine()
{
    QCOMPARE(ConverterRegistry::detect(kXrayReality), std::optional<CoreEngine>(CoreEngine::Xray));
    QCOMPARE(ConverterRegistry::detect(kSingBoxMux), std::optional<CoreEngine>(CoreEngine::SingBox));
}

void TestCodecs::rejectsUnrecognizedFormat()
{
    QString message;
    QVERIFY(!ConverterRegistry::detect("{\"outbounds\": []}", &message).has_value());
    QVERIFY(!message.isEmpty());

    message.clear();
    QVERIFY(!ConverterRegistry::detect("{not json", &message).has_value());
    QVERIFY(message.contains(QStringLiteral("Invalid JSON")));
}

void TestCodecs::parsesXrayReality()
{
    QString message;
    const std::optional<CodecParseResult> parsed = XrayCodec::parse(QStringLiteral("xray.json"), kXrayReality, &message);
    QVERIFY2(parsed.has_value(), qPrintable(message));
    QCOMPARE(parsed->inbounds.size(), 1);

    const Inbound& inbound = parsed->inbounds.constFirst();
    QCOMPARE(inbound.type, QStringLiteral("vless"));
    QCOMPARE(inbound.tag, QStringLiteral("vless-reality"));
    QCOMPARE(inbound.listenPort, quint16(443));
    QCOMPARE(inbound.users.size(), 1);
    QCOMPARE(inbound.users.constFirst().name, QStringLiteral("alice@example.com"));
    QCOMPARE(inbound.users.constFirst().flow, QStringLiteral("xtls-rprx-vision"));
    QVERIFY(inbound.hasReality());
    QCOMPARE(inbound.tls->reality->handshake->server, QStringLiteral("www.microsoft.com"));
    QCOMPARE(inbound.tls->reality->handshake->serverPort, quint16(443));
    QCOMPARE(inbound.tls->reality->fingerprint, QStringLiteral("chrome"));
    QVERIFY(inbound.requiredCapabilities.contains(QStringLiteral("reality")));
}

void TestCodecs::skipsMalformedElements()
{
    const QByteArray raw = R"({"inbounds": [42, {"protocol": "vmess", "tag": "ok", "port": 1000, "settings": {"clients": []}}, {"tag": "no-protocol", "streamSettings": {}}]})";
    const std::optional<CodecParseResult> parsed = XrayCodec::parse(QStringLiteral("mixed.json"), raw);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->inbounds.size(), 1);
    QCOMPARE(parsed->inbounds.constFirst().tag, QStringLiteral("ok"));
    QVERIFY(anyContains(parsed->warnings, QStringLiteral("not an object")));
    QVERIFY(anyContains(parsed->warnings, QStringLiteral("missing protocol")));

    const QByteArray xrayBlocks = R"({"inbounds": [{"protocol": "vless", "tag": "bad-tls", "port": 443,
        "settings": {"clients": []},
        "streamSettings": {"network": "ws", "wsSettings": "x", "security": "tls", "tlsSettings": "x"}}]})";
    const std::optional<CodecParseResult> xray = XrayCodec::parse(QStringLiteral("blocks.json"), xrayBlocks);
    QVERIFY(xray.has_value());
    QCOMPARE(xray->inbounds.size(), 1);
    QVERIFY(xray->inbounds.constFirst().tls.has_value());
    QVERIFY(xray->inbounds.constFirst().tls->certificatePath.isEmpty());
    QVERIFY(xray->warnings.contains(QStringLiteral("inbound 'bad-tls': tlsSettings is not an object; skipped")));
    QVERIFY(xray->warnings.contains(QStringLiteral("inbound 'bad-tls': wsSettings is not an object; skipped")));

    const QByteArray singBoxBlocks = R"({"inbounds": [{"type": "vless", "tag": "bad-reality", "listen_port": 443,
        "users": [],
        "tls": {"enabled": true, "server_name": "a.example.com",
                "reality": {"enabled": true, "private_key": "k", "short_id": ["ab"], "handshake": "x"}}}]})";
    const std::optional<CodecParseResult> singBox = SingBoxCodec::parse(QStringLiteral("blocks.json"), singBoxBlocks);
    QVERIFY(singBox.has_value());
    QCOMPARE(singBox->inbounds.size(), 1);
    QVERIFY(singBox->inbounds.constFirst().hasReality());
    QVERIFY(!singBox->inbounds.constFirst().tls->reality->handshake.has_value());
    QVERIFY(singBox->warnings.contains(QStringLiteral("inbound 'bad-reality': handshake is not an object; skipped")));
}

void TestCodecs::xrayToSingBoxReportsDroppedFields()
{
    QString message;
    const std::optional<ConversionResult> converted =
        ConverterRegistry::convertConfig(QStringLiteral("xray"), QStringLiteral("sing-box"), kXrayReality, &message);
    QVERIFY2(converted.has_value(), qPrintable(message));

    QVERIFY(anyContains(converted->warnings, QStringLiteral("reality fingerprint")));
    QVERIFY(anyContains(converted->warnings, QStringLiteral("reality public key")));
    QVERIFY(anyContains(converted->warnings, QStringLiteral("reality server names")));

    const QJsonObject root = QJsonDocument::fromJson(converted->config).object();
    const QJsonArray inbounds = root.value(QStringLiteral("inbounds")).toArray();
    QCOMPARE(inbounds.size(), 1);
    const QJsonObject inbound = inbounds.at(0).toObject();
    QCOMPARE(inbound.value(QStringLiteral("type")).toString(), QStringLiteral("vless"));
    QCOMPARE(inbound.value(QStringLiteral("listen_port")).toInt(), 443);
    const QJsonObject reality = inbound.value(QStringLiteral("tls")).toObject().value(QStringLiteral("reality")).toObject();
    QVERIFY(reality.value(QStringLiteral("enabled")).toBool());
    QCOMPARE(reality.value(QStringLiteral("private_key")).toString(), QStringLiteral("private-key"));

    // Parsing the converted document again keeps what sing-box can express.
    const std::optional<CodecParseResult> reparsed = SingBoxCodec::parse(QStringLiteral("converted.json"), converted->config);
    QVERIFY(reparsed.has_value());
    QCOMPARE(reparsed->inbounds.size(), 1);
    QVERIFY(reparsed->inbounds.constFirst().hasReality());
    QVERIFY(reparsed->inbounds.constFirst().tls->reality->fingerprint.isEmpty());
}

void TestCodecs::singBoxToXrayDropsMultiplex()
{
    const std::optional<ConversionResult> converted =
        ConverterRegistry::convertConfig(QStringLiteral("sing-box"), QStringLiteral("xray"), kSingBoxMux);
    QVERIFY(converted.has_value());
    QVERIFY(anyContains(converted->warnings, QStringLiteral("multiplex has no xray equivalent")));
    QVERIFY(anyContains(converted->warnings, QStringLiteral("brutal has no xray equivalent")));

    const QJsonArray inbounds = QJsonDocument::fromJson(converted->config).object().value(QStringLiteral("inbounds")).toArray();
    QCOMPARE(inbounds.size(), 1);
    const QJsonObject inbound = inbounds.at(0).toObject();
    QCOMPARE(inbound.value(QStringLiteral("protocol")).toString(), QStringLiteral("vmess"));
    QCOMPARE(inbound.value(QStringLiteral("port")).toInt(), 8080);
    QVERIFY(!inbound.contains(QStringLiteral("multiplex")));
    const QJsonObject stream = inbound.value(QStringLiteral("streamSettings")).toObject();
    QCOMPARE(stream.value(QStringLiteral("network")).toString(), QStringLiteral("ws"));
}

void TestCodecs::convertRejectsBadInput()
{
    QString message;
    QVERIFY(!ConverterRegistry::convertConfig(QStringLiteral("xray"), QStringLiteral("sing-box"), QByteArray(), &message).has_value());
    QVERIFY(message.contains(QStringLiteral("empty")));

    QVERIFY(!ConverterRegistry::convertConfig(QStringLiteral("clash"), QStringLiteral("xray"), kXrayReality, &message).has_value());
    QVERIFY(message.contains(QStringLiteral("clash")));

    QVERIFY(!ConverterRegistry::convertConfig(QString(), QStringLiteral("xray"), kXrayReality, &message).has_value());
}

void TestCodecs::portsOutOfRangeAreReported()
{
    const QByteArray raw = R"({"inbounds": [{"type": "trojan", "tag": "t", "listen_port": 70000, "users": [{"password": "p"}]}]})";
    const std::optional<CodecParseResult> parsed = SingBoxCodec::parse(QStringLiteral("ports.json"), raw);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->inbounds.size(), 1);
    QCOMPARE(parsed->inbounds.constFirst().listenPort, quint16(0));
    QVERIFY(anyContains(parsed->warnings, QStringLiteral("listen_port")));
}

QTEST_GUILESS_MAIN(TestCodecs)
#include "tst_codecs.moc"
