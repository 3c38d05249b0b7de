module;
#include <QByteArray>
#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <optional>

module corebridge.backend.jsonsupport;

namespace {
void setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}

bool isJsonSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}
}

QByteArray stripJsonComments(const QByteArray& raw)
{
    QByteArray out;
    out.reserve(raw.size());

    bool inString = false;
    qsizetype i = 0;
    const qsizetype size = raw.size();
    while (i < size) {
        const char c = raw.at(i);

        if (inString) {
            out.append(c);
            if (c == '\\' && i + 1 < size) {
                out.append(raw.at(i + 1));
                i += 2;
                continue;
            }
            if (c == '"') {
                inString = false;
            }
            ++i;
            continue;
        }

        if (c == '"') {
            inString = true;
            out.append(c);
            ++i;
            continue;
        }

        if (c == '/' && i + 1 < size && raw.at(i + 1) == '/') {
            i += 2;
            while (i < size && raw.at(i) != '\n') {
                ++i;
            }
            continue;
        }

        if (c == '/' && i + 1 < size && raw.at(i + 1) == '*') {
            i += 2;
            while (i + 1 < size && !(raw.at(i) == '*' && raw.at(i + 1) == '/')) {
                ++i;
            }
            i += 2;
            continue;
        }

        if (c == ']' || c == '}') {
            // Drop a trailing comma sitting before the closing bracket.
            qsizetype back = out.size() - 1;
            while (back >= 0 && isJsonSpace(out.at(back))) {
                --back;
            }
            if (back >= 0 && out.at(back) == ',') {
                out.remove(back, 1);
            }
        }

        out.append(c);
        ++i;
    }

    return out;
}

std::optional<QJsonDocument> parseJsonDocument(const QByteArray& raw, QString *errorMessage)
{
    if (raw.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Configuration payload is empty."));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(stripJsonComments(raw), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Invalid JSON at offset %1: %2")
                     .arg(parseError.offset)
                     .arg(parseError.errorString()));
        return std::nullopt;
    }

    return doc;
}

QStringList jsonStringList(const QJsonValue& value)
{
    QStringList out;
    if (value.isString()) {
        const QString trimmed = value.toString().trimmed();
        if (!trimmed.isEmpty()) {
            out.append(trimmed);
        }
        return out;
    }

    for (const QJsonValue& entry : value.toArray()) {
        const QString trimmed = entry.toString().trimmed();
        if (!trimmed.isEmpty()) {
            out.append(trimmed);
        }
    }
    return out;
}

QJsonArray toJsonArray(const QStringList& values)
{
    QJsonArray out;
    for (const QString& value : values) {
        out.append(value);
    }
    return out;
}

int jsonPort(const QJsonValue& value, bool *ok)
{
    if (ok) {
        *ok = true;
    }
    if (value.isUndefined() || value.isNull()) {
        return 0;
    }
    if (value.isDouble()) {
        const int port = value.toInt(-1);
        if (port >= 0 && port <= 65535) {
            return port;
        }
    } else if (value.isString()) {
        bool converted = false;
        const int port = value.toString().trimmed().toInt(&converted);
        if (converted && port >= 0 && port <= 65535) {
            return port;
        }
    }

    if (ok) {
        *ok = false;
    }
    return 0;
}

QString sha256Hex(const QByteArray& data)
{
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex());
}
