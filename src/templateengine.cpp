module;
#include <QByteArray>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QPair>
#include <QLoggingCategory>
#include <QSet>
#include <QString>
#include <QStringList>

#include <cmath>
#include <optional>
#include <vector>

module corebridge.backend.templateengine;
import corebridge.backend.capability;
import corebridge.backend.jsonsupport;
import corebridge.backend.singboxcodec;
import corebridge.backend.xraycodec;

namespace {
Q_LOGGING_CATEGORY(lcTemplate, "corebridge.template")

struct Expr {
    enum class Kind { Literal, Path, Call };

    Kind kind = Kind::Literal;
    QJsonValue literal;     //!< Literal value.
    QString base;           //!< Path base: ".", "$" or a "$variable".
    QStringList segments;   //!< Path segments below the base.
    QString function;       //!< Called function name.
    std::vector<Expr> args; //!< Call arguments.
    QString source;         //!< Source text for diagnostics.
};

struct Node {
    enum class Kind { Text, Output, If, Range };

    Kind kind = Kind::Text;
    QString text;
    Expr expr;
    std::vector<Node> body;
    std::vector<Node> elseBody;
    int line = 0;
};

struct Item {
    bool action = false;
    QString text;
    int line = 1;
};

enum class TokenType { Ident, Path, String, Number, LParen, RParen, Pipe };

struct Token {
    TokenType type = TokenType::Ident;
    QString text;
    QJsonValue value;
};

struct Scope {
    QJsonValue dot;
    QHash<QString, QJsonValue> variables;
};

void setError(TemplateError *error, TemplateErrorKind kind, int line, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->line = line;
        error->message = message;
    }
}

const QSet<QString>& knownFunctions()
{
    static const QSet<QString> names {
        QStringLiteral("json"), QStringLiteral("quote"), QStringLiteral("default"), QStringLiteral("join"),
        QStringLiteral("lower"), QStringLiteral("upper"), QStringLiteral("trim"), QStringLiteral("eq"),
        QStringLiteral("ne"), QStringLiteral("not"), QStringLiteral("and"), QStringLiteral("or"),
        QStringLiteral("len"), QStringLiteral("contains"), QStringLiteral("hasCap"), QStringLiteral("hasTag"),
        QStringLiteral("inboundTags"), QStringLiteral("statsUsers"), QStringLiteral("usersForProtocol"),
        QStringLiteral("filterByType"), QStringLiteral("singboxInbounds"), QStringLiteral("singboxOutbounds"),
        QStringLiteral("defaultDns"), QStringLiteral("defaultRoute"), QStringLiteral("v2rayApi"),
        QStringLiteral("xrayInbounds"), QStringLiteral("xrayOutbounds"), QStringLiteral("xrayApi"),
        QStringLiteral("xrayApiInbound"), QStringLiteral("xrayPolicy"), QStringLiteral("xrayRouting")
    };
    return names;
}

// Functions that accept unresolved paths as falsy values.
bool acceptsUndefined(const QString& name)
{
    return name == QStringLiteral("default") || name == QStringLiteral("not")
        || name == QStringLiteral("and") || name == QStringLiteral("or")
        || name == QStringLiteral("eq") || name == QStringLiteral("ne");
}

bool isKeywordLiteral(const QString& word)
{
    return word == QStringLiteral("true") || word == QStringLiteral("false") || word == QStringLiteral("nil");
}

bool isIdentStart(QChar c)
{
    return c.isLetter() || c == QLatin1Char('_');
}

bool isIdentChar(QChar c)
{
    return c.isLetterOrNumber() || c == QLatin1Char('_');
}

QString trimLeading(const QString& text)
{
    qsizetype i = 0;
    while (i < text.size() && text.at(i).isSpace()) {
        ++i;
    }
    return text.mid(i);
}

QString trimTrailing(const QString& text)
{
    qsizetype end = text.size();
    while (end > 0 && text.at(end - 1).isSpace()) {
        --end;
    }
    return text.left(end);
}

QString encodeJson(const QJsonValue& value)
{
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isUndefined()) {
        return QStringLiteral("null");
    }
    // Scalars are encoded through a one-element array.
    const QString wrapped = QString::fromUtf8(QJsonDocument(QJsonArray {value}).toJson(QJsonDocument::Compact));
    return wrapped.mid(1, wrapped.size() - 2);
}

QString formatValue(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double number = value.toDouble();
        if (std::floor(number) == number && std::fabs(number) < 1e15) {
            return QString::number(static_cast<qint64>(number));
        }
        return QString::number(number, 'g', 15);
    }
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Null:
        return QStringLiteral("null");
    case QJsonValue::Array:
    case QJsonValue::Object:
        return encodeJson(value);
    case QJsonValue::Undefined:
        break;
    }
    return {};
}

bool isTruthy(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool();
    case QJsonValue::Double:
        return value.toDouble() != 0.0;
    case QJsonValue::String:
        return !value.toString().isEmpty();
    case QJsonValue::Array:
        return !value.toArray().isEmpty();
    case QJsonValue::Object:
        return !value.toObject().isEmpty();
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        break;
    }
    return false;
}

bool valuesEqual(const QJsonValue& left, const QJsonValue& right)
{
    if (left.isDouble() && right.isDouble()) {
        return left.toDouble() == right.toDouble();
    }
    if (left.isUndefined() || right.isUndefined()) {
        return left.isUndefined() && right.isUndefined();
    }
    return left == right;
}

std::optional<QList<Token>> tokenize(const QString& action, QString *error)
{
    QList<Token> tokens;
    const qsizetype size = action.size();
    qsizetype i = 0;

    while (i < size) {
        const QChar c = action.at(i);
        if (c.isSpace()) {
            ++i;
            continue;
        }
        if (c == QLatin1Char('(')) {
            tokens.append({TokenType::LParen, QStringLiteral("("), {}});
            ++i;
            continue;
        }
        if (c == QLatin1Char(')')) {
            tokens.append({TokenType::RParen, QStringLiteral(")"), {}});
            ++i;
            continue;
        }
        if (c == QLatin1Char('|')) {
            tokens.append({TokenType::Pipe, QStringLiteral("|"), {}});
            ++i;
            continue;
        }

        if (c == QLatin1Char('"') || c == QLatin1Char('`')) {
            const qsizetype start = i;
            const bool raw = c == QLatin1Char('`');
            QString value;
            bool closed = false;
            ++i;
            while (i < size) {
                const QChar ch = action.at(i);
                if (!raw && ch == QLatin1Char('\\') && i + 1 < size) {
                    const QChar escaped = action.at(i + 1);
                    if (escaped == QLatin1Char('n')) {
                        value.append(QLatin1Char('\n'));
                    } else if (escaped == QLatin1Char('t')) {
                        value.append(QLatin1Char('\t'));
                    } else {
                        value.append(escaped);
                    }
                    i += 2;
                    continue;
                }
                if (ch == c) {
                    closed = true;
                    ++i;
                    break;
                }
                value.append(ch);
                ++i;
            }
            if (!closed) {
                *error = QStringLiteral("unterminated string literal");
                return std::nullopt;
            }
            tokens.append({TokenType::String, action.mid(start, i - start), QJsonValue(value)});
            continue;
        }

        if (c == QLatin1Char('.') || c == QLatin1Char('$')) {
            const qsizetype start = i;
            ++i;
            while (i < size && (isIdentChar(action.at(i)) || action.at(i) == QLatin1Char('.'))) {
                ++i;
            }
            tokens.append({TokenType::Path, action.mid(start, i - start), {}});
            continue;
        }

        if (c.isDigit() || (c == QLatin1Char('-') && i + 1 < size && action.at(i + 1).isDigit())) {
            const qsizetype start = i;
            ++i;
            while (i < size && (action.at(i).isDigit() || action.at(i) == QLatin1Char('.'))) {
                ++i;
            }
            const QString text = action.mid(start, i - start);
            bool ok = false;
            const double number = text.toDouble(&ok);
            if (!ok) {
                *error = QStringLiteral("invalid number '%1'").arg(text);
                return std::nullopt;
            }
            tokens.append({TokenType::Number, text, QJsonValue(number)});
            continue;
        }

        if (isIdentStart(c)) {
            const qsizetype start = i;
            while (i < size && isIdentChar(action.at(i))) {
                ++i;
            }
            tokens.append({TokenType::Ident, action.mid(start, i - start), {}});
            continue;
        }

        *error = QStringLiteral("unexpected character '%1'").arg(c);
        return std::nullopt;
    }

    return tokens;
}

class ExpressionParser
{
public:
    explicit ExpressionParser(const QList<Token>& tokens)
        : m_tokens(tokens)
    {
    }

    std::optional<Expr> parse(QString *error)
    {
        if (m_tokens.isEmpty()) {
            *error = QStringLiteral("missing value for command");
            return std::nullopt;
        }
        std::optional<Expr> expr = parsePipeline(error);
        if (expr.has_value() && !atEnd()) {
            *error = QStringLiteral("unexpected '%1'").arg(peek().text);
            return std::nullopt;
        }
        return expr;
    }

private:
    bool atEnd() const
    {
        return m_pos >= m_tokens.size();
    }

    const Token& peek() const
    {
        return m_tokens.at(m_pos);
    }

    bool atStageEnd() const
    {
        return atEnd() || peek().type == TokenType::RParen || peek().type == TokenType::Pipe;
    }

    std::optional<Expr> parsePipeline(QString *error)
    {
        std::optional<Expr> expr = parseCommand(error);
        if (!expr.has_value()) {
            return std::nullopt;
        }

        while (!atEnd() && peek().type == TokenType::Pipe) {
            ++m_pos;
            if (atEnd() || peek().type != TokenType::Ident || isKeywordLiteral(peek().text)) {
                *error = QStringLiteral("pipeline stage after '%1' must be a function call").arg(expr->source);
                return std::nullopt;
            }
            std::optional<Expr> next = parseCommand(error);
            if (!next.has_value()) {
                return std::nullopt;
            }
            next->source = QStringLiteral("%1 | %2").arg(expr->source, next->source);
            next->args.push_back(expr.value());
            expr = next;
        }
        return expr;
    }

    std::optional<Expr> parseCommand(QString *error)
    {
        if (atEnd()) {
            *error = QStringLiteral("missing value for command");
            return std::nullopt;
        }

        if (peek().type == TokenType::Ident && !isKeywordLiteral(peek().text)) {
            std::optional<Expr> call = makeCall(peek().text, error);
            ++m_pos;
            if (!call.has_value()) {
                return std::nullopt;
            }
            while (!atStageEnd()) {
                std::optional<Expr> arg = parseOperand(error);
                if (!arg.has_value()) {
                    return std::nullopt;
                }
                call->source += QLatin1Char(' ') + arg->source;
                call->args.push_back(arg.value());
            }
            return call;
        }

        std::optional<Expr> operand = parseOperand(error);
        if (operand.has_value() && !atStageEnd()) {
            *error = QStringLiteral("unexpected '%1' after '%2'").arg(peek().text, operand->source);
            return std::nullopt;
        }
        return operand;
    }

    std::optional<Expr> parseOperand(QString *error)
    {
        if (atEnd()) {
            *error = QStringLiteral("missing operand");
            return std::nullopt;
        }

        const Token token = peek();
        ++m_pos;

        switch (token.type) {
        case TokenType::String:
        case TokenType::Number: {
            Expr literal;
            literal.literal = token.value;
            literal.source = token.text;
            return literal;
        }
        case TokenType::Path:
            return makePath(token.text, error);
        case TokenType::Ident: {
            if (isKeywordLiteral(token.text)) {
                Expr literal;
                literal.source = token.text;
                if (token.text == QStringLiteral("nil")) {
                    literal.literal = QJsonValue(QJsonValue::Null);
                } else {
                    literal.literal = QJsonValue(token.text == QStringLiteral("true"));
                }
                return literal;
            }
            return makeCall(token.text, error);
        }
        case TokenType::LParen: {
            std::optional<Expr> inner = parsePipeline(error);
            if (!inner.has_value()) {
                return std::nullopt;
            }
            if (atEnd() || peek().type != TokenType::RParen) {
                *error = QStringLiteral("missing ')'");
                return std::nullopt;
            }
            ++m_pos;
            inner->source = QStringLiteral("(%1)").arg(inner->source);
            return inner;
        }
        case TokenType::RParen:
        case TokenType::Pipe:
            break;
        }

        *error = QStringLiteral("unexpected '%1'").arg(token.text);
        return std::nullopt;
    }

    static std::optional<Expr> makeCall(const QString& name, QString *error)
    {
        if (!knownFunctions().contains(name)) {
            *error = QStringLiteral("function \"%1\" not defined").arg(name);
            return std::nullopt;
        }
        Expr call;
        call.kind = Expr::Kind::Call;
        call.function = name;
        call.source = name;
        return call;
    }

    static std::optional<Expr> makePath(const QString& text, QString *error)
    {
        Expr path;
        path.kind = Expr::Kind::Path;
        path.source = text;

        QString rest = text;
        if (text.startsWith(QLatin1Char('$'))) {
            const qsizetype dot = text.indexOf(QLatin1Char('.'));
            path.base = dot < 0 ? text : text.left(dot);
            rest = dot < 0 ? QString() : text.mid(dot);
        } else {
            path.base = QStringLiteral(".");
        }

        if (rest.contains(QStringLiteral("..")) || (rest.size() > 1 && rest.endsWith(QLatin1Char('.')))) {
            *error = QStringLiteral("invalid path '%1'").arg(text);
            return std::nullopt;
        }
        path.segments = rest.split(QLatin1Char('.'), Qt::SkipEmptyParts);
        return path;
    }

    QList<Token> m_tokens;
    qsizetype m_pos = 0;
};

std::optional<Expr> parseExpression(const QString& text, int line, TemplateError *error)
{
    QString message;
    const std::optional<QList<Token>> tokens = tokenize(text, &message);
    if (!tokens.has_value()) {
        setError(error, TemplateErrorKind::Syntax, line, message);
        return std::nullopt;
    }

    ExpressionParser parser(tokens.value());
    std::optional<Expr> expr = parser.parse(&message);
    if (!expr.has_value()) {
        setError(error, TemplateErrorKind::Syntax, line, message);
    }
    return expr;
}

std::optional<QList<Item>> lexTemplate(const QString& content, TemplateError *error)
{
    static const QString kOpen = QStringLiteral("{{");
    static const QString kClose = QStringLiteral("}}");

    QList<Item> items;
    qsizetype pos = 0;
    int line = 1;
    bool trimNextText = false;

    while (pos < content.size()) {
        const qsizetype open = content.indexOf(kOpen, pos);
        QString text = open < 0 ? content.mid(pos) : content.mid(pos, open - pos);
        const int textLine = line;
        line += static_cast<int>(text.count(QLatin1Char('\n')));

        if (trimNextText) {
            text = trimLeading(text);
            trimNextText = false;
        }

        qsizetype actionStart = open + kOpen.size();
        const bool trimLeft = open >= 0 && actionStart + 1 < content.size()
            && content.at(actionStart) == QLatin1Char('-') && content.at(actionStart + 1).isSpace();
        if (trimLeft) {
            text = trimTrailing(text);
            ++actionStart;
        }
        if (!text.isEmpty()) {
            items.append({false, text, textLine});
        }
        if (open < 0) {
            break;
        }

        const int actionLine = line;
        qsizetype cursor = actionStart;
        while (cursor < content.size() && content.at(cursor).isSpace()) {
            ++cursor;
        }

        qsizetype close = -1;
        bool comment = false;
        if (content.mid(cursor, 2) == QStringLiteral("/*")) {
            const qsizetype commentEnd = content.indexOf(QStringLiteral("*/"), cursor + 2);
            if (commentEnd < 0) {
                setError(error, TemplateErrorKind::Syntax, actionLine, QStringLiteral("unclosed comment"));
                return std::nullopt;
            }
            qsizetype after = commentEnd + 2;
            while (after < content.size() && content.at(after).isSpace()) {
                ++after;
            }
            if (content.mid(after, 1) == QStringLiteral("-")) {
                ++after;
            }
            if (content.mid(after, 2) != kClose) {
                setError(error, TemplateErrorKind::Syntax, actionLine, QStringLiteral("comment ends before closing delimiter"));
                return std::nullopt;
            }
            close = after;
            comment = true;
        } else {
            QChar quote;
            bool inString = false;
            while (cursor + 1 < content.size()) {
                const QChar c = content.at(cursor);
                if (inString) {
                    if (c == QLatin1Char('\\') && quote == QLatin1Char('"')) {
                        cursor += 2;
                        continue;
                    }
                    if (c == quote) {
                        inString = false;
                    }
                    ++cursor;
                    continue;
                }
                if (c == QLatin1Char('"') || c == QLatin1Char('`')) {
                    inString = true;
                    quote = c;
                    ++cursor;
                    continue;
                }
                if (c == QLatin1Char('}') && content.at(cursor + 1) == QLatin1Char('}')) {
                    close = cursor;
                    break;
                }
                ++cursor;
            }
        }

        if (close < 0) {
            setError(error, TemplateErrorKind::Syntax, actionLine, QStringLiteral("unclosed action"));
            return std::nullopt;
        }

        QString inner = content.mid(actionStart, close - actionStart);
        line += static_cast<int>(content.mid(open, close + kClose.size() - open).count(QLatin1Char('\n')));

        const QString trimmedInner = trimTrailing(inner);
        if (trimmedInner.endsWith(QLatin1Char('-'))
            && (trimmedInner.size() == 1 || trimmedInner.at(trimmedInner.size() - 2).isSpace() || comment)) {
            trimNextText = true;
            inner = trimmedInner.left(trimmedInner.size() - 1);
        }

        if (!comment) {
            items.append({true, inner.trimmed(), actionLine});
        }
        pos = close + kClose.size();
    }

    return items;
}

class TreeBuilder
{
public:
    explicit TreeBuilder(const QList<Item>& items)
        : m_items(items)
    {
    }

    std::optional<std::vector<Node>> build(TemplateError *error)
    {
        QString terminator;
        int terminatorLine = 0;
        std::optional<std::vector<Node>> nodes = parseList(false, 0, &terminator, &terminatorLine, error);
        if (nodes.has_value() && !terminator.isEmpty()) {
            setError(error, TemplateErrorKind::Syntax, terminatorLine, QStringLiteral("unexpected {{%1}}").arg(terminator));
            return std::nullopt;
        }
        return nodes;
    }

private:
    static QString firstWord(const QString& text)
    {
        qsizetype i = 0;
        while (i < text.size() && isIdentChar(text.at(i))) {
            ++i;
        }
        return text.left(i);
    }

    std::optional<std::vector<Node>> parseList(bool nested,
                                               int openLine,
                                               QString *terminator,
                                               int *terminatorLine,
                                               TemplateError *error)
    {
        std::vector<Node> nodes;
        while (m_pos < m_items.size()) {
            const Item item = m_items.at(m_pos++);
            if (!item.action) {
                Node node;
                node.text = item.text;
                node.line = item.line;
                nodes.push_back(node);
                continue;
            }

            const QString keyword = firstWord(item.text);
            if (keyword == QStringLiteral("end") || keyword == QStringLiteral("else")) {
                *terminator = item.text;
                *terminatorLine = item.line;
                return nodes;
            }

            if (keyword == QStringLiteral("if") || keyword == QStringLiteral("range")) {
                std::optional<Node> block = parseBlock(keyword == QStringLiteral("if") ? Node::Kind::If : Node::Kind::Range,
                                                       item.text.mid(keyword.size()).trimmed(), item.line, error);
                if (!block.has_value()) {
                    return std::nullopt;
                }
                nodes.push_back(block.value());
                continue;
            }

            std::optional<Expr> expr = parseExpression(item.text, item.line, error);
            if (!expr.has_value()) {
                return std::nullopt;
            }
            Node node;
            node.kind = Node::Kind::Output;
            node.expr = expr.value();
            node.line = item.line;
            nodes.push_back(node);
        }

        if (nested) {
            setError(error, TemplateErrorKind::Syntax, openLine, QStringLiteral("unexpected EOF: missing {{end}}"));
            return std::nullopt;
        }
        terminator->clear();
        return nodes;
    }

    std::optional<Node> parseBlock(Node::Kind kind, const QString& exprText, int line, TemplateError *error)
    {
        if (exprText.isEmpty()) {
            setError(error, TemplateErrorKind::Syntax, line,
                     QStringLiteral("missing value for %1").arg(kind == Node::Kind::If ? QStringLiteral("if") : QStringLiteral("range")));
            return std::nullopt;
        }

        std::optional<Expr> expr = parseExpression(exprText, line, error);
        if (!expr.has_value()) {
            return std::nullopt;
        }

        Node node;
        node.kind = kind;
        node.expr = expr.value();
        node.line = line;

        QString terminator;
        int terminatorLine = line;
        std::optional<std::vector<Node>> body = parseList(true, line, &terminator, &terminatorLine, error);
        if (!body.has_value()) {
            return std::nullopt;
        }
        node.body = body.value();

        if (terminator == QStringLiteral("end")) {
            return node;
        }

        const QString rest = terminator.mid(4).trimmed();
        if (terminator.startsWith(QStringLiteral("else")) && rest.isEmpty()) {
            QString elseTerminator;
            std::optional<std::vector<Node>> elseBody = parseList(true, terminatorLine, &elseTerminator, &terminatorLine, error);
            if (!elseBody.has_value()) {
                return std::nullopt;
            }
            if (elseTerminator != QStringLiteral("end")) {
                setError(error, TemplateErrorKind::Syntax, terminatorLine,
                         QStringLiteral("expected {{end}}, found {{%1}}").arg(elseTerminator));
                return std::nullopt;
            }
            node.elseBody = elseBody.value();
            return node;
        }

        if (kind == Node::Kind::If && terminator.startsWith(QStringLiteral("else")) && firstWord(rest) == QStringLiteral("if")) {
            // "else if" chains share the final {{end}} with the outer block.
            std::optional<Node> chained = parseBlock(Node::Kind::If, rest.mid(2).trimmed(), terminatorLine, error);
            if (!chained.has_value()) {
                return std::nullopt;
            }
            node.elseBody.push_back(chained.value());
            return node;
        }

        setError(error, TemplateErrorKind::Syntax, terminatorLine, QStringLiteral("unexpected {{%1}}").arg(terminator));
        return std::nullopt;
    }

    QList<Item> m_items;
    qsizetype m_pos = 0;
};

std::optional<std::vector<Node>> parseTemplate(const QString& content, TemplateError *error)
{
    const std::optional<QList<Item>> items = lexTemplate(content, error);
    if (!items.has_value()) {
        return std::nullopt;
    }
    TreeBuilder builder(items.value());
    return builder.build(error);
}

bool takesUsers(const QString& protocol)
{
    return protocol != QStringLiteral("direct") && protocol != QStringLiteral("dokodemo-door");
}

QJsonArray privateCidrs()
{
    return QJsonArray {
        QStringLiteral("10.0.0.0/8"),
        QStringLiteral("100.64.0.0/10"),
        QStringLiteral("127.0.0.0/8"),
        QStringLiteral("169.254.0.0/16"),
        QStringLiteral("172.16.0.0/12"),
        QStringLiteral("192.168.0.0/16"),
        QStringLiteral("::1/128"),
        QStringLiteral("fc00::/7"),
        QStringLiteral("fe80::/10")
    };
}

class Renderer
{
public:
    Renderer(const TemplateContext& context, QStringList *warnings)
        : m_context(context)
        , m_root(context.toJson())
        , m_warnings(warnings)
    {
    }

    QJsonValue root() const
    {
        return m_root;
    }

    bool execute(const std::vector<Node>& nodes, const Scope& scope, QString& out, TemplateError *error)
    {
        for (const Node& node : nodes) {
            switch (node.kind) {
            case Node::Kind::Text:
                out += node.text;
                break;
            case Node::Kind::Output: {
                const std::optional<QJsonValue> value = evaluate(node.expr, scope, node.line, error);
                if (!value.has_value()) {
                    return false;
                }
                if (value->isUndefined()) {
                    setError(error, TemplateErrorKind::Execution, node.line,
                             QStringLiteral("unresolved placeholder '%1'").arg(node.expr.source));
                    return false;
                }
                out += formatValue(value.value());
                break;
            }
            case Node::Kind::If: {
                const std::optional<QJsonValue> value = evaluate(node.expr, scope, node.line, error);
                if (!value.has_value()) {
                    return false;
                }
                if (!execute(isTruthy(value.value()) ? node.body : node.elseBody, scope, out, error)) {
                    return false;
                }
                break;
            }
            case Node::Kind::Range:
                if (!executeRange(node, scope, out, error)) {
                    return false;
                }
                break;
            }
        }
        return true;
    }

private:
    bool executeRange(const Node& node, const Scope& scope, QString& out, TemplateError *error)
    {
        const std::optional<QJsonValue> value = evaluate(node.expr, scope, node.line, error);
        if (!value.has_value()) {
            return false;
        }
        if (value->isUndefined()) {
            setError(error, TemplateErrorKind::Execution, node.line,
                     QStringLiteral("unresolved placeholder '%1'").arg(node.expr.source));
            return false;
        }
        if (value->isNull()) {
            return execute(node.elseBody, scope, out, error);
        }

        QList<QPair<QString, QJsonValue>> entries;
        if (value->isArray()) {
            const QJsonArray array = value->toArray();
            for (qsizetype i = 0; i < array.size(); ++i) {
                entries.append({QString::number(i), array.at(i)});
            }
        } else if (value->isObject()) {
            const QJsonObject object = value->toObject();
            for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
                entries.append({it.key(), it.value()});
            }
        } else {
            setError(error, TemplateErrorKind::Execution, node.line,
                     QStringLiteral("range can't iterate over '%1'").arg(node.expr.source));
            return false;
        }

        if (entries.isEmpty()) {
            return execute(node.elseBody, scope, out, error);
        }

        for (qsizetype i = 0; i < entries.size(); ++i) {
            Scope inner = scope;
            inner.dot = entries.at(i).second;
            inner.variables.insert(QStringLiteral("$index"), static_cast<qint64>(i));
            inner.variables.insert(QStringLiteral("$key"), entries.at(i).first);
            inner.variables.insert(QStringLiteral("$first"), i == 0);
            inner.variables.insert(QStringLiteral("$last"), i + 1 == entries.size());
            if (!execute(node.body, inner, out, error)) {
                return false;
            }
        }
        return true;
    }

    std::optional<QJsonValue> evaluate(const Expr& expr, const Scope& scope, int line, TemplateError *error)
    {
        switch (expr.kind) {
        case Expr::Kind::Literal:
            return expr.literal;
        case Expr::Kind::Path:
            return resolvePath(expr, scope, line, error);
        case Expr::Kind::Call:
            break;
        }

        QList<QJsonValue> args;
        for (const Expr& argExpr : expr.args) {
            const std::optional<QJsonValue> arg = evaluate(argExpr, scope, line, error);
            if (!arg.has_value()) {
                return std::nullopt;
            }
            if (arg->isUndefined() && !acceptsUndefined(expr.function)) {
                setError(error, TemplateErrorKind::Execution, line,
                         QStringLiteral("unresolved placeholder '%1'").arg(argExpr.source));
                return std::nullopt;
            }
            args.append(arg.value());
        }
        return call(expr.function, args, line, error);
    }

    std::optional<QJsonValue> resolvePath(const Expr& expr, const Scope& scope, int line, TemplateError *error) const
    {
        QJsonValue current;
        if (expr.base == QStringLiteral(".")) {
            current = scope.dot;
        } else if (expr.base == QStringLiteral("$")) {
            current = m_root;
        } else if (scope.variables.contains(expr.base)) {
            current = scope.variables.value(expr.base);
        } else {
            setError(error, TemplateErrorKind::Execution, line, QStringLiteral("undefined variable '%1'").arg(expr.base));
            return std::nullopt;
        }

        for (const QString& segment : expr.segments) {
            if (current.isObject()) {
                current = current.toObject().value(segment);
            } else if (current.isArray()) {
                bool ok = false;
                const qsizetype index = segment.toLongLong(&ok);
                const QJsonArray array = current.toArray();
                current = ok && index >= 0 && index < array.size() ? array.at(index) : QJsonValue(QJsonValue::Undefined);
            } else {
                current = QJsonValue(QJsonValue::Undefined);
            }
            if (current.isUndefined()) {
                break;
            }
        }
        return current;
    }

    bool checkArgs(const QString& name, const QList<QJsonValue>& args, int min, int max, int line, TemplateError *error) const
    {
        if (args.size() >= min && (max < 0 || args.size() <= max)) {
            return true;
        }
        const QString expected = min == max ? QString::number(min)
            : (max < 0 ? QStringLiteral("at least %1").arg(min) : QStringLiteral("%1 to %2").arg(min).arg(max));
        setError(error, TemplateErrorKind::Execution, line,
                 QStringLiteral("wrong number of args for %1: want %2 got %3").arg(name, expected).arg(args.size()));
        return false;
    }

    std::optional<QJsonValue> call(const QString& name, const QList<QJsonValue>& args, int line, TemplateError *error)
    {
        auto fixed = [&](int count) {
            return checkArgs(name, args, count, count, line, error);
        };

        if (name == QStringLiteral("json")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            return QJsonValue(encodeJson(args.at(0)));
        }
        if (name == QStringLiteral("quote")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            return QJsonValue(encodeJson(QJsonValue(formatValue(args.at(0)))));
        }
        if (name == QStringLiteral("default")) {
            if (!fixed(2)) {
                return std::nullopt;
            }
            return isTruthy(args.at(1)) ? args.at(1) : args.at(0);
        }
        if (name == QStringLiteral("join")) {
            if (!fixed(2)) {
                return std::nullopt;
            }
            QStringList parts;
            for (const QJsonValue& entry : args.at(1).toArray()) {
                parts.append(formatValue(entry));
            }
            return QJsonValue(parts.join(formatValue(args.at(0))));
        }
        if (name == QStringLiteral("lower") || name == QStringLiteral("upper") || name == QStringLiteral("trim")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            const QString text = formatValue(args.at(0));
            if (name == QStringLiteral("lower")) {
                return QJsonValue(text.toLower());
            }
            return QJsonValue(name == QStringLiteral("upper") ? text.toUpper() : text.trimmed());
        }
        if (name == QStringLiteral("eq") || name == QStringLiteral("ne")) {
            if (!fixed(2)) {
                return std::nullopt;
            }
            const bool equal = valuesEqual(args.at(0), args.at(1));
            return QJsonValue(name == QStringLiteral("eq") ? equal : !equal);
        }
        if (name == QStringLiteral("not")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            return QJsonValue(!isTruthy(args.at(0)));
        }
        if (name == QStringLiteral("and") || name == QStringLiteral("or")) {
            if (!checkArgs(name, args, 1, -1, line, error)) {
                return std::nullopt;
            }
            const bool isAnd = name == QStringLiteral("and");
            for (const QJsonValue& arg : args) {
                if (isTruthy(arg) != isAnd) {
                    return QJsonValue(!isAnd);
                }
            }
            return QJsonValue(isAnd);
        }
        if (name == QStringLiteral("len")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            const QJsonValue& value = args.at(0);
            if (value.isArray()) {
                return QJsonValue(static_cast<qint64>(value.toArray().size()));
            }
            if (value.isObject()) {
                return QJsonValue(static_cast<qint64>(value.toObject().size()));
            }
            if (value.isString()) {
                return QJsonValue(static_cast<qint64>(value.toString().size()));
            }
            setError(error, TemplateErrorKind::Execution, line, QStringLiteral("len of unsupported value"));
            return std::nullopt;
        }
        if (name == QStringLiteral("contains")) {
            if (!fixed(2)) {
                return std::nullopt;
            }
            const QJsonValue& haystack = args.at(1);
            if (haystack.isArray()) {
                for (const QJsonValue& entry : haystack.toArray()) {
                    if (valuesEqual(entry, args.at(0))) {
                        return QJsonValue(true);
                    }
                }
                return QJsonValue(false);
            }
            return QJsonValue(formatValue(haystack).contains(formatValue(args.at(0))));
        }
        if (name == QStringLiteral("hasCap")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            const QString token = normalizeCapability(formatValue(args.at(0)));
            for (const QString& capability : m_context.agent.capabilities) {
                if (normalizeCapability(capability) == token) {
                    return QJsonValue(true);
                }
            }
            return QJsonValue(false);
        }
        if (name == QStringLiteral("hasTag")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            return QJsonValue(m_context.agent.buildTags.contains(formatValue(args.at(0)).trimmed(), Qt::CaseInsensitive));
        }
        if (name == QStringLiteral("inboundTags")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return inboundTags();
        }
        if (name == QStringLiteral("statsUsers")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return statsUsers();
        }
        if (name == QStringLiteral("usersForProtocol")) {
            if (!fixed(1)) {
                return std::nullopt;
            }
            return usersForProtocol(formatValue(args.at(0)).trimmed().toLower());
        }
        if (name == QStringLiteral("filterByType")) {
            if (!fixed(2)) {
                return std::nullopt;
            }
            const QString type = formatValue(args.at(0)).trimmed().toLower();
            QJsonArray filtered;
            for (const QJsonValue& entry : args.at(1).toArray()) {
                const QJsonObject object = entry.toObject();
                const QString entryType = object.value(QStringLiteral("type"))
                                              .toString(object.value(QStringLiteral("protocol")).toString());
                if (entryType.toLower() == type) {
                    filtered.append(entry);
                }
            }
            return QJsonValue(filtered);
        }
        if (name == QStringLiteral("singboxInbounds") || name == QStringLiteral("xrayInbounds")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            const QList<Inbound> inbounds = inboundsWithContextUsers();
            const CodecSerializeResult serialized = name == QStringLiteral("singboxInbounds")
                ? SingBoxCodec::serialize(inbounds)
                : XrayCodec::serialize(inbounds);
            if (m_warnings) {
                m_warnings->append(serialized.warnings);
            }
            QJsonArray result = serialized.config.value(QStringLiteral("inbounds")).toArray();
            return QJsonValue(result);
        }
        if (name == QStringLiteral("singboxOutbounds")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return singboxOutbounds();
        }
        if (name == QStringLiteral("xrayOutbounds")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return xrayOutbounds();
        }
        if (name == QStringLiteral("defaultDns")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            if (!m_context.dns.isEmpty()) {
                return QJsonValue(m_context.dns);
            }
            return QJsonValue(QJsonObject {
                {QStringLiteral("servers"), QJsonArray {
                    QJsonObject {
                        {QStringLiteral("tag"), QStringLiteral("default")},
                        {QStringLiteral("address"), m_context.server.dnsServer}
                    }
                }}
            });
        }
        if (name == QStringLiteral("defaultRoute")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return defaultRoute();
        }
        if (name == QStringLiteral("v2rayApi")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return QJsonValue(QJsonObject {
                {QStringLiteral("listen"), QStringLiteral("127.0.0.1:%1").arg(m_context.server.apiPort)},
                {QStringLiteral("stats"), QJsonObject {
                    {QStringLiteral("enabled"), true},
                    {QStringLiteral("inbounds"), inboundTags()},
                    {QStringLiteral("users"), statsUsers()}
                }}
            });
        }
        if (name == QStringLiteral("xrayApi")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return QJsonValue(QJsonObject {
                {QStringLiteral("tag"), QStringLiteral("api")},
                {QStringLiteral("services"), QJsonArray {QStringLiteral("HandlerService"), QStringLiteral("StatsService")}}
            });
        }
        if (name == QStringLiteral("xrayApiInbound")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return QJsonValue(QJsonObject {
                {QStringLiteral("tag"), QStringLiteral("api-in")},
                {QStringLiteral("listen"), QStringLiteral("127.0.0.1")},
                {QStringLiteral("port"), static_cast<int>(m_context.server.apiPort)},
                {QStringLiteral("protocol"), QStringLiteral("dokodemo-door")},
                {QStringLiteral("settings"), QJsonObject {
                    {QStringLiteral("address"), QStringLiteral("127.0.0.1")}
                }}
            });
        }
        if (name == QStringLiteral("xrayPolicy")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return QJsonValue(QJsonObject {
                {QStringLiteral("levels"), QJsonObject {
                    {QStringLiteral("0"), QJsonObject {
                        {QStringLiteral("statsUserUplink"), true},
                        {QStringLiteral("statsUserDownlink"), true}
                    }}
                }},
                {QStringLiteral("system"), QJsonObject {
                    {QStringLiteral("statsInboundDownlink"), true},
                    {QStringLiteral("statsInboundUplink"), true},
                    {QStringLiteral("statsOutboundDownlink"), true},
                    {QStringLiteral("statsOutboundUplink"), true}
                }}
            });
        }
        if (name == QStringLiteral("xrayRouting")) {
            if (!fixed(0)) {
                return std::nullopt;
            }
            return xrayRouting();
        }

        setError(error, TemplateErrorKind::Execution, line, QStringLiteral("function \"%1\" not defined").arg(name));
        return std::nullopt;
    }

    QList<Inbound> inboundsWithContextUsers() const
    {
        QList<Inbound> out;
        for (Inbound inbound : m_context.inbounds) {
            if (!m_context.users.isEmpty() && takesUsers(inbound.type)) {
                if (inbound.type == QStringLiteral("shadowsocks")
                    && !inbound.options.contains(QStringLiteral("method"))
                    && !inbound.users.isEmpty() && !inbound.users.constFirst().method.isEmpty()) {
                    inbound.options.insert(QStringLiteral("method"), inbound.users.constFirst().method);
                }
                inbound.users.clear();
                for (const UserConfig& user : m_context.users) {
                    InboundUser entry;
                    entry.uuid = user.uuid;
                    entry.name = user.email;
                    entry.password = user.password.isEmpty() ? user.uuid : user.password;
                    entry.flow = user.flow;
                    inbound.users.append(entry);
                }
            }
            out.append(inbound);
        }
        return out;
    }

    QJsonValue inboundTags() const
    {
        QJsonArray tags;
        for (const Inbound& inbound : m_context.inbounds) {
            if (!inbound.tag.isEmpty()) {
                tags.append(inbound.tag);
            }
        }
        return tags;
    }

    QJsonValue statsUsers() const
    {
        QStringList names;
        for (const UserConfig& user : m_context.users) {
            if (!user.email.isEmpty() && !names.contains(user.email)) {
                names.append(user.email);
            }
        }
        return toJsonArray(names);
    }

    QJsonValue usersForProtocol(const QString& protocol) const
    {
        QJsonArray users;
        for (const UserConfig& user : m_context.users) {
            const QString password = user.password.isEmpty() ? user.uuid : user.password;
            if (protocol == QStringLiteral("vless")) {
                QJsonObject entry {
                    {QStringLiteral("name"), user.email},
                    {QStringLiteral("uuid"), user.uuid}
                };
                if (!user.flow.isEmpty()) {
                    entry.insert(QStringLiteral("flow"), user.flow);
                }
                users.append(entry);
            } else if (protocol == QStringLiteral("vmess")) {
                users.append(QJsonObject {
                    {QStringLiteral("name"), user.email},
                    {QStringLiteral("uuid"), user.uuid},
                    {QStringLiteral("alterId"), 0}
                });
            } else if (protocol == QStringLiteral("tuic")) {
                users.append(QJsonObject {
                    {QStringLiteral("name"), user.email},
                    {QStringLiteral("uuid"), user.uuid},
                    {QStringLiteral("password"), password}
                });
            } else if (protocol == QStringLiteral("socks") || protocol == QStringLiteral("http")
                       || protocol == QStringLiteral("mixed")) {
                users.append(QJsonObject {
                    {QStringLiteral("username"), user.email},
                    {QStringLiteral("password"), password}
                });
            } else {
                users.append(QJsonObject {
                    {QStringLiteral("name"), user.email},
                    {QStringLiteral("password"), password}
                });
            }
        }
        return users;
    }

    QList<OutboundConfig> outboundsOrDefault() const
    {
        if (!m_context.outbounds.isEmpty()) {
            return m_context.outbounds;
        }
        return {
            OutboundConfig {QStringLiteral("direct"), QStringLiteral("direct"), {}},
            OutboundConfig {QStringLiteral("block"), QStringLiteral("block"), {}}
        };
    }

    QJsonValue singboxOutbounds() const
    {
        QJsonArray outbounds;
        for (const OutboundConfig& outbound : outboundsOrDefault()) {
            outbounds.append(outbound.toJson());
        }
        return outbounds;
    }

    QJsonValue xrayOutbounds() const
    {
        QJsonArray outbounds;
        for (const OutboundConfig& outbound : outboundsOrDefault()) {
            QString protocol = outbound.type;
            if (protocol == QStringLiteral("direct")) {
                protocol = QStringLiteral("freedom");
            } else if (protocol == QStringLiteral("block")) {
                protocol = QStringLiteral("blackhole");
            }
            outbounds.append(QJsonObject {
                {QStringLiteral("tag"), outbound.tag},
                {QStringLiteral("protocol"), protocol},
                {QStringLiteral("settings"), outbound.settings}
            });
        }
        return outbounds;
    }

    QJsonValue defaultRoute() const
    {
        if (!m_context.route.isEmpty()) {
            return m_context.route;
        }

        QString finalTag = QStringLiteral("direct");
        QString blockTag;
        for (const OutboundConfig& outbound : outboundsOrDefault()) {
            if (outbound.type == QStringLiteral("direct") && finalTag == QStringLiteral("direct")) {
                finalTag = outbound.tag;
            }
            if (outbound.type == QStringLiteral("block") && blockTag.isEmpty()) {
                blockTag = outbound.tag;
            }
        }

        QJsonArray rules;
        if (!blockTag.isEmpty()) {
            rules.append(QJsonObject {
                {QStringLiteral("ip_is_private"), true},
                {QStringLiteral("outbound"), blockTag}
            });
        }
        return QJsonObject {
            {QStringLiteral("rules"), rules},
            {QStringLiteral("final"), finalTag}
        };
    }

    QJsonValue xrayRouting() const
    {
        QJsonArray rules;
        if (m_context.server.statsEnabled) {
            rules.append(QJsonObject {
                {QStringLiteral("type"), QStringLiteral("field")},
                {QStringLiteral("inboundTag"), QJsonArray {QStringLiteral("api-in")}},
                {QStringLiteral("outboundTag"), QStringLiteral("api")}
            });
        }
        // Explicit CIDRs avoid a geoip.dat dependency on the agent.
        rules.append(QJsonObject {
            {QStringLiteral("type"), QStringLiteral("field")},
            {QStringLiteral("ip"), privateCidrs()},
            {QStringLiteral("outboundTag"), QStringLiteral("block")}
        });
        return QJsonObject {
            {QStringLiteral("domainStrategy"), QStringLiteral("AsIs")},
            {QStringLiteral("rules"), rules}
        };
    }

    const TemplateContext& m_context;
    QJsonObject m_root;
    QStringList *m_warnings = nullptr;
};

int lineAtOffset(const QByteArray& text, qsizetype offset)
{
    return static_cast<int>(text.left(offset).count('\n')) + 1;
}
}

QString TemplateError::toString() const
{
    QString category;
    switch (kind) {
    case TemplateErrorKind::Syntax:
        category = QStringLiteral("template syntax error");
        break;
    case TemplateErrorKind::Execution:
        category = QStringLiteral("template execution error");
        break;
    case TemplateErrorKind::InvalidJson:
        category = QStringLiteral("invalid JSON output");
        break;
    }
    if (line > 0) {
        return QStringLiteral("%1 at line %2: %3").arg(category).arg(line).arg(message);
    }
    return QStringLiteral("%1: %2").arg(category, message);
}

std::optional<QString> TemplateEngine::renderText(const QString& content,
                                                  const TemplateContext& context,
                                                  TemplateError *error,
                                                  QStringList *warnings)
{
    const std::optional<std::vector<Node>> nodes = parseTemplate(content, error);
    if (!nodes.has_value()) {
        return std::nullopt;
    }

    Renderer renderer(context, warnings);
    Scope scope;
    scope.dot = renderer.root();

    QString out;
    if (!renderer.execute(nodes.value(), scope, out, error)) {
        return std::nullopt;
    }
    return out;
}

std::optional<QByteArray> TemplateEngine::render(const QString& content,
                                                 const TemplateContext& context,
                                                 TemplateError *error,
                                                 QStringList *warnings)
{
    const std::optional<QString> text = renderText(content, context, error, warnings);
    if (!text.has_value()) {
        qCDebug(lcTemplate) << "Render failed for agent" << context.agent.id;
        return std::nullopt;
    }

    const QByteArray utf8 = text->toUtf8();
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(utf8, &parseError);
    if (parseError.error != QJsonParseError::NoError || doc.isNull()) {
        setError(error, TemplateErrorKind::InvalidJson,
                 lineAtOffset(utf8, parseError.offset),
                 QStringLiteral("rendered output is not valid JSON: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    return doc.toJson(QJsonDocument::Indented);
}

std::optional<QByteArray> TemplateEngine::previewRender(const QString& content,
                                                        TemplateError *error,
                                                        QStringList *warnings)
{
    return render(content, TemplateContext::sample(), error, warnings);
}

bool TemplateEngine::checkSyntax(const QString& content, TemplateError *error)
{
    return parseTemplate(content, error).has_value();
}

QStringList TemplateEngine::functionNames()
{
    QStringList names(knownFunctions().cbegin(), knownFunctions().cend());
    names.sort();
    return names;
}
