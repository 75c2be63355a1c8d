#include "backend/network/ProxyTransport.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDateTime>
#include <QUrlQuery>
#include <QDebug>

ProxyTransport::ProxyTransport(QObject* parent)
    : MessageTransport(parent)
    , m_webSocket(nullptr)
{
}

ProxyTransport::~ProxyTransport() {
    if (m_webSocket) {
        m_webSocket->disconnect();  // Disconnect all signals first
        m_webSocket->close();
        m_webSocket->deleteLater();
        m_webSocket = nullptr;
    }
}

QUrl ProxyTransport::endpointUrl() const {
    QString base = m_serverUrl;
    while (base.endsWith('/')) base.chop(1);

    QUrl url(base + QStringLiteral("/mqtt-proxy"));
    if (!m_authToken.isEmpty()) {
        QUrlQuery query;
        query.addQueryItem(QStringLiteral("token"), m_authToken);
        url.setQuery(query);
    }
    return url;
}

void ProxyTransport::connectToBroker() {
    if (m_serverUrl.isEmpty()) {
        qWarning() << "ProxyTransport: Cannot connect with empty server URL";
        emit connectionError("No server URL configured");
        return;
    }

    if (m_webSocket) {
        const auto state = m_webSocket->state();
        if (state == QAbstractSocket::ConnectedState || state == QAbstractSocket::ConnectingState) {
            return; // already connected or on the way
        }
        m_webSocket->disconnect();
        m_webSocket->deleteLater();
        m_webSocket = nullptr;
    }

    m_userInitiatedDisconnect = false;
    m_webSocket = new QWebSocket();
    m_webSocket->setParent(this);

    connect(m_webSocket, &QWebSocket::connected, this, &ProxyTransport::onConnected);
    connect(m_webSocket, &QWebSocket::disconnected, this, &ProxyTransport::onDisconnected);
    connect(m_webSocket, &QWebSocket::textMessageReceived, this, &ProxyTransport::onTextMessageReceived);
    connect(m_webSocket, &QWebSocket::errorOccurred, this, &ProxyTransport::onError);

    qDebug() << "ProxyTransport: Connecting to" << m_serverUrl;
    m_webSocket->open(endpointUrl());
}

void ProxyTransport::disconnectFromBroker() {
    // Mark as user-initiated so the socket error that follows is not reported
    m_userInitiatedDisconnect = true;
    if (m_webSocket) {
        const auto state = m_webSocket->state();
        if (state == QAbstractSocket::ConnectedState || state == QAbstractSocket::ConnectingState) {
            m_webSocket->close();
        }
    }
}

bool ProxyTransport::isConnected() const {
    return m_webSocket && m_webSocket->state() == QAbstractSocket::ConnectedState;
}

QJsonObject ProxyTransport::buildPublishFrame(const QString& topic, const QByteArray& payload) {
    QJsonObject frame;
    frame["type"] = "publish";
    frame["topic"] = topic;

    // The proxy stringifies whatever it receives, so a JSON payload has to go
    // across as a value or the controller sees a doubly encoded string.
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        frame["payload"] = doc.object();
    } else if (parseError.error == QJsonParseError::NoError && doc.isArray()) {
        frame["payload"] = doc.array();
    } else {
        frame["payload"] = QString::fromUtf8(payload);
    }
    frame["timestamp"] = QDateTime::currentMSecsSinceEpoch();
    return frame;
}

PublishResult ProxyTransport::publish(const QString& topic, const QByteArray& payload) {
    if (!isConnected()) {
        qWarning() << "ProxyTransport: Cannot publish to" << topic << "- not connected";
        return PublishResult::failure("Not connected to message broker");
    }
    if (topic.isEmpty()) {
        return PublishResult::failure("Empty topic");
    }

    if (!sendFrame(buildPublishFrame(topic, payload))) {
        return PublishResult::failure("WebSocket send failed");
    }
    return PublishResult::success();
}

void ProxyTransport::sendSubscribe(const QString& filter) {
    if (!isConnected()) {
        qDebug() << "ProxyTransport: Subscription to" << filter << "deferred until connected";
        return;
    }
    QJsonObject frame;
    frame["type"] = "subscribe";
    frame["topic"] = filter;
    sendFrame(frame);
}

void ProxyTransport::sendUnsubscribe(const QString& filter) {
    if (!isConnected()) return;
    QJsonObject frame;
    frame["type"] = "unsubscribe";
    frame["topic"] = filter;
    sendFrame(frame);
}

bool ProxyTransport::sendFrame(const QJsonObject& frame) {
    if (!isConnected()) {
        qWarning() << "ProxyTransport: Cannot send frame: not connected";
        return false;
    }
    const QString text = QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact));
    const qint64 sent = m_webSocket->sendTextMessage(text);
    return sent > 0;
}

void ProxyTransport::onConnected() {
    qDebug() << "ProxyTransport: Connected to broker proxy";

    // Everything subscribed before (or across) the connection gets re-sent
    const QStringList filters = subscribedFilters();
    for (const QString& filter : filters) {
        sendSubscribe(filter);
    }
    emit connected();
}

void ProxyTransport::onDisconnected() {
    qDebug() << "ProxyTransport: Disconnected from broker proxy";
    emit disconnected();
}

void ProxyTransport::onTextMessageReceived(const QString& message) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "ProxyTransport: Failed to parse frame:" << error.errorString();
        return;
    }
    handleFrame(doc.object());
}

void ProxyTransport::handleFrame(const QJsonObject& frame) {
    const QString type = frame.value("type").toString();

    if (type == "message") {
        const QString topic = frame.value("topic").toString();
        const QJsonValue payloadValue = frame.value("payload");
        QByteArray payload;
        if (payloadValue.isObject()) {
            payload = QJsonDocument(payloadValue.toObject()).toJson(QJsonDocument::Compact);
        } else if (payloadValue.isArray()) {
            payload = QJsonDocument(payloadValue.toArray()).toJson(QJsonDocument::Compact);
        } else {
            payload = payloadValue.toString().toUtf8();
        }
        if (topic.isEmpty()) {
            qDebug() << "ProxyTransport: Dropping message frame without topic";
            return;
        }
        dispatchMessage(topic, payload);
    }
    else if (type == "subscribed") {
        qDebug() << "ProxyTransport: Subscription confirmed for" << frame.value("topic").toString();
    }
    else if (type == "error") {
        const QString err = frame.value("message").toString();
        qWarning() << "ProxyTransport: Proxy error:" << err;
        emit connectionError(err);
    }
    else {
        qDebug() << "ProxyTransport: Ignoring frame type:" << type;
    }
}

void ProxyTransport::onError(QAbstractSocket::SocketError error) {
    QString errorString;
    switch (error) {
        case QAbstractSocket::ConnectionRefusedError: errorString = "Connection refused"; break;
        case QAbstractSocket::RemoteHostClosedError: errorString = "Remote host closed connection"; break;
        case QAbstractSocket::HostNotFoundError: errorString = "Host not found"; break;
        case QAbstractSocket::SocketTimeoutError: errorString = "Connection timeout"; break;
        case QAbstractSocket::NetworkError: errorString = "Network error"; break;
        case QAbstractSocket::SslHandshakeFailedError: errorString = "SSL handshake failed"; break;
        default: errorString = QString("Socket error: %1").arg(error);
    }

    if (m_userInitiatedDisconnect) {
        qDebug() << "ProxyTransport: Ignoring socket error during disconnect:" << errorString;
        return;
    }

    qWarning() << "ProxyTransport: WebSocket error:" << errorString;
    emit connectionError(errorString);
}
