#ifndef PROXYTRANSPORT_H
#define PROXYTRANSPORT_H

#include "backend/network/MessageTransport.h"
#include <QWebSocket>
#include <QJsonObject>
#include <QUrl>

/**
 * ProxyTransport
 *
 * MessageTransport over the server's WebSocket-to-MQTT bridge
 * (<serverUrl>/mqtt-proxy?token=...). One socket per process.
 *
 * Client frames: subscribe / unsubscribe / publish.
 * Server frames: message / subscribed / error.
 *
 * Subscriptions requested while offline are queued implicitly: every live
 * filter is re-sent when the socket (re)connects. Publishing while offline
 * fails immediately. Reconnect policy lives in ConnectionManager.
 */
class ProxyTransport : public MessageTransport {
    Q_OBJECT

public:
    explicit ProxyTransport(QObject* parent = nullptr);
    ~ProxyTransport() override;

    void setServerUrl(const QString& serverUrl) { m_serverUrl = serverUrl; }
    QString serverUrl() const { return m_serverUrl; }
    void setAuthToken(const QString& token) { m_authToken = token; }

    // Full proxy endpoint, with the token in the query string when one is set
    QUrl endpointUrl() const;

    void connectToBroker() override;
    void disconnectFromBroker() override;
    bool isConnected() const override;

    PublishResult publish(const QString& topic, const QByteArray& payload) override;

    // Builds the JSON text frame for a publish; JSON payloads are embedded as values
    static QJsonObject buildPublishFrame(const QString& topic, const QByteArray& payload);

protected:
    void sendSubscribe(const QString& filter) override;
    void sendUnsubscribe(const QString& filter) override;

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessageReceived(const QString& message);
    void onError(QAbstractSocket::SocketError error);

private:
    void handleFrame(const QJsonObject& frame);
    bool sendFrame(const QJsonObject& frame);

    QWebSocket* m_webSocket;
    QString m_serverUrl;
    QString m_authToken;
    bool m_userInitiatedDisconnect = false;
};

#endif // PROXYTRANSPORT_H
