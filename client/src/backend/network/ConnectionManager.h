#ifndef CONNECTIONMANAGER_H
#define CONNECTIONMANAGER_H

#include <QObject>
#include <QTimer>
#include <QString>
#include <QPointer>
#include "backend/network/MessageTransport.h"

/**
 * @brief Keeps the broker connection alive
 *
 * ConnectionManager owns the reconnect policy for a MessageTransport:
 * - Lazy initial connection (start() is idempotent)
 * - Exponential backoff reconnection after drops and socket errors
 * - No reconnection after an explicit stop()
 */
class ConnectionManager : public QObject {
    Q_OBJECT

public:
    // transport is not owned and must outlive any pending retry
    explicit ConnectionManager(MessageTransport* transport, QObject* parent = nullptr);
    ~ConnectionManager() override = default;

    /**
     * @brief Connect if not already connected or connecting
     */
    void start();

    /**
     * @brief Disconnect and suppress automatic reconnection
     */
    void stop();

    bool isConnected() const;
    bool isReconnectScheduled() const { return m_retryTimer->isActive(); }
    int reconnectAttempts() const { return m_attempt; }

    /**
     * @brief Backoff for the given 1-based attempt: 1s, 2s, 4s, 8s, then 15s
     */
    static int calculateReconnectDelay(int attempt);

signals:
    // "Connected", "Disconnected", "Error" or "Reconnecting (n)..."
    void statusChanged(const QString& status);

private slots:
    void handleConnected();
    void handleDisconnected();
    void handleTransportError(const QString& error);
    void retryNow();

private:
    void armRetry();

    QPointer<MessageTransport> m_transport;
    QTimer* m_retryTimer;
    int m_attempt = 0;
    bool m_stopped = false;
};

#endif // CONNECTIONMANAGER_H
