#include "backend/network/ConnectionManager.h"
#include "backend/network/MessageTransport.h"
#include <QDebug>
#include <algorithm>

namespace {
constexpr int BASE_RECONNECT_DELAY_MS = 1000;
constexpr int MAX_RECONNECT_DELAY_MS = 15000;
}

ConnectionManager::ConnectionManager(MessageTransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_retryTimer(new QTimer(this))
{
    Q_ASSERT(m_transport);

    m_retryTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, &ConnectionManager::retryNow);

    connect(m_transport, &MessageTransport::connected, this, &ConnectionManager::handleConnected);
    connect(m_transport, &MessageTransport::disconnected, this, &ConnectionManager::handleDisconnected);
    connect(m_transport, &MessageTransport::connectionError, this, &ConnectionManager::handleTransportError);
}

void ConnectionManager::start()
{
    m_stopped = false;
    if (isConnected() || !m_transport) return;

    qDebug() << "ConnectionManager: Opening broker connection";
    m_transport->connectToBroker();
}

void ConnectionManager::stop()
{
    m_stopped = true;
    m_attempt = 0;
    m_retryTimer->stop();
    if (m_transport) {
        m_transport->disconnectFromBroker();
    }
}

bool ConnectionManager::isConnected() const
{
    return m_transport && m_transport->isConnected();
}

void ConnectionManager::handleConnected()
{
    qDebug() << "ConnectionManager: Broker connection up after" << m_attempt << "retries";
    m_retryTimer->stop();
    m_attempt = 0;
    emit statusChanged("Connected");
}

void ConnectionManager::handleDisconnected()
{
    qDebug() << "ConnectionManager: Broker connection lost, stopped:" << m_stopped;
    emit statusChanged("Disconnected");
    if (m_stopped) return;
    armRetry();
}

void ConnectionManager::handleTransportError(const QString& error)
{
    // Proxy-level errors on a live socket are not connection failures
    if (isConnected()) {
        qWarning() << "ConnectionManager: Broker reported" << error;
        return;
    }

    qWarning() << "ConnectionManager: Connect failed:" << error;
    emit statusChanged("Error");
    if (m_stopped) return;
    armRetry();
}

void ConnectionManager::armRetry()
{
    // One pending retry at a time; a burst of errors counts as one attempt
    if (m_retryTimer->isActive()) return;

    const int delay = calculateReconnectDelay(++m_attempt);
    qDebug() << "ConnectionManager: Retry" << m_attempt << "scheduled in" << delay << "ms";
    emit statusChanged(QString("Reconnecting (%1)...").arg(m_attempt));
    m_retryTimer->start(delay);
}

int ConnectionManager::calculateReconnectDelay(int attempt)
{
    const int doublings = std::clamp(attempt - 1, 0, 4);
    return std::min(BASE_RECONNECT_DELAY_MS << doublings, MAX_RECONNECT_DELAY_MS);
}

void ConnectionManager::retryNow()
{
    if (m_stopped || !m_transport) {
        qDebug() << "ConnectionManager: Retry dropped, connection was stopped";
        return;
    }
    qDebug() << "ConnectionManager: Retrying broker connection";
    m_transport->connectToBroker();
}
