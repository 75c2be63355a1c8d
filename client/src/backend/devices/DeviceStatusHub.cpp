#include "backend/devices/DeviceStatusHub.h"
#include "backend/devices/DeviceDirectory.h"
#include "backend/protocol/WireMessages.h"
#include <QDebug>
#include <utility>

DeviceStatusHub::DeviceStatusHub(MessageTransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    setClock(nullptr);
}

DeviceStatusHub::~DeviceStatusHub() {
    stop();
}

void DeviceStatusHub::setClock(Clock clock) {
    if (clock) {
        m_clock = std::move(clock);
    } else {
        m_clock = []() { return QDateTime::currentMSecsSinceEpoch(); };
    }
}

void DeviceStatusHub::watchDevice(const QString& deviceId) {
    if (deviceId.isEmpty() || m_subscriptions.contains(deviceId)) return;
    if (!m_transport) {
        qWarning() << "DeviceStatusHub: No transport, cannot watch" << deviceId;
        return;
    }

    const SubscriptionId id = m_transport->subscribe(Topics::status(deviceId),
        [this](const QString& topic, const QByteArray& payload) {
            onStatusMessage(lastTopicSegment(topic), payload);
        });
    if (id == 0) return;

    m_subscriptions.insert(deviceId, id);
    qDebug() << "DeviceStatusHub: Watching" << deviceId;
}

void DeviceStatusHub::unwatchDevice(const QString& deviceId) {
    auto it = m_subscriptions.find(deviceId);
    if (it == m_subscriptions.end()) return;
    if (m_transport) m_transport->unsubscribe(it.value());
    m_subscriptions.erase(it);
}

bool DeviceStatusHub::startForUser(const QString& userId, bool forceRefresh, QString* errorMessage) {
    if (!m_directory) {
        if (errorMessage) *errorMessage = "No device directory configured";
        return false;
    }

    if (forceRefresh) {
        m_directory->invalidate(userId);
    }

    QStringList deviceIds;
    QString error;
    if (!m_directory->deviceIdsForUser(userId, &deviceIds, &error)) {
        qWarning() << "DeviceStatusHub: Device lookup failed for" << userId << ":" << error;
        if (errorMessage) *errorMessage = error;
        return false;
    }

    int added = 0;
    for (const QString& deviceId : std::as_const(deviceIds)) {
        if (isWatching(deviceId)) continue;
        watchDevice(deviceId);
        added++;
    }
    qDebug() << "DeviceStatusHub: startForUser" << userId << "-" << deviceIds.size() << "devices," << added << "new";
    return true;
}

void DeviceStatusHub::stop() {
    if (m_transport) {
        for (SubscriptionId id : std::as_const(m_subscriptions)) {
            m_transport->unsubscribe(id);
        }
    }
    m_subscriptions.clear();
}

bool DeviceStatusHub::onStatusMessage(const QString& deviceId, const QByteArray& payload) {
    QJsonObject json;
    QString parseError;
    if (!parsePayload(payload, &json, &parseError)) {
        qDebug() << "DeviceStatusHub: Dropping unparsable status for" << deviceId << "-" << parseError;
        return false;
    }

    DeviceStatusSnapshot next;
    const QDateTime receivedAt = QDateTime::fromMSecsSinceEpoch(m_clock()).toUTC();
    if (!DeviceStatusSnapshot::fromStatusPayload(json, deviceId, receivedAt, &next)) {
        qDebug() << "DeviceStatusHub: Status message without device id dropped";
        return false;
    }

    auto it = m_snapshots.find(next.deviceId);
    if (it != m_snapshots.end() && it->sameObservableState(next)) {
        it->lastSeenAt = next.lastSeenAt;
        return false;
    }

    m_snapshots.insert(next.deviceId, next);
    qDebug() << "DeviceStatusHub:" << next.deviceId << "connected:" << next.connected
             << "printing:" << next.printing << "state:" << next.stateText();
    emit statusChanged(next);
    recomputeSummary();
    return true;
}

bool DeviceStatusHub::forgetDevice(const QString& deviceId) {
    unwatchDevice(deviceId);
    if (!m_snapshots.remove(deviceId)) return false;

    emit deviceForgotten(deviceId);
    recomputeSummary();
    return true;
}

void DeviceStatusHub::recomputeSummary() {
    const DashboardSummary next = DashboardSummary::compute(m_snapshots.values());
    if (next == m_summary) return;
    m_summary = next;
    emit summaryChanged(m_summary);
}
