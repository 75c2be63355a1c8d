#ifndef DEVICESTATUSHUB_H
#define DEVICESTATUSHUB_H

#include <QObject>
#include <QHash>
#include <QPointer>
#include <QStringList>
#include <functional>
#include "backend/devices/DeviceStatusSnapshot.h"
#include "backend/network/MessageTransport.h"

class DeviceDirectory;

/**
 * @brief Single owner of the deviceId -> DeviceStatusSnapshot map
 *
 * Subscribes octoprint/status/<deviceId> per watched device and keeps the
 * latest snapshot for each. Only this class writes snapshots; everybody
 * else reads copies or listens to the change signals.
 *
 * A heartbeat that changes nothing observable is swallowed, so consumers
 * only hear about real transitions, but it still refreshes lastSeenAt.
 * There is no staleness expiry: a device that goes silent keeps its last
 * snapshot until forgetDevice().
 */
class DeviceStatusHub : public QObject {
    Q_OBJECT

public:
    // Milliseconds since the epoch, UTC
    using Clock = std::function<qint64()>;

    explicit DeviceStatusHub(MessageTransport* transport, QObject* parent = nullptr);
    ~DeviceStatusHub() override;

    void setClock(Clock clock);

    /**
     * @brief Directory used by startForUser (not owned)
     */
    void setDirectory(DeviceDirectory* directory) { m_directory = directory; }

    void watchDevice(const QString& deviceId);
    void unwatchDevice(const QString& deviceId);
    bool isWatching(const QString& deviceId) const { return m_subscriptions.contains(deviceId); }
    QStringList watchedDevices() const { return m_subscriptions.keys(); }

    /**
     * @brief Watch every device the directory lists for the user
     * @param forceRefresh Bypass any cached directory answer
     * @return true if the directory lookup succeeded
     */
    bool startForUser(const QString& userId, bool forceRefresh = false, QString* errorMessage = nullptr);

    /**
     * @brief Unsubscribe every status topic; snapshots are kept
     */
    void stop();

    /**
     * @brief Apply one heartbeat
     * @return true if the stored snapshot changed
     */
    bool onStatusMessage(const QString& deviceId, const QByteArray& payload);

    bool hasSnapshot(const QString& deviceId) const { return m_snapshots.contains(deviceId); }
    DeviceStatusSnapshot snapshot(const QString& deviceId) const { return m_snapshots.value(deviceId); }
    QList<DeviceStatusSnapshot> snapshots() const { return m_snapshots.values(); }

    DashboardSummary summary() const { return m_summary; }
    int connectedCount() const { return m_summary.connected; }
    int printingCount() const { return m_summary.printing; }

    // Device removed by the user; drops its snapshot and subscription
    bool forgetDevice(const QString& deviceId);

signals:
    void statusChanged(const DeviceStatusSnapshot& snapshot);
    void summaryChanged(const DashboardSummary& summary);
    void deviceForgotten(const QString& deviceId);

private:
    void recomputeSummary();

    QPointer<MessageTransport> m_transport;
    DeviceDirectory* m_directory = nullptr;
    QHash<QString, SubscriptionId> m_subscriptions;
    QHash<QString, DeviceStatusSnapshot> m_snapshots;
    DashboardSummary m_summary;
    Clock m_clock;
};

#endif // DEVICESTATUSHUB_H
