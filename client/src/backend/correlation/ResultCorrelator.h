#ifndef RESULTCORRELATOR_H
#define RESULTCORRELATOR_H

#include <QObject>
#include <QHash>
#include <QString>
#include <QTimer>
#include <QElapsedTimer>
#include <QPointer>
#include <functional>
#include "backend/network/MessageTransport.h"
#include "backend/protocol/WireMessages.h"

// (deviceId, transferId) for uploads, (deviceId, jobId) for commands
struct CorrelationKey {
    QString deviceId;
    QString correlationId;

    bool isValid() const { return !deviceId.isEmpty() && !correlationId.isEmpty(); }
    QString toString() const { return deviceId + QLatin1Char('/') + correlationId; }

    bool operator==(const CorrelationKey& other) const {
        return deviceId == other.deviceId && correlationId == other.correlationId;
    }
    bool operator!=(const CorrelationKey& other) const { return !(*this == other); }
};

inline size_t qHash(const CorrelationKey& key, size_t seed = 0) {
    return qHashMulti(seed, key.deviceId, key.correlationId);
}

enum class WaitError { TimedOut, Shutdown };

using WaitHandle = quint64;

struct RegisterResult {
    WaitHandle handle = 0;
    bool ok = false;
    QString error;
};

/**
 * ResultCorrelator
 *
 * Turns result messages on control_result/<deviceId> into completion
 * callbacks for whoever registered a wait on the matching key.
 *
 * - At most one wait per key; a second registration fails and leaves the
 *   first untouched.
 * - An entry is removed before its continuation runs, so a wait resolves,
 *   rejects or expires exactly once and late duplicates are dropped.
 * - Messages without a matching wait are normal traffic and only logged at
 *   debug level.
 * - Expiry is enforced by one QTimer that runs only while waits exist.
 */
class ResultCorrelator : public QObject {
    Q_OBJECT

public:
    using ResolveCallback = std::function<void(const ControllerResult& result)>;
    using RejectCallback = std::function<void(WaitError error, const QString& message)>;
    using ProgressCallback = std::function<void(const ControllerResult& progress)>;
    using Clock = std::function<qint64()>;

    static constexpr int DEFAULT_SCAN_INTERVAL_MS = 250;

    explicit ResultCorrelator(MessageTransport* transport, QObject* parent = nullptr);
    ~ResultCorrelator() override;

    // timeoutMs is relative to the correlator clock at registration time
    RegisterResult registerWait(const CorrelationKey& key,
                                int timeoutMs,
                                ResolveCallback resolve,
                                RejectCallback reject,
                                ProgressCallback progress = ProgressCallback());

    // Drop a wait without running either continuation
    bool abandon(WaitHandle handle);

    // Subscribes control_result/<deviceId> once per device
    void watchDevice(const QString& deviceId);
    void unwatchDevice(const QString& deviceId);
    bool isWatching(const QString& deviceId) const { return m_watched.contains(deviceId); }

    void onMessage(const QString& topic, const QByteArray& payload);

    // Rejects every wait whose deadline has passed; returns how many expired
    int expireDue();

    // Rejects everything still pending (used on shutdown)
    void rejectAll(WaitError error, const QString& message);

    int pendingCount() const { return m_pending.size(); }
    bool hasPending(const CorrelationKey& key) const { return m_pending.contains(key); }

    void setClock(Clock clock);
    qint64 now() const { return m_clock(); }
    void setScanInterval(int intervalMs);
    bool isScanning() const { return m_scanTimer->isActive(); }

signals:
    void waitExpired(const QString& deviceId, const QString& correlationId);

private:
    struct PendingWait {
        WaitHandle handle = 0;
        CorrelationKey key;
        qint64 deadline = 0;
        ResolveCallback resolve;
        RejectCallback reject;
        ProgressCallback progress;
    };

    bool takeWait(const CorrelationKey& key, PendingWait* wait);
    void updateScanTimer();

    QPointer<MessageTransport> m_transport;
    QHash<CorrelationKey, PendingWait> m_pending;
    QHash<WaitHandle, CorrelationKey> m_handles;
    QHash<QString, SubscriptionId> m_watched;
    QTimer* m_scanTimer;
    QElapsedTimer m_monotonic;
    Clock m_clock;
    WaitHandle m_nextHandle = 1;
};

#endif // RESULTCORRELATOR_H
