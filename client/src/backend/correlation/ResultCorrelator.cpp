#include "backend/correlation/ResultCorrelator.h"
#include <QJsonObject>
#include <QDebug>
#include <algorithm>
#include <utility>

ResultCorrelator::ResultCorrelator(MessageTransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_scanTimer(new QTimer(this))
{
    m_monotonic.start();
    m_clock = [this]() { return m_monotonic.elapsed(); };

    m_scanTimer->setInterval(DEFAULT_SCAN_INTERVAL_MS);
    connect(m_scanTimer, &QTimer::timeout, this, [this]() { expireDue(); });
}

ResultCorrelator::~ResultCorrelator() {
    if (!m_pending.isEmpty()) {
        qDebug() << "ResultCorrelator: Destroyed with" << m_pending.size() << "pending waits";
    }
    if (m_transport) {
        for (SubscriptionId id : std::as_const(m_watched)) {
            m_transport->unsubscribe(id);
        }
    }
}

RegisterResult ResultCorrelator::registerWait(const CorrelationKey& key,
                                              int timeoutMs,
                                              ResolveCallback resolve,
                                              RejectCallback reject,
                                              ProgressCallback progress) {
    RegisterResult result;
    if (!key.isValid()) {
        result.error = "Invalid correlation key";
        return result;
    }
    if (!resolve || !reject) {
        result.error = "Missing resolve or reject continuation";
        return result;
    }
    if (m_pending.contains(key)) {
        qWarning() << "ResultCorrelator: Duplicate wait for" << key.toString();
        result.error = QString("A wait is already pending for %1").arg(key.toString());
        return result;
    }

    PendingWait wait;
    wait.handle = m_nextHandle++;
    wait.key = key;
    wait.deadline = m_clock() + std::max(timeoutMs, 0);
    wait.resolve = std::move(resolve);
    wait.reject = std::move(reject);
    wait.progress = std::move(progress);

    m_pending.insert(key, wait);
    m_handles.insert(wait.handle, key);
    updateScanTimer();

    qDebug() << "ResultCorrelator: Waiting on" << key.toString() << "for" << timeoutMs << "ms";

    result.handle = wait.handle;
    result.ok = true;
    return result;
}

bool ResultCorrelator::abandon(WaitHandle handle) {
    auto it = m_handles.find(handle);
    if (it == m_handles.end()) return false;

    const CorrelationKey key = it.value();
    m_handles.erase(it);
    m_pending.remove(key);
    updateScanTimer();
    qDebug() << "ResultCorrelator: Abandoned wait for" << key.toString();
    return true;
}

void ResultCorrelator::watchDevice(const QString& deviceId) {
    if (deviceId.isEmpty() || m_watched.contains(deviceId)) return;
    if (!m_transport) {
        qWarning() << "ResultCorrelator: No transport, cannot watch" << deviceId;
        return;
    }

    const SubscriptionId id = m_transport->subscribe(Topics::controlResult(deviceId),
        [this](const QString& topic, const QByteArray& payload) { onMessage(topic, payload); });
    if (id != 0) {
        m_watched.insert(deviceId, id);
    }
}

void ResultCorrelator::unwatchDevice(const QString& deviceId) {
    auto it = m_watched.find(deviceId);
    if (it == m_watched.end()) return;
    if (m_transport) m_transport->unsubscribe(it.value());
    m_watched.erase(it);
}

void ResultCorrelator::onMessage(const QString& topic, const QByteArray& payload) {
    QJsonObject json;
    QString parseError;
    if (!parsePayload(payload, &json, &parseError)) {
        qDebug() << "ResultCorrelator: Dropping unparsable message on" << topic << "-" << parseError;
        return;
    }

    ControllerResult result = ControllerResult::fromJson(json);
    if (result.kind == ControllerResult::Kind::Unknown) {
        qDebug() << "ResultCorrelator: Ignoring message type" << json.value("type").toString() << "on" << topic;
        return;
    }
    if (result.deviceId.isEmpty()) {
        result.deviceId = lastTopicSegment(topic);
    }

    const CorrelationKey key{result.deviceId, result.correlationId()};
    auto it = m_pending.find(key);
    if (it == m_pending.end()) {
        qDebug() << "ResultCorrelator: No pending wait for" << key.toString() << "- dropped";
        return;
    }

    // The scanner may simply not have run yet; a late result must not win
    if (m_clock() >= it->deadline) {
        expireDue();
        return;
    }

    if (!result.isFinal()) {
        ProgressCallback progress = it->progress;
        if (progress) progress(result);
        return;
    }

    PendingWait wait;
    if (!takeWait(key, &wait)) return;
    qDebug() << "ResultCorrelator: Resolved" << key.toString() << "success:" << result.success;
    wait.resolve(result);
}

int ResultCorrelator::expireDue() {
    const qint64 current = m_clock();

    QList<CorrelationKey> expired;
    for (auto it = m_pending.cbegin(); it != m_pending.cend(); ++it) {
        if (current >= it->deadline) expired.append(it.key());
    }

    int count = 0;
    for (const CorrelationKey& key : expired) {
        PendingWait wait;
        if (!takeWait(key, &wait)) continue; // removed by an earlier continuation
        ++count;
        qWarning() << "ResultCorrelator: Timed out waiting for" << key.toString();
        wait.reject(WaitError::TimedOut, "No confirmation received");
        emit waitExpired(key.deviceId, key.correlationId);
    }
    return count;
}

void ResultCorrelator::rejectAll(WaitError error, const QString& message) {
    const QList<CorrelationKey> keys = m_pending.keys();
    for (const CorrelationKey& key : keys) {
        PendingWait wait;
        if (!takeWait(key, &wait)) continue;
        wait.reject(error, message);
    }
}

void ResultCorrelator::setClock(Clock clock) {
    if (clock) {
        m_clock = std::move(clock);
    } else {
        m_clock = [this]() { return m_monotonic.elapsed(); };
    }
}

void ResultCorrelator::setScanInterval(int intervalMs) {
    m_scanTimer->setInterval(std::max(intervalMs, 1));
}

bool ResultCorrelator::takeWait(const CorrelationKey& key, PendingWait* wait) {
    auto it = m_pending.find(key);
    if (it == m_pending.end()) return false;
    *wait = it.value();
    m_handles.remove(it->handle);
    m_pending.erase(it);
    updateScanTimer();
    return true;
}

void ResultCorrelator::updateScanTimer() {
    if (m_pending.isEmpty()) {
        m_scanTimer->stop();
    } else if (!m_scanTimer->isActive()) {
        m_scanTimer->start();
    }
}
