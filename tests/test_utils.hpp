#ifndef FLEETLINK_TEST_UTILS
#define FLEETLINK_TEST_UTILS

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEvent>
#include <QJsonObject>
#include <QList>
#include <functional>

#include "backend/network/MessageTransport.h"
#include "backend/protocol/WireMessages.h"
#include "backend/upload/ChunkEncoder.h"

// In-memory transport: records every accepted publish and lets tests push
// inbound messages through the normal dispatch path.
class FakeTransport : public MessageTransport {
public:
    struct Published {
        QString topic;
        QByteArray payload;

        QJsonObject json() const
        {
            QJsonObject obj;
            parsePayload(payload, &obj);
            return obj;
        }
        QString type() const { return json().value("type").toString(); }
    };

    explicit FakeTransport(bool startConnected = true) : m_connected(startConnected) {}

    void connectToBroker() override
    {
        ++connectCalls;
        if (m_connected || !autoConnect) return;
        m_connected = true;
        emit connected();
    }

    void disconnectFromBroker() override { dropConnection(); }

    bool isConnected() const override { return m_connected; }

    PublishResult publish(const QString& topic, const QByteArray& payload) override
    {
        const int attempt = publishAttempts++;
        if (!m_connected) return PublishResult::failure("Not connected to message broker");
        if (failPublishAt >= 0 && attempt == failPublishAt) return PublishResult::failure("injected failure");
        if (!failTopicPrefix.isEmpty() && topic.startsWith(failTopicPrefix)) return PublishResult::failure("injected failure");

        published.append({topic, payload});
        if (onPublish) onPublish(topic, payload);
        return PublishResult::success();
    }

    void deliver(const QString& topic, const QJsonObject& message) { dispatchMessage(topic, toPayload(message)); }
    void deliverRaw(const QString& topic, const QByteArray& payload) { dispatchMessage(topic, payload); }

    void setConnected(bool value)
    {
        if (value == m_connected) return;
        m_connected = value;
        if (value) emit connected();
        else emit disconnected();
    }

    void dropConnection() { setConnected(false); }
    void failConnection(const QString& error) { emit connectionError(error); }

    QList<Published> publishedOn(const QString& topic) const
    {
        QList<Published> result;
        for (const auto& p : published)
            if (p.topic == topic) result.append(p);
        return result;
    }

    QList<Published> published;
    QStringList sentSubscribes;
    QStringList sentUnsubscribes;
    std::function<void(const QString&, const QByteArray&)> onPublish;
    int publishAttempts = 0;
    int failPublishAt = -1;
    QString failTopicPrefix;
    int connectCalls = 0;
    bool autoConnect = true;

protected:
    void sendSubscribe(const QString& filter) override { sentSubscribes.append(filter); }
    void sendUnsubscribe(const QString& filter) override { sentUnsubscribes.append(filter); }

private:
    bool m_connected;
};

// Deterministic clock for deadline logic
struct ManualClock {
    qint64 now = 1000;

    std::function<qint64()> fn()
    {
        return [this]() { return now; };
    }
    void advance(qint64 ms) { now += ms; }
};

// Pump the event loop (zero-delay timers, deleteLater) until pred holds
inline bool waitUntil(const std::function<bool()>& pred, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!pred() && timer.elapsed() < timeoutMs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    }
    return pred();
}

inline void drainEvents()
{
    for (int i = 0; i < 5; ++i) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    }
}

// Bytes that never repeat within 251, so a misplaced slice changes the content
inline QByteArray patternBytes(int size)
{
    QByteArray data(size, '\0');
    for (int i = 0; i < size; ++i) data[i] = char(i % 251);
    return data;
}

// Chunk stream of one transfer as the controller would rebuild it
struct Reassembly {
    QByteArray data;
    qint64 payloadLengthSum = 0;
    QList<int> indices;
};

inline Reassembly reassemble(const QList<FakeTransport::Published>& messages, const QString& transferId)
{
    Reassembly r;
    for (const auto& m : messages) {
        const QJsonObject json = m.json();
        if (json.value("type").toString() != "chunk") continue;
        if (json.value("transferId").toString() != transferId) continue;
        r.data.append(ChunkEncoder::decode(json.value("payload").toString()));
        r.payloadLengthSum += json.value("payloadLength").toInt();
        r.indices.append(json.value("index").toInt());
    }
    return r;
}

inline QJsonObject uploadResult(const QString& deviceId, const QString& transferId, bool success,
                                const QString& error = QString(), const QString& filename = QString())
{
    QJsonObject obj;
    obj["type"] = "upload_result";
    obj["deviceId"] = deviceId;
    obj["transferId"] = transferId;
    obj["success"] = success;
    if (!error.isEmpty()) obj["error"] = error;
    if (!filename.isEmpty()) obj["filename"] = filename;
    return obj;
}

inline QJsonObject commandResult(const QString& deviceId, const QString& jobId, bool success,
                                 const QString& error = QString())
{
    QJsonObject obj;
    obj["type"] = "command_result";
    obj["deviceId"] = deviceId;
    obj["jobId"] = jobId;
    obj["success"] = success;
    if (!error.isEmpty()) obj["error"] = error;
    return obj;
}

#endif // FLEETLINK_TEST_UTILS
