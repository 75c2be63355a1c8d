#ifndef MESSAGETRANSPORT_H
#define MESSAGETRANSPORT_H

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QList>
#include <functional>

// Outcome of a single publish call. ok == true means the broker side accepted
// the message, not that any device received it.
struct PublishResult {
    bool ok = false;
    QString error;

    static PublishResult success() {
        PublishResult result;
        result.ok = true;
        return result;
    }

    static PublishResult failure(const QString& error) {
        PublishResult result;
        result.error = error;
        return result;
    }
};

using SubscriptionId = quint64;
using MessageHandler = std::function<void(const QString& topic, const QByteArray& payload)>;

// MQTT style filter matching: '+' matches one level, '#' matches the rest.
bool topicMatches(const QString& filter, const QString& topic);
QString lastTopicSegment(const QString& topic);

/**
 * MessageTransport
 *
 * Publish/subscribe contract used by every component that talks to devices.
 * Delivery is at-least-once with no ordering across topics.
 *
 * The base class owns the handler table and dispatch; implementations only
 * provide the connection, the publish path and the wire-level
 * subscribe/unsubscribe requests. A filter is sent to the broker when its
 * first handler is added and withdrawn when its last handler goes away.
 */
class MessageTransport : public QObject {
    Q_OBJECT

public:
    explicit MessageTransport(QObject* parent = nullptr);
    ~MessageTransport() override;

    // Connection management (idempotent)
    virtual void connectToBroker() = 0;
    virtual void disconnectFromBroker() = 0;
    virtual bool isConnected() const = 0;

    virtual PublishResult publish(const QString& topic, const QByteArray& payload) = 0;

    SubscriptionId subscribe(const QString& filter, MessageHandler handler);
    void unsubscribe(const QString& filter);
    void unsubscribe(SubscriptionId id);
    bool isSubscribed(const QString& filter) const;
    QStringList subscribedFilters() const;
    int handlerCount() const { return m_subscriptions.size(); }

signals:
    void connected();
    void disconnected();
    void connectionError(const QString& error);

protected:
    // Route an inbound message to every handler whose filter matches the topic
    void dispatchMessage(const QString& topic, const QByteArray& payload);

    virtual void sendSubscribe(const QString& filter) = 0;
    virtual void sendUnsubscribe(const QString& filter) = 0;

private:
    struct Subscription {
        SubscriptionId id = 0;
        QString filter;
        MessageHandler handler;
    };

    int indexOf(SubscriptionId id) const;

    QList<Subscription> m_subscriptions;
    SubscriptionId m_nextSubscriptionId = 1;
};

#endif // MESSAGETRANSPORT_H
