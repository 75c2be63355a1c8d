#include "backend/network/MessageTransport.h"
#include <QDebug>

bool topicMatches(const QString& filter, const QString& topic) {
    if (filter == topic) return true;

    const QStringList filterLevels = filter.split('/');
    const QStringList topicLevels = topic.split('/');

    for (int i = 0; i < filterLevels.size(); ++i) {
        const QString& level = filterLevels.at(i);
        if (level == QLatin1String("#")) {
            return true;
        }
        if (i >= topicLevels.size()) {
            return false;
        }
        if (level == QLatin1String("+")) {
            continue;
        }
        if (level != topicLevels.at(i)) {
            return false;
        }
    }
    return filterLevels.size() == topicLevels.size();
}

QString lastTopicSegment(const QString& topic) {
    const int slash = topic.lastIndexOf('/');
    return slash < 0 ? topic : topic.mid(slash + 1);
}

MessageTransport::MessageTransport(QObject* parent)
    : QObject(parent)
{
}

MessageTransport::~MessageTransport() = default;

SubscriptionId MessageTransport::subscribe(const QString& filter, MessageHandler handler) {
    if (filter.isEmpty() || !handler) {
        qWarning() << "MessageTransport: Ignoring subscribe with empty filter or handler";
        return 0;
    }

    const bool firstForFilter = !isSubscribed(filter);

    Subscription sub;
    sub.id = m_nextSubscriptionId++;
    sub.filter = filter;
    sub.handler = std::move(handler);
    m_subscriptions.append(sub);

    if (firstForFilter) {
        sendSubscribe(filter);
    }
    return sub.id;
}

void MessageTransport::unsubscribe(const QString& filter) {
    bool removed = false;
    for (int i = m_subscriptions.size() - 1; i >= 0; --i) {
        if (m_subscriptions.at(i).filter == filter) {
            m_subscriptions.removeAt(i);
            removed = true;
        }
    }
    if (removed) {
        sendUnsubscribe(filter);
    }
}

void MessageTransport::unsubscribe(SubscriptionId id) {
    const int index = indexOf(id);
    if (index < 0) return;

    const QString filter = m_subscriptions.at(index).filter;
    m_subscriptions.removeAt(index);
    if (!isSubscribed(filter)) {
        sendUnsubscribe(filter);
    }
}

bool MessageTransport::isSubscribed(const QString& filter) const {
    for (const auto& sub : m_subscriptions) {
        if (sub.filter == filter) return true;
    }
    return false;
}

QStringList MessageTransport::subscribedFilters() const {
    QStringList filters;
    for (const auto& sub : m_subscriptions) {
        if (!filters.contains(sub.filter)) filters.append(sub.filter);
    }
    return filters;
}

void MessageTransport::dispatchMessage(const QString& topic, const QByteArray& payload) {
    // Snapshot matching ids first: handlers may subscribe or unsubscribe while we iterate
    QList<SubscriptionId> matching;
    for (const auto& sub : m_subscriptions) {
        if (topicMatches(sub.filter, topic)) matching.append(sub.id);
    }

    for (SubscriptionId id : matching) {
        const int index = indexOf(id);
        if (index < 0) continue; // removed by an earlier handler
        MessageHandler handler = m_subscriptions.at(index).handler;
        handler(topic, payload);
    }
}

int MessageTransport::indexOf(SubscriptionId id) const {
    for (int i = 0; i < m_subscriptions.size(); ++i) {
        if (m_subscriptions.at(i).id == id) return i;
    }
    return -1;
}
