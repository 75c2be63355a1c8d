#include <catch2/catch.hpp>

#include "test_utils.hpp"
#include "backend/network/ProxyTransport.h"

#include <QJsonArray>

TEST_CASE("Topic filter matching", "[MessageTransport]")
{
    REQUIRE(topicMatches("control_result/printer-1", "control_result/printer-1"));
    REQUIRE(topicMatches("octoprint/status/+", "octoprint/status/printer-1"));
    REQUIRE(topicMatches("octoprint/#", "octoprint/status/printer-1"));
    REQUIRE(topicMatches("#", "anything/at/all"));

    REQUIRE_FALSE(topicMatches("octoprint/status/+", "octoprint/status/printer-1/extra"));
    REQUIRE_FALSE(topicMatches("octoprint/status/+", "octoprint/status"));
    REQUIRE_FALSE(topicMatches("control_result/printer-1", "control_result/printer-2"));
    REQUIRE_FALSE(topicMatches("a/b/c", "a/b"));

    REQUIRE(lastTopicSegment("octoprint/status/printer-7") == "printer-7");
    REQUIRE(lastTopicSegment("bare") == "bare");
}

TEST_CASE("Subscription bookkeeping", "[MessageTransport]")
{
    FakeTransport transport;
    int first = 0, second = 0;

    const SubscriptionId a = transport.subscribe("control_result/p1", [&](const QString&, const QByteArray&) { ++first; });
    const SubscriptionId b = transport.subscribe("control_result/p1", [&](const QString&, const QByteArray&) { ++second; });

    SECTION("wire subscribe is sent once per filter") {
        REQUIRE(transport.sentSubscribes == QStringList{"control_result/p1"});
        REQUIRE(transport.handlerCount() == 2);
        REQUIRE(transport.subscribedFilters() == QStringList{"control_result/p1"});
    }

    SECTION("every matching handler sees the message") {
        transport.deliverRaw("control_result/p1", "{}");
        REQUIRE(first == 1);
        REQUIRE(second == 1);
        transport.deliverRaw("control_result/p2", "{}");
        REQUIRE(first == 1);
    }

    SECTION("wire unsubscribe only after the last handler") {
        transport.unsubscribe(a);
        REQUIRE(transport.sentUnsubscribes.isEmpty());
        REQUIRE(transport.isSubscribed("control_result/p1"));
        transport.unsubscribe(b);
        REQUIRE(transport.sentUnsubscribes == QStringList{"control_result/p1"});
        REQUIRE_FALSE(transport.isSubscribed("control_result/p1"));
    }

    SECTION("unsubscribe by filter drops all handlers") {
        transport.unsubscribe(QString("control_result/p1"));
        REQUIRE(transport.handlerCount() == 0);
        transport.deliverRaw("control_result/p1", "{}");
        REQUIRE(first == 0);
    }

    SECTION("empty filter or handler is refused") {
        REQUIRE(transport.subscribe(QString(), [](const QString&, const QByteArray&) {}) == 0);
        REQUIRE(transport.subscribe("x", MessageHandler()) == 0);
    }
}

TEST_CASE("Handler removed during dispatch is skipped", "[MessageTransport]")
{
    FakeTransport transport;
    SubscriptionId second = 0;
    int secondCalls = 0;

    transport.subscribe("t/#", [&](const QString&, const QByteArray&) { transport.unsubscribe(second); });
    second = transport.subscribe("t/+", [&](const QString&, const QByteArray&) { ++secondCalls; });

    transport.deliverRaw("t/x", "{}");
    REQUIRE(secondCalls == 0);
}

TEST_CASE("Proxy publish frame embeds JSON payloads", "[ProxyTransport]")
{
    const QJsonObject objectFrame = ProxyTransport::buildPublishFrame("octoprint/gcode_in/p1", "{\"type\":\"commit\"}");
    REQUIRE(objectFrame.value("type").toString() == "publish");
    REQUIRE(objectFrame.value("topic").toString() == "octoprint/gcode_in/p1");
    REQUIRE(objectFrame.value("payload").isObject());
    REQUIRE(objectFrame.value("payload").toObject().value("type").toString() == "commit");

    const QJsonObject arrayFrame = ProxyTransport::buildPublishFrame("t", "[1,2]");
    REQUIRE(arrayFrame.value("payload").toArray().size() == 2);

    const QJsonObject textFrame = ProxyTransport::buildPublishFrame("t", "G28");
    REQUIRE(textFrame.value("payload").toString() == "G28");
}

TEST_CASE("Proxy endpoint URL", "[ProxyTransport]")
{
    ProxyTransport transport;
    transport.setServerUrl("wss://fleet.example.com/");
    REQUIRE(transport.endpointUrl().toString() == "wss://fleet.example.com/mqtt-proxy");

    transport.setAuthToken("abc123");
    REQUIRE(transport.endpointUrl().toString() == "wss://fleet.example.com/mqtt-proxy?token=abc123");

    REQUIRE_FALSE(transport.isConnected());
    REQUIRE_FALSE(transport.publish("t", "{}").ok);
}
