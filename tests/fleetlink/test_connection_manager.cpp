#include <catch2/catch.hpp>

#include "test_utils.hpp"
#include "backend/network/ConnectionManager.h"

TEST_CASE("Reconnect backoff", "[ConnectionManager]")
{
    REQUIRE(ConnectionManager::calculateReconnectDelay(1) == 1000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(2) == 2000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(3) == 4000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(4) == 8000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(5) == 15000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(50) == 15000);
    REQUIRE(ConnectionManager::calculateReconnectDelay(0) == 1000);
}

TEST_CASE("Connection lifecycle", "[ConnectionManager]")
{
    FakeTransport transport(false);
    ConnectionManager manager(&transport);

    QStringList statuses;
    QObject::connect(&manager, &ConnectionManager::statusChanged, [&](const QString& s) { statuses.append(s); });

    manager.start();
    REQUIRE(transport.connectCalls == 1);
    REQUIRE(manager.isConnected());
    REQUIRE(statuses.last() == "Connected");

    SECTION("start is idempotent") {
        manager.start();
        REQUIRE(transport.connectCalls == 1);
    }

    SECTION("unexpected drop schedules a reconnect") {
        transport.dropConnection();
        REQUIRE(manager.isReconnectScheduled());
        REQUIRE(manager.reconnectAttempts() == 1);
        REQUIRE(statuses.last() == "Reconnecting (1)...");

        // A second failure while the timer runs does not stack attempts
        transport.failConnection("refused");
        REQUIRE(manager.reconnectAttempts() == 1);
    }

    SECTION("stop suppresses reconnection") {
        manager.stop();
        REQUIRE_FALSE(manager.isConnected());
        REQUIRE_FALSE(manager.isReconnectScheduled());
        REQUIRE(statuses.last() == "Disconnected");
    }

    SECTION("proxy errors on a live socket are not connection failures") {
        transport.failConnection("subscription denied");
        REQUIRE_FALSE(manager.isReconnectScheduled());
        REQUIRE(manager.isConnected());
    }
}

TEST_CASE("Reconnect attempt reaches the transport", "[ConnectionManager]")
{
    FakeTransport transport(false);
    transport.autoConnect = false;
    ConnectionManager manager(&transport);

    manager.start();
    transport.failConnection("connection refused");
    REQUIRE(manager.isReconnectScheduled());

    transport.autoConnect = true;
    REQUIRE(waitUntil([&]() { return manager.isConnected(); }, 3000));
    REQUIRE(transport.connectCalls == 2);
    REQUIRE(manager.reconnectAttempts() == 0);
}
