#include <catch2/catch.hpp>

#include "test_utils.hpp"
#include "backend/devices/DeviceStatusHub.h"
#include "backend/devices/DeviceDirectory.h"

#include <QJsonArray>
#include <algorithm>
#include <numeric>
#include <vector>

namespace {

QJsonObject heartbeat(const QString& deviceId, bool connected, bool printing)
{
    QJsonObject printerStatus;
    printerStatus["printing"] = printing;
    QJsonObject obj;
    obj["deviceId"] = deviceId;
    obj["connected"] = connected;
    obj["printer_status"] = printerStatus;
    return obj;
}

class FailingDirectory : public DeviceDirectory {
public:
    bool deviceIdsForUser(const QString&, QStringList*, QString* errorMessage) override
    {
        ++calls;
        if (errorMessage) *errorMessage = "backend unavailable";
        return false;
    }
    int calls = 0;
};

} // namespace

TEST_CASE("Status payload parsing", "[DeviceStatusSnapshot]")
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    DeviceStatusSnapshot snap;

    SECTION("reduced heartbeat") {
        REQUIRE(DeviceStatusSnapshot::fromStatusPayload(heartbeat("p1", true, true), "topic-id", now, &snap));
        REQUIRE(snap.deviceId == "p1");
        REQUIRE(snap.connected);
        REQUIRE(snap.printing);
        REQUIRE(snap.state == DeviceStatusSnapshot::Printing);
        REQUIRE(snap.lastUpdatedAt == now);
        REQUIRE(snap.lastSeenAt == now);
    }

    SECTION("raw OctoPrint flags and fallback device id") {
        QJsonObject flags;
        flags["operational"] = true;
        flags["paused"] = true;
        QJsonObject state;
        state["text"] = "Paused";
        state["flags"] = flags;
        QJsonObject payload;
        payload["state"] = state;

        REQUIRE(DeviceStatusSnapshot::fromStatusPayload(payload, "p9", now, &snap));
        REQUIRE(snap.deviceId == "p9");
        REQUIRE(snap.connected);
        REQUIRE_FALSE(snap.printing);
        REQUIRE(snap.state == DeviceStatusSnapshot::Paused);
    }

    SECTION("connection array text") {
        QJsonObject payload = heartbeat("p1", true, false);
        payload["connection"] = QJsonArray{"Error", "/dev/ttyUSB0", 115200};
        REQUIRE(DeviceStatusSnapshot::fromStatusPayload(payload, QString(), now, &snap));
        REQUIRE(snap.state == DeviceStatusSnapshot::Error);
    }

    SECTION("disconnected wins over everything") {
        REQUIRE(DeviceStatusSnapshot::fromStatusPayload(heartbeat("p1", false, true), QString(), now, &snap));
        REQUIRE(snap.state == DeviceStatusSnapshot::Disconnected);
        REQUIRE(snap.stateText() == "disconnected");
    }

    SECTION("no device id at all") {
        QJsonObject payload;
        payload["connected"] = true;
        REQUIRE_FALSE(DeviceStatusSnapshot::fromStatusPayload(payload, QString(), now, &snap));
    }
}

TEST_CASE("Status hub keeps one snapshot per device", "[DeviceStatusHub]")
{
    FakeTransport transport;
    DeviceStatusHub hub(&transport);

    QList<DeviceStatusSnapshot> changes;
    QList<DashboardSummary> summaries;
    QObject::connect(&hub, &DeviceStatusHub::statusChanged, [&](const DeviceStatusSnapshot& s) { changes.append(s); });
    QObject::connect(&hub, &DeviceStatusHub::summaryChanged, [&](const DashboardSummary& s) { summaries.append(s); });

    hub.watchDevice("p1");
    hub.watchDevice("p2");
    REQUIRE(transport.isSubscribed(Topics::status("p1")));
    REQUIRE(hub.isWatching("p2"));

    transport.deliver(Topics::status("p1"), heartbeat("p1", true, false));
    REQUIRE(changes.size() == 1);
    REQUIRE(hub.snapshot("p1").state == DeviceStatusSnapshot::Idle);
    REQUIRE(summaries.size() == 1);
    REQUIRE(hub.summary().connected == 1);
    REQUIRE(hub.summary().idle == 1);

    SECTION("identical heartbeat changes nothing") {
        transport.deliver(Topics::status("p1"), heartbeat("p1", true, false));
        REQUIRE(changes.size() == 1);
        REQUIRE(summaries.size() == 1);
    }

    SECTION("transition updates snapshot and summary") {
        transport.deliver(Topics::status("p1"), heartbeat("p1", true, true));
        transport.deliver(Topics::status("p2"), heartbeat("p2", true, false));
        REQUIRE(changes.size() == 3);
        REQUIRE(hub.printingCount() == 1);
        REQUIRE(hub.connectedCount() == 2);

        const DashboardSummary summary = hub.summary();
        REQUIRE(summary.total == 2);
        REQUIRE(summary.idle == 1);
    }

    SECTION("unparsable payload is dropped") {
        transport.deliverRaw(Topics::status("p1"), "{broken");
        REQUIRE(changes.size() == 1);
        REQUIRE(hub.snapshot("p1").connected);
    }

    SECTION("forget removes snapshot and subscription") {
        bool forgotten = false;
        QObject::connect(&hub, &DeviceStatusHub::deviceForgotten, [&](const QString& id) { forgotten = id == "p1"; });
        REQUIRE(hub.forgetDevice("p1"));
        REQUIRE(forgotten);
        REQUIRE_FALSE(hub.hasSnapshot("p1"));
        REQUIRE_FALSE(transport.isSubscribed(Topics::status("p1")));
        REQUIRE(hub.summary().total == 0);
    }

    SECTION("stop keeps the last known state") {
        hub.stop();
        REQUIRE(hub.watchedDevices().isEmpty());
        REQUIRE(hub.hasSnapshot("p1"));
    }
}

TEST_CASE("Interleaved heartbeats keep the last message per device", "[DeviceStatusHub]")
{
    struct Beat {
        QString deviceId;
        bool connected;
        bool printing;
    };
    const QList<Beat> beats = {
        {"A", true, false}, {"B", false, false}, {"A", true, true},
        {"B", true, true}, {"A", false, false}, {"B", true, false},
    };

    std::vector<int> order(beats.size());
    std::iota(order.begin(), order.end(), 0);
    int permutations = 0;
    do {
        FakeTransport transport;
        DeviceStatusHub hub(&transport);
        hub.watchDevice("A");
        hub.watchDevice("B");

        QHash<QString, Beat> last;
        for (int index : order) {
            const Beat& beat = beats.at(index);
            transport.deliver(Topics::status(beat.deviceId), heartbeat(beat.deviceId, beat.connected, beat.printing));
            last.insert(beat.deviceId, beat);

            int connected = 0;
            int printing = 0;
            for (const Beat& b : last) {
                if (b.connected) ++connected;
                if (b.printing) ++printing;
            }
            REQUIRE(hub.snapshots().size() == last.size());
            REQUIRE(hub.connectedCount() == connected);
            REQUIRE(hub.printingCount() == printing);
        }

        for (const Beat& b : last) {
            const DeviceStatusSnapshot snap = hub.snapshot(b.deviceId);
            REQUIRE(snap.connected == b.connected);
            REQUIRE(snap.printing == b.printing);
        }
        ++permutations;
    } while (std::next_permutation(order.begin(), order.end()));

    REQUIRE(permutations == 720);
}

TEST_CASE("Repeated heartbeats refresh last-seen time only", "[DeviceStatusHub]")
{
    FakeTransport transport;
    DeviceStatusHub hub(&transport);
    ManualClock clock;
    hub.setClock(clock.fn());
    hub.watchDevice("p1");

    int changes = 0;
    QObject::connect(&hub, &DeviceStatusHub::statusChanged, [&](const DeviceStatusSnapshot&) { ++changes; });

    transport.deliver(Topics::status("p1"), heartbeat("p1", true, false));
    const QDateTime first = QDateTime::fromMSecsSinceEpoch(1000).toUTC();
    REQUIRE(hub.snapshot("p1").lastUpdatedAt == first);
    REQUIRE(hub.snapshot("p1").lastSeenAt == first);

    clock.advance(30000);
    transport.deliver(Topics::status("p1"), heartbeat("p1", true, false));
    REQUIRE(changes == 1);
    REQUIRE(hub.snapshot("p1").lastUpdatedAt == first);
    REQUIRE(hub.snapshot("p1").lastSeenAt == first.addMSecs(30000));

    clock.advance(5000);
    transport.deliver(Topics::status("p1"), heartbeat("p1", true, true));
    REQUIRE(changes == 2);
    REQUIRE(hub.snapshot("p1").lastUpdatedAt == first.addMSecs(35000));
    REQUIRE(hub.snapshot("p1").lastSeenAt == first.addMSecs(35000));
}

TEST_CASE("Hub watches a user's devices", "[DeviceStatusHub]")
{
    FakeTransport transport;
    DeviceStatusHub hub(&transport);
    StaticDeviceDirectory directory({"p1", "p2"});
    directory.setDevicesForUser("alice", {"p3"});

    QString error;
    REQUIRE_FALSE(hub.startForUser("alice", false, &error));
    REQUIRE(error == "No device directory configured");

    hub.setDirectory(&directory);
    REQUIRE(hub.startForUser("alice", false, &error));
    REQUIRE(hub.watchedDevices() == QStringList{"p3"});

    REQUIRE(hub.startForUser("bob"));
    REQUIRE(hub.isWatching("p1"));
    REQUIRE(hub.isWatching("p2"));

    FailingDirectory failing;
    hub.setDirectory(&failing);
    REQUIRE_FALSE(hub.startForUser("carol", false, &error));
    REQUIRE(error == "backend unavailable");
}

TEST_CASE("Cached device directory", "[DeviceDirectory]")
{
    StaticDeviceDirectory source({"p1"});
    CachedDeviceDirectory cache(&source, 1000);
    ManualClock clock;
    cache.setClock(clock.fn());

    QStringList devices;
    REQUIRE(cache.deviceIdsForUser("u", &devices));
    REQUIRE(devices == QStringList{"p1"});
    REQUIRE(source.lookupCount() == 1);

    source.setDefaultDevices({"p1", "p2"});
    clock.advance(500);
    REQUIRE(cache.deviceIdsForUser("u", &devices));
    REQUIRE(devices == QStringList{"p1"});
    REQUIRE(source.lookupCount() == 1);

    SECTION("ttl expiry refetches") {
        clock.advance(500);
        REQUIRE(cache.deviceIdsForUser("u", &devices));
        REQUIRE(devices.size() == 2);
        REQUIRE(source.lookupCount() == 2);
    }

    SECTION("force refresh bypasses the cache") {
        REQUIRE(cache.lookup("u", true, &devices));
        REQUIRE(devices.size() == 2);
    }

    SECTION("invalidate drops the entry") {
        cache.invalidate("u");
        REQUIRE(cache.deviceIdsForUser("u", &devices));
        REQUIRE(source.lookupCount() == 2);
    }
}

TEST_CASE("Failed lookups are not cached", "[DeviceDirectory]")
{
    FailingDirectory source;
    CachedDeviceDirectory cache(&source);
    QStringList devices;
    QString error;
    REQUIRE_FALSE(cache.deviceIdsForUser("u", &devices, &error));
    REQUIRE_FALSE(cache.deviceIdsForUser("u", &devices, &error));
    REQUIRE(source.calls == 2);
    REQUIRE(error == "backend unavailable");
}
