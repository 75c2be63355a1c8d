#include "backend/devices/DeviceStatusSnapshot.h"
#include <QJsonArray>
#include <QJsonValue>

namespace {

QJsonObject stateFlags(const QJsonObject& payload) {
    const QJsonObject flags = payload.value("state").toObject().value("flags").toObject();
    if (!flags.isEmpty()) return flags;
    return payload.value("printer_status").toObject().value("flags").toObject();
}

QString rawStateText(const QJsonObject& payload) {
    // connection is ["Printing", "/dev/ttyUSB0", 115200, {...}] on OctoPrint
    const QJsonValue connection = payload.value("connection");
    if (connection.isArray()) {
        const QJsonArray arr = connection.toArray();
        if (!arr.isEmpty() && arr.at(0).isString()) return arr.at(0).toString();
    }
    const QJsonValue printerState = payload.value("printer_status").toObject().value("state");
    if (printerState.isString()) return printerState.toString();
    return payload.value("state").toObject().value("text").toString();
}

}

bool DeviceStatusSnapshot::fromStatusPayload(const QJsonObject& payload,
                                             const QString& fallbackDeviceId,
                                             const QDateTime& receivedAt,
                                             DeviceStatusSnapshot* snapshot) {
    DeviceStatusSnapshot snap;
    snap.deviceId = payload.value("deviceId").toString();
    if (snap.deviceId.isEmpty()) snap.deviceId = fallbackDeviceId;
    if (snap.deviceId.isEmpty()) return false;

    const QJsonObject flags = stateFlags(payload);

    const QJsonValue connectedValue = payload.value("connected");
    if (connectedValue.isBool()) {
        snap.connected = connectedValue.toBool();
    } else {
        snap.connected = flags.value("operational").toBool()
            || flags.value("printing").toBool()
            || flags.value("paused").toBool()
            || flags.value("ready").toBool()
            || flags.value("error").toBool();
    }

    const QJsonValue printingValue = payload.value("printer_status").toObject().value("printing");
    if (printingValue.isBool()) {
        snap.printing = printingValue.toBool();
    } else {
        snap.printing = flags.value("printing").toBool();
    }

    snap.state = normalizeState(payload, snap.connected, snap.printing);
    snap.lastUpdatedAt = receivedAt;
    snap.lastSeenAt = receivedAt;

    if (snapshot) *snapshot = snap;
    return true;
}

DeviceStatusSnapshot::PrinterState DeviceStatusSnapshot::normalizeState(const QJsonObject& payload,
                                                                        bool connected,
                                                                        bool printing) {
    if (!connected) return Disconnected;
    if (printing) return Printing;

    const QJsonObject flags = stateFlags(payload);
    if (flags.value("paused").toBool()) return Paused;
    if (flags.value("error").toBool()) return Error;

    const QString raw = rawStateText(payload).toLower();
    if (raw == "printing") return Printing;
    if (raw == "paused" || raw == "pausing") return Paused;
    if (raw == "error") return Error;
    if (raw == "offline" || raw == "closed" || raw == "closed_with_error") return Disconnected;
    return Idle;
}

DashboardSummary DashboardSummary::compute(const QList<DeviceStatusSnapshot>& snapshots) {
    DashboardSummary summary;
    summary.total = snapshots.size();
    for (const auto& snap : snapshots) {
        if (snap.connected) summary.connected++;
        if (snap.printing) summary.printing++;
        if (snap.state == DeviceStatusSnapshot::Error) summary.error++;
        if (snap.state == DeviceStatusSnapshot::Idle) summary.idle++;
    }
    return summary;
}
