#pragma once

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>

/**
 * @brief Latest known state of one controller
 *
 * Value object written only by DeviceStatusHub. Consumers receive copies.
 *
 * Usage:
 *   DeviceStatusSnapshot snap;
 *   if (DeviceStatusSnapshot::fromStatusPayload(json, topicDeviceId, now, &snap)) ...
 */
struct DeviceStatusSnapshot {
    enum PrinterState {
        Disconnected,
        Idle,
        Printing,
        Paused,
        Error
    };

    QString deviceId;
    bool connected = false;
    bool printing = false;
    PrinterState state = Disconnected;
    QDateTime lastUpdatedAt;   // last observable change
    QDateTime lastSeenAt;      // last heartbeat, changed or not

    // Fields that take part in the change short-circuit
    bool sameObservableState(const DeviceStatusSnapshot& other) const {
        return deviceId == other.deviceId
            && connected == other.connected
            && printing == other.printing
            && state == other.state;
    }

    QString stateText() const {
        switch (state) {
            case Disconnected: return "disconnected";
            case Idle: return "idle";
            case Printing: return "printing";
            case Paused: return "paused";
            case Error: return "error";
        }
        return "unknown";
    }

    /**
     * Parse a heartbeat from octoprint/status/<deviceId>.
     *
     * Accepts the reduced form {deviceId, connected, printer_status:{printing}}
     * as well as raw OctoPrint payloads where connection and printing are only
     * expressed through state.flags. fallbackDeviceId is used when the payload
     * does not name its device.
     */
    static bool fromStatusPayload(const QJsonObject& payload,
                                  const QString& fallbackDeviceId,
                                  const QDateTime& receivedAt,
                                  DeviceStatusSnapshot* snapshot);

    static PrinterState normalizeState(const QJsonObject& payload, bool connected, bool printing);
};

/**
 * @brief Aggregate counts across every known device
 */
struct DashboardSummary {
    int total = 0;
    int connected = 0;
    int printing = 0;
    int error = 0;
    int idle = 0;

    bool operator==(const DashboardSummary& other) const {
        return total == other.total && connected == other.connected
            && printing == other.printing && error == other.error && idle == other.idle;
    }
    bool operator!=(const DashboardSummary& other) const { return !(*this == other); }

    static DashboardSummary compute(const QList<DeviceStatusSnapshot>& snapshots);
};

Q_DECLARE_METATYPE(DeviceStatusSnapshot)
Q_DECLARE_METATYPE(DashboardSummary)
