#ifndef WIREMESSAGES_H
#define WIREMESSAGES_H

#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>

// Storage target on the controller
enum class UploadDestination { Local, SdCard };

QString destinationToString(UploadDestination destination);
bool destinationFromString(const QString& text, UploadDestination* destination);

// Topic layout shared with the controllers
namespace Topics {
    QString gcodeIn(const QString& deviceId);
    QString controlResult(const QString& deviceId);
    QString status(const QString& deviceId);
    QString control(const QString& deviceId);
}

// Serialise a message object for publish
QByteArray toPayload(const QJsonObject& message);
// Parse an inbound payload; returns false for anything that is not a JSON object
bool parsePayload(const QByteArray& payload, QJsonObject* message, QString* errorMessage = nullptr);

/**
 * One slice of an upload on the wire. Chunk 0 additionally carries the file
 * metadata the controller needs to allocate its receive buffer.
 */
struct ChunkEnvelope {
    QString transferId;
    int index = 0;
    QString payload;        // base64 text
    int payloadLength = 0;  // raw byte count

    // Only meaningful (and only serialised) for index 0
    QString filename;
    qint64 totalSize = 0;
    UploadDestination destination = UploadDestination::Local;

    bool isFirst() const { return index == 0; }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, ChunkEnvelope* envelope);
};

struct CommitMessage {
    QString transferId;
    UploadDestination destination = UploadDestination::Local;

    QJsonObject toJson() const;
};

struct CancelMessage {
    QString transferId;

    QJsonObject toJson() const;
};

struct PrintCommand {
    QString deviceId;
    QString filename;
    UploadDestination origin = UploadDestination::Local;
    QString jobId;

    QJsonObject toJson() const;

    // "/a/b/part.gcode" -> "part"
    static QString jobIdForFile(const QString& filename);
};

// Fire-class commands for control/<deviceId>
namespace ControlCommands {
    QJsonObject home(const QString& axes = QStringLiteral("XYZ"));
    QJsonObject pause();
    QJsonObject resume();
    QJsonObject cancel();

    struct Move {
        bool relative = true;
        bool hasX = false, hasY = false, hasZ = false, hasE = false;
        double x = 0.0, y = 0.0, z = 0.0, e = 0.0;
        int feedrate = 1000; // mm/min
    };
    QJsonObject move(const Move& move);

    // tool -1 addresses the bed
    QJsonObject setTemperature(int tool, double temperature, bool wait = false);
}

/**
 * Anything a controller publishes on control_result/<deviceId>.
 *
 * Final results (UploadResult, CommandResult) resolve a pending wait;
 * UploadProgress is intermediate and only feeds the progress callback.
 */
struct ControllerResult {
    enum class Kind { UploadResult, UploadProgress, CommandResult, Unknown };

    Kind kind = Kind::Unknown;
    QString deviceId;
    QString transferId;
    QString jobId;
    bool success = false;
    QString filename;
    QString target;
    QString error;

    // UploadProgress only
    QString stage;
    qint64 receivedBytes = 0;
    qint64 totalBytes = 0;
    int percent = 0;

    bool isFinal() const { return kind == Kind::UploadResult || kind == Kind::CommandResult; }

    // transferId for upload messages, jobId for command results
    QString correlationId() const;

    static ControllerResult fromJson(const QJsonObject& json);
};

Q_DECLARE_METATYPE(UploadDestination)

#endif // WIREMESSAGES_H
