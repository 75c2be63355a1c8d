#include "backend/protocol/WireMessages.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QFileInfo>

QString destinationToString(UploadDestination destination) {
    return destination == UploadDestination::SdCard ? QStringLiteral("sdcard") : QStringLiteral("local");
}

bool destinationFromString(const QString& text, UploadDestination* destination) {
    const QString value = text.trimmed().toLower();
    if (value == "local") {
        if (destination) *destination = UploadDestination::Local;
        return true;
    }
    if (value == "sdcard" || value == "sd") {
        if (destination) *destination = UploadDestination::SdCard;
        return true;
    }
    return false;
}

namespace Topics {

QString gcodeIn(const QString& deviceId) { return QStringLiteral("octoprint/gcode_in/") + deviceId; }
QString controlResult(const QString& deviceId) { return QStringLiteral("control_result/") + deviceId; }
QString status(const QString& deviceId) { return QStringLiteral("octoprint/status/") + deviceId; }
QString control(const QString& deviceId) { return QStringLiteral("control/") + deviceId; }

}

QByteArray toPayload(const QJsonObject& message) {
    return QJsonDocument(message).toJson(QJsonDocument::Compact);
}

bool parsePayload(const QByteArray& payload, QJsonObject* message, QString* errorMessage) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &error);
    if (error.error != QJsonParseError::NoError) {
        if (errorMessage) *errorMessage = error.errorString();
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) *errorMessage = QStringLiteral("payload is not a JSON object");
        return false;
    }
    if (message) *message = doc.object();
    return true;
}

QJsonObject ChunkEnvelope::toJson() const {
    QJsonObject obj;
    obj["type"] = "chunk";
    obj["transferId"] = transferId;
    obj["index"] = index;
    if (isFirst()) {
        obj["filename"] = filename;
        obj["totalSize"] = static_cast<double>(totalSize);
        obj["destination"] = destinationToString(destination);
    }
    obj["payload"] = payload;
    obj["payloadLength"] = payloadLength;
    return obj;
}

bool ChunkEnvelope::fromJson(const QJsonObject& json, ChunkEnvelope* envelope) {
    if (json.value("type").toString() != "chunk") return false;
    if (!json.value("transferId").isString() || !json.value("index").isDouble()) return false;

    ChunkEnvelope chunk;
    chunk.transferId = json.value("transferId").toString();
    chunk.index = json.value("index").toInt();
    chunk.payload = json.value("payload").toString();
    chunk.payloadLength = json.value("payloadLength").toInt();
    if (chunk.index == 0) {
        chunk.filename = json.value("filename").toString();
        chunk.totalSize = static_cast<qint64>(json.value("totalSize").toDouble());
        if (!destinationFromString(json.value("destination").toString(), &chunk.destination)) {
            return false;
        }
    }
    if (envelope) *envelope = chunk;
    return true;
}

QJsonObject CommitMessage::toJson() const {
    QJsonObject obj;
    obj["type"] = "commit";
    obj["transferId"] = transferId;
    obj["destination"] = destinationToString(destination);
    return obj;
}

QJsonObject CancelMessage::toJson() const {
    QJsonObject obj;
    obj["type"] = "cancel";
    obj["transferId"] = transferId;
    return obj;
}

QJsonObject PrintCommand::toJson() const {
    QJsonObject obj;
    obj["type"] = "print";
    obj["deviceId"] = deviceId;
    obj["filename"] = filename;
    obj["origin"] = destinationToString(origin);
    obj["jobId"] = jobId.isEmpty() ? jobIdForFile(filename) : jobId;
    return obj;
}

QString PrintCommand::jobIdForFile(const QString& filename) {
    const QString name = QFileInfo(filename).fileName();
    const int dot = name.lastIndexOf('.');
    // Leading dot ("/x/.gcode") is a name, not an extension
    if (dot <= 0) return name.isEmpty() ? filename : name;
    return name.left(dot);
}

namespace ControlCommands {

QJsonObject home(const QString& axes) {
    QJsonObject obj;
    obj["type"] = "home";
    obj["axes"] = axes;
    return obj;
}

QJsonObject pause() {
    QJsonObject obj;
    obj["type"] = "pause";
    return obj;
}

QJsonObject resume() {
    QJsonObject obj;
    obj["type"] = "resume";
    return obj;
}

QJsonObject cancel() {
    QJsonObject obj;
    obj["type"] = "cancel";
    return obj;
}

QJsonObject move(const Move& move) {
    QJsonObject obj;
    obj["type"] = "move";
    obj["mode"] = move.relative ? "relative" : "absolute";
    if (move.hasX) obj["x"] = move.x;
    if (move.hasY) obj["y"] = move.y;
    if (move.hasZ) obj["z"] = move.z;
    if (move.hasE) obj["e"] = move.e;
    obj["feedrate"] = move.feedrate > 0 ? move.feedrate : 1000;
    return obj;
}

QJsonObject setTemperature(int tool, double temperature, bool wait) {
    QJsonObject obj;
    obj["type"] = "set_temperature";
    obj["tool"] = tool;
    obj["temperature"] = temperature;
    if (wait) obj["wait"] = true;
    return obj;
}

}

QString ControllerResult::correlationId() const {
    return kind == Kind::CommandResult ? jobId : transferId;
}

ControllerResult ControllerResult::fromJson(const QJsonObject& json) {
    ControllerResult result;
    const QString type = json.value("type").toString();
    if (type == "upload_result") result.kind = Kind::UploadResult;
    else if (type == "upload_progress") result.kind = Kind::UploadProgress;
    else if (type == "command_result") result.kind = Kind::CommandResult;
    else return result;

    result.deviceId = json.value("deviceId").toString();
    result.transferId = json.contains("transferId")
        ? json.value("transferId").toString()
        : json.value("upload_id").toString();
    result.jobId = json.contains("jobId")
        ? json.value("jobId").toString()
        : json.value("job_id").toString();

    // Older controller builds report ok/message instead of success/error
    if (json.contains("success")) result.success = json.value("success").toBool();
    else result.success = json.value("ok").toBool();
    result.error = json.contains("error")
        ? json.value("error").toString()
        : json.value("message").toString();

    result.filename = json.value("filename").toString();
    result.target = json.value("target").toString();

    if (result.kind == Kind::UploadProgress) {
        result.stage = json.value("stage").toString();
        result.receivedBytes = static_cast<qint64>(json.contains("receivedBytes")
            ? json.value("receivedBytes").toDouble()
            : json.value("received_bytes").toDouble());
        result.totalBytes = static_cast<qint64>(json.contains("totalBytes")
            ? json.value("totalBytes").toDouble()
            : json.value("total_bytes").toDouble());
        result.percent = json.value("percent").toInt();
    }
    return result;
}
