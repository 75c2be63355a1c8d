#ifndef UPLOADMANAGER_H
#define UPLOADMANAGER_H

#include <QObject>
#include <QPointer>
#include <QHash>
#include "backend/upload/UploadSession.h"
#include "backend/control/DeviceCommandClient.h"
#include "backend/devices/DeviceStatusHub.h"

// Owns every live UploadSession, keyed by transferId.
// Responsibilities:
//  - One active upload per device; uploads to different devices run side by side
//  - Re-emit session progress/state/outcome under a single object UI code can bind to
//  - Optional print command once an upload is confirmed
//  - Release finished sessions
class UploadManager : public QObject {
    Q_OBJECT
public:
    UploadManager(MessageTransport* transport, ResultCorrelator* correlator, QObject* parent = nullptr);
    ~UploadManager() override;

    // Optional collaborators (not owned)
    void setStatusHub(DeviceStatusHub* hub) { m_statusHub = hub; }
    void setCommandClient(DeviceCommandClient* client) { m_commandClient = client; }

    void setDefaultChunkSize(int bytes) { m_defaultChunkSize = bytes; }
    int defaultChunkSize() const { return m_defaultChunkSize; }
    void setResultTimeout(int timeoutMs) { m_resultTimeoutMs = timeoutMs; }
    int resultTimeout() const { return m_resultTimeoutMs; }

    // Returns the new transferId, or an empty string with errorMessage set
    QString startUpload(const UploadRequest& request, QString* errorMessage = nullptr);
    QString startUploadFromFile(const QString& deviceId,
                                const QString& filePath,
                                UploadDestination destination,
                                bool printAfterUpload = false,
                                QString* errorMessage = nullptr);

    bool cancelUpload(const QString& transferId);
    void cancelAll();

    bool hasActiveUpload(const QString& deviceId) const { return m_activeByDevice.contains(deviceId); }
    QString activeTransferForDevice(const QString& deviceId) const { return m_activeByDevice.value(deviceId); }
    int activeCount() const { return m_sessions.size(); }
    UploadSession* session(const QString& transferId) const { return m_sessions.value(transferId); }

signals:
    void uploadStarted(const QString& transferId, const QString& deviceId);
    void uploadProgress(const QString& transferId, int percent);
    void uploadStateChanged(const QString& transferId, TransferState state);
    void uploadFinished(const UploadOutcome& outcome);
    void printCommandFinished(const QString& transferId, const CommandOutcome& outcome);

private:
    void onSessionFinished(UploadSession* session, const UploadOutcome& outcome);

    QPointer<MessageTransport> m_transport;
    QPointer<ResultCorrelator> m_correlator;
    QPointer<DeviceStatusHub> m_statusHub;
    QPointer<DeviceCommandClient> m_commandClient;
    QHash<QString, UploadSession*> m_sessions;      // transferId -> session
    QHash<QString, QString> m_activeByDevice;       // deviceId -> transferId
    int m_defaultChunkSize = ChunkEncoder::DEFAULT_CHUNK_SIZE;
    int m_resultTimeoutMs = 120000;
};

#endif // UPLOADMANAGER_H
