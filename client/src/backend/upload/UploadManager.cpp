#include "backend/upload/UploadManager.h"
#include "backend/devices/DeviceStatusHub.h"
#include "backend/correlation/ResultCorrelator.h"
#include "backend/network/MessageTransport.h"
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <utility>

UploadManager::UploadManager(MessageTransport* transport, ResultCorrelator* correlator, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_correlator(correlator)
{
}

UploadManager::~UploadManager() {
    // Sessions are children and outlive this destructor body
    for (UploadSession* session : std::as_const(m_sessions)) {
        session->disconnect(this);
    }
}

QString UploadManager::startUpload(const UploadRequest& request, QString* errorMessage) {
    auto fail = [errorMessage](const QString& error) {
        qWarning() << "UploadManager:" << error;
        if (errorMessage) *errorMessage = error;
        return QString();
    };

    if (request.deviceId.isEmpty()) return fail("Device id is required");
    if (m_activeByDevice.contains(request.deviceId)) {
        return fail(QString("Device %1 already has an upload in progress (%2)")
                        .arg(request.deviceId, m_activeByDevice.value(request.deviceId)));
    }
    if (m_statusHub && !m_statusHub->isWatching(request.deviceId)) {
        return fail(QString("Device %1 has no active status subscription").arg(request.deviceId));
    }
    if (request.printAfterUpload && !m_commandClient) {
        return fail("Print after upload requested but no command client is configured");
    }

    auto* session = new UploadSession(m_transport, m_correlator, request, this);
    const QString transferId = session->transferId();

    connect(session, &UploadSession::progressChanged, this, &UploadManager::uploadProgress);
    connect(session, &UploadSession::stateChanged, this, &UploadManager::uploadStateChanged);
    connect(session, &UploadSession::finished, this, [this, session](const UploadOutcome& outcome) {
        onSessionFinished(session, outcome);
    });

    m_sessions.insert(transferId, session);
    m_activeByDevice.insert(request.deviceId, transferId);

    QString startError;
    if (!session->start(&startError)) {
        m_sessions.remove(transferId);
        m_activeByDevice.remove(request.deviceId);
        session->deleteLater();
        return fail(startError);
    }

    emit uploadStarted(transferId, request.deviceId);
    return transferId;
}

QString UploadManager::startUploadFromFile(const QString& deviceId,
                                           const QString& filePath,
                                           UploadDestination destination,
                                           bool printAfterUpload,
                                           QString* errorMessage) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString error = QString("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << "UploadManager:" << error;
        if (errorMessage) *errorMessage = error;
        return QString();
    }

    UploadRequest request;
    request.deviceId = deviceId;
    request.filename = QFileInfo(filePath).fileName();
    request.data = file.readAll();
    request.destination = destination;
    request.chunkSize = m_defaultChunkSize;
    request.resultTimeoutMs = m_resultTimeoutMs;
    request.printAfterUpload = printAfterUpload;
    file.close();

    return startUpload(request, errorMessage);
}

bool UploadManager::cancelUpload(const QString& transferId) {
    UploadSession* session = m_sessions.value(transferId);
    if (!session) {
        qDebug() << "UploadManager: Cancel for unknown transfer" << transferId;
        return false;
    }
    session->cancel();
    return true;
}

void UploadManager::cancelAll() {
    const QList<UploadSession*> sessions = m_sessions.values();
    for (UploadSession* session : sessions) {
        session->cancel();
    }
}

void UploadManager::onSessionFinished(UploadSession* session, const UploadOutcome& outcome) {
    m_sessions.remove(outcome.transferId);
    if (m_activeByDevice.value(outcome.deviceId) == outcome.transferId) {
        m_activeByDevice.remove(outcome.deviceId);
    }

    const bool printAfter = session->printAfterUpload();
    session->deleteLater();

    emit uploadFinished(outcome);

    if (!printAfter || !outcome.succeeded()) return;
    if (!m_commandClient) return;

    // Prefer the name the controller actually stored the file under
    const QString storedName = outcome.remoteFilename.isEmpty() ? outcome.filename : outcome.remoteFilename;
    const QString transferId = outcome.transferId;
    QPointer<UploadManager> self(this);
    m_commandClient->startPrint(outcome.deviceId, storedName, outcome.destination, QString(),
        [self, transferId](const CommandOutcome& printOutcome) {
            if (self) emit self->printCommandFinished(transferId, printOutcome);
        });
}
