#include "backend/app/FleetClient.h"
#include "backend/network/ProxyTransport.h"
#include "backend/network/ConnectionManager.h"
#include "backend/correlation/ResultCorrelator.h"
#include "backend/devices/DeviceStatusHub.h"
#include "backend/devices/DeviceDirectory.h"
#include "backend/control/DeviceCommandClient.h"
#include "backend/upload/UploadManager.h"
#include <QDebug>

FleetClient::FleetClient(const FleetSettings& settings, MessageTransport* transport, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_transport(transport)
{
    if (!m_transport) {
        auto* proxy = new ProxyTransport(this);
        proxy->setServerUrl(m_settings.serverUrl);
        proxy->setAuthToken(m_settings.authToken);
        m_transport = proxy;
    }

    m_connectionManager = new ConnectionManager(m_transport, this);

    m_correlator = new ResultCorrelator(m_transport, this);
    m_correlator->setScanInterval(m_settings.timeoutScanIntervalMs > 0
        ? m_settings.timeoutScanIntervalMs
        : ResultCorrelator::DEFAULT_SCAN_INTERVAL_MS);

    m_staticDirectory = std::make_unique<StaticDeviceDirectory>(m_settings.devices);
    m_cachedDirectory = std::make_unique<CachedDeviceDirectory>(m_staticDirectory.get(), m_settings.deviceCacheTtlMs);

    m_statusHub = new DeviceStatusHub(m_transport, this);
    m_statusHub->setDirectory(m_cachedDirectory.get());

    m_commandClient = new DeviceCommandClient(m_transport, m_correlator, this);
    m_commandClient->setCommandTimeout(m_settings.commandResultTimeoutMs);

    m_uploadManager = new UploadManager(m_transport, m_correlator, this);
    m_uploadManager->setStatusHub(m_statusHub);
    m_uploadManager->setCommandClient(m_commandClient);
    if (m_settings.chunkSizeBytes > 0) m_uploadManager->setDefaultChunkSize(m_settings.chunkSizeBytes);
    if (m_settings.uploadResultTimeoutMs > 0) m_uploadManager->setResultTimeout(m_settings.uploadResultTimeoutMs);

    qDebug() << "FleetClient: Initialized for" << m_settings.serverUrl;
}

FleetClient::~FleetClient() {
    shutdown();
    // Directories are members and die before the child hub
    m_statusHub->setDirectory(nullptr);
}

void FleetClient::start() {
    m_shutDown = false;
    m_connectionManager->start();
}

void FleetClient::shutdown() {
    if (m_shutDown) return;
    m_shutDown = true;

    m_uploadManager->cancelAll();
    m_correlator->rejectAll(WaitError::Shutdown, "Client shutting down");
    m_statusHub->stop();
    m_connectionManager->stop();
    qDebug() << "FleetClient: Shut down";
}

bool FleetClient::watchUserDevices(bool forceRefresh, QString* errorMessage) {
    return m_statusHub->startForUser(m_settings.userId, forceRefresh, errorMessage);
}

DeviceDirectory* FleetClient::directory() const {
    return m_cachedDirectory.get();
}
