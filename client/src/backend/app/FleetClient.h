#ifndef FLEETCLIENT_H
#define FLEETCLIENT_H

#include <QObject>
#include <QPointer>
#include <memory>
#include "backend/managers/app/SettingsManager.h"
#include "backend/network/MessageTransport.h"

class ConnectionManager;
class ResultCorrelator;
class DeviceStatusHub;
class DeviceCommandClient;
class UploadManager;
class DeviceDirectory;
class StaticDeviceDirectory;
class CachedDeviceDirectory;

/**
 * @brief Composition root for one client process
 *
 * Builds and owns the transport, correlator, status hub, upload manager
 * and command client, wired to each other and configured from
 * FleetSettings. Consumers take references from here instead of reaching
 * for globals.
 */
class FleetClient : public QObject {
    Q_OBJECT

public:
    /**
     * @param transport Injected transport (not owned); a ProxyTransport is
     *        created from the settings when null
     */
    explicit FleetClient(const FleetSettings& settings, MessageTransport* transport = nullptr, QObject* parent = nullptr);
    ~FleetClient() override;

    /**
     * @brief Open the broker connection (reconnects automatically afterwards)
     */
    void start();

    /**
     * @brief Cancel uploads, fail pending waits and close the connection
     */
    void shutdown();

    /**
     * @brief Watch every device the directory lists for the configured user
     */
    bool watchUserDevices(bool forceRefresh = false, QString* errorMessage = nullptr);

    const FleetSettings& settings() const { return m_settings; }

    MessageTransport* transport() const { return m_transport; }
    ConnectionManager* connectionManager() const { return m_connectionManager; }
    ResultCorrelator* correlator() const { return m_correlator; }
    DeviceStatusHub* statusHub() const { return m_statusHub; }
    UploadManager* uploads() const { return m_uploadManager; }
    DeviceCommandClient* commands() const { return m_commandClient; }
    DeviceDirectory* directory() const;

private:
    FleetSettings m_settings;
    QPointer<MessageTransport> m_transport;
    ConnectionManager* m_connectionManager;
    ResultCorrelator* m_correlator;
    DeviceStatusHub* m_statusHub;
    DeviceCommandClient* m_commandClient;
    UploadManager* m_uploadManager;
    std::unique_ptr<StaticDeviceDirectory> m_staticDirectory;
    std::unique_ptr<CachedDeviceDirectory> m_cachedDirectory;
    bool m_shutDown = false;
};

#endif // FLEETCLIENT_H
