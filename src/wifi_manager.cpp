#include "wifi_manager.hpp"
#include "wifi_boot.hpp"
#include "wifi_command.hpp"
#include "wifi_configurator.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_netlink.hpp"
#include "wifi_nmcli.hpp"
#include "wifi_saved_networks.hpp"
#include "wifi_single_flight.hpp"
#include "wifi_status.hpp"
#include <mutex>
#include <thread>

namespace wifiprov {

namespace {

// Production collaborators, created only when nothing is injected
struct HostBackend {
    explicit HostBackend(const AppConfig& config)
        : gateway(runner, probe,
                  NmcliOptions{config.interfaceName, config.hotspotConnectionName,
                               config.commandTimeout}) {}

    ProcessCommandRunner runner;
    Nl80211InterfaceProbe probe;
    NmcliGateway gateway;
    SteadyClock clock;
};

ConnectionResult busyResult() {
    AttemptInProgressError busy;
    ConnectionResult result;
    result.code = busy.code();
    result.message = busy.what();
    return result;
}

} // namespace

class WifiManager::Impl {
public:
    Impl(const AppConfig& config, std::unique_ptr<HostBackend> backend,
         NetworkGateway& gateway, Clock& clock)
        : config(config),
          backend(std::move(backend)),
          gateway(gateway),
          clock(clock),
          modeStore(config.hostModeFile),
          configurator(gateway, modeStore, clock, config.hotspot,
                       InterfaceConfigurator::Options{config.hotspotDhcpConf,
                                                      std::chrono::seconds(5),
                                                      std::chrono::seconds(1)}),
          orchestrator(gateway, configurator, modeStore, guard, clock),
          store(gateway),
          reporter(gateway, modeStore, config.hotspot),
          bootSelector(gateway, modeStore, configurator, reporter, guard, clock,
                       BootOptions{config.fallbackEnabled, std::chrono::seconds(10),
                                   config.bootTimeout, std::chrono::seconds(1)}) {
        Logger::getInstance().info("WifiManager initialized for ", gateway.interfaceName());
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(workerMutex);
        if (worker.joinable()) {
            Logger::getInstance().info("Waiting for connection attempt to finish");
            worker.join();
        }
    }

    std::future<ConnectionResult> connectAsync(const ConnectRequest& request) {
        std::string invalid = ConnectionOrchestrator::validate(request);
        if (!invalid.empty()) {
            ConnectionResult result;
            result.code = ErrorCode::InvalidRequest;
            result.message = invalid;
            std::promise<ConnectionResult> ready;
            ready.set_value(result);
            return ready.get_future();
        }

        SingleFlight::Ticket ticket = guard.tryAcquire("connect to " + request.ssid);
        if (!ticket) {
            std::promise<ConnectionResult> ready;
            ready.set_value(busyResult());
            return ready.get_future();
        }

        std::packaged_task<ConnectionResult()> task(
            [this, request, held = std::move(ticket)]() mutable {
                ConnectionResult result = orchestrator.connectHeld(request, held);
                held.release();
                return result;
            });
        std::future<ConnectionResult> future = task.get_future();

        std::lock_guard<std::mutex> lock(workerMutex);
        // The previous worker released the guard, it is at most returning
        if (worker.joinable()) {
            worker.join();
        }
        worker = std::thread(std::move(task));
        return future;
    }

    bool forget(const std::string& id) {
        SingleFlight::Ticket ticket = guard.tryAcquire("forget network " + id);
        if (!ticket) {
            throw AttemptInProgressError();
        }
        return store.forget(id);
    }

    void enableHotspotMode() {
        SingleFlight::Ticket ticket = guard.tryAcquire("hotspot mode");
        if (!ticket) {
            throw AttemptInProgressError();
        }
        configurator.activateHotspot();
    }

    AppConfig config;
    std::unique_ptr<HostBackend> backend;
    NetworkGateway& gateway;
    Clock& clock;

    ModeStore modeStore;
    SingleFlight guard;
    InterfaceConfigurator configurator;
    ConnectionOrchestrator orchestrator;
    SavedNetworkStore store;
    StatusReporter reporter;
    BootModeSelector bootSelector;

    std::mutex workerMutex;
    std::thread worker;
};

WifiManager::WifiManager(const AppConfig& config) {
    auto backend = std::make_unique<HostBackend>(config);
    NetworkGateway& gateway = backend->gateway;
    Clock& clock = backend->clock;
    pimpl = std::make_unique<Impl>(config, std::move(backend), gateway, clock);
}

WifiManager::WifiManager(const AppConfig& config, NetworkGateway& gateway, Clock& clock)
    : pimpl(std::make_unique<Impl>(config, nullptr, gateway, clock)) {}

WifiManager::~WifiManager() = default;

DeviceMode WifiManager::boot() {
    return pimpl->bootSelector.run();
}

SystemStatus WifiManager::getStatus() {
    return pimpl->reporter.getStatus();
}

std::vector<NetworkInfo> WifiManager::scan() {
    Logger::getInstance().info("Scanning for networks on ", pimpl->gateway.interfaceName());
    return pimpl->gateway.scan();
}

ConnectionResult WifiManager::connect(const std::string& ssid, const std::string& password) {
    return pimpl->orchestrator.connect(ConnectRequest{ssid, password});
}

std::future<ConnectionResult> WifiManager::connectAsync(const std::string& ssid,
                                                        const std::string& password) {
    return pimpl->connectAsync(ConnectRequest{ssid, password});
}

std::vector<NetworkProfile> WifiManager::listSaved() {
    return pimpl->store.list();
}

bool WifiManager::forget(const std::string& id) {
    return pimpl->forget(id);
}

void WifiManager::enableHotspotMode() {
    pimpl->enableHotspotMode();
}

bool WifiManager::busy() const {
    return pimpl->guard.busy();
}

const AppConfig& WifiManager::config() const {
    return pimpl->config;
}

} // namespace wifiprov
