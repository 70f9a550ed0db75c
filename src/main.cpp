#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "sos/Version.hpp"
#include "sos/api/EmergencyApi.hpp"
#include "sos/api/HttpServer.hpp"
#include "sos/core/Clock.hpp"
#include "sos/core/Config.hpp"
#include "sos/core/Errors.hpp"
#include "sos/emergency/EmergencyEngine.hpp"
#include "sos/events/EventPublisher.hpp"
#include "sos/events/JournaledEventBus.hpp"
#include "sos/identity/DeviceIdentityGateway.hpp"
#include "sos/notify/ChannelSender.hpp"
#include "sos/notify/ContactDirectory.hpp"
#include "sos/notify/NotificationDispatcher.hpp"
#include "sos/sched/TimerScheduler.hpp"
#include "sos/store/EmergencyStore.hpp"
#include "sos/store/ProcessLock.hpp"

std::atomic<bool> g_running(true);

static void on_signal(int) {
    g_running.store(false);
}

int main(int argc, char** argv)
{
    std::cout << "==========================================\n";
    std::cout << " " << sos::getFullVersion() << "\n";
    std::cout << "==========================================\n";

    std::string config_path = argc > 1 ? argv[1] : "sos_engine.ini";

    sos::core::EngineConfig cfg;
    try {
        cfg = sos::core::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] CONFIG LOAD FAILED: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[OK] Config loaded from " << config_path << "\n";
    std::cout << "[CONFIG] port=" << cfg.server.port
              << " tiers=" << cfg.escalation.tier_count()
              << " renotify_ms=" << cfg.escalation.renotify_interval_ms
              << " data_dir=" << (cfg.store.data_dir.empty() ? "<memory>" : cfg.store.data_dir) << "\n";

    std::optional<sos::store::ProcessLock> lock;
    if (!cfg.store.data_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.store.data_dir, ec);
        if (ec) {
            std::cerr << "[ERROR] Cannot create data dir " << cfg.store.data_dir << ": " << ec.message() << "\n";
            return 1;
        }
        lock.emplace(cfg.store.data_dir);
        if (!lock->locked()) {
            std::cerr << "[ERROR] Another engine holds " << lock->path() << "\n";
            return 1;
        }
    }

    std::unique_ptr<sos::notify::JsonContactDirectory> directory;
    try {
        directory = std::make_unique<sos::notify::JsonContactDirectory>(
            sos::notify::JsonContactDirectory::load(cfg.directory.contacts_file));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] CONTACT DIRECTORY LOAD FAILED: " << e.what() << "\n";
        return 1;
    }

    sos::core::SystemClock clock;
    sos::store::EmergencyStore store(cfg.store.data_dir);
    sos::events::JournaledEventBus bus(cfg.store.data_dir);
    sos::sched::TimerScheduler scheduler(clock, cfg.scheduler.worker_threads);

    try {
        store.open();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] STORE RECOVERY FAILED: " << e.what() << "\n";
        return 1;
    }

    sos::notify::NotificationDispatcher dispatcher(cfg.notify, *directory, scheduler, clock);
    sos::notify::ChannelSenderStdout push(sos::notify::Channel::PUSH);
    sos::notify::ChannelSenderStdout sms(sos::notify::Channel::SMS);
    sos::notify::ChannelSenderStdout email(sos::notify::Channel::EMAIL);
    dispatcher.register_sender(push);
    dispatcher.register_sender(sms);
    dispatcher.register_sender(email);
    dispatcher.attach(bus);

    sos::identity::HmacDeviceGateway devices(cfg.device.secret, cfg.device.owners);
    sos::events::EventPublisher publisher(bus, store, scheduler, clock);
    sos::emergency::EmergencyEngine engine(cfg.emergency, cfg.escalation, store, scheduler,
                                           publisher, clock, &devices);

    try {
        bus.recover();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] EVENT JOURNAL RECOVERY FAILED: " << e.what() << "\n";
        return 1;
    }
    bus.start();
    scheduler.start();
    engine.reconcile();

    sos::api::EmergencyApi api(engine, dispatcher, *directory);
    sos::api::HttpServer server([&api](const sos::api::HttpRequest& req) { return api.handle(req); });
    if (!server.start(cfg.server.port, cfg.server.recv_timeout_ms)) {
        scheduler.stop();
        bus.stop();
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[OK] Engine running. Ctrl+C to stop.\n";
    while (g_running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "[SHUTDOWN] Stopping...\n";
    server.stop();
    scheduler.stop();
    bus.stop();
    std::cout << "[SHUTDOWN] Done\n";
    return 0;
}
