#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "server/collab_service_impl.hpp"

#include <cstdio>
#include <cstdlib>
#include <csignal>
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("COLLAB_SERVER_CONFIG")) {
        config_path = env;
    } else {
        config_path = collab::common::GetConfigPath("app.example.json");
    }

    collab::common::AppConfig config;
    try {
        config = collab::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    collab::common::InitLogger(config.logging);
    COLLAB_LOG_INFO("Collab server starting with config {}", config_path);

    std::unique_ptr<collab::server::CollabServiceImpl> collab_service;
    try {
        collab_service = std::make_unique<collab::server::CollabServiceImpl>(config);
    } catch (const std::exception& ex) {
        COLLAB_LOG_ERROR("Failed to initialize collab service: {}", ex.what());
        collab::common::ShutdownLogger();
        return EXIT_FAILURE;
    }
    COLLAB_LOG_INFO("Store mode: {}", collab::core::StoreModeToString(collab_service->Mode()));

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(collab_service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        COLLAB_LOG_ERROR("Failed to start gRPC server on {}", address);
        collab::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    COLLAB_LOG_INFO("Collab server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        COLLAB_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    collab::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
