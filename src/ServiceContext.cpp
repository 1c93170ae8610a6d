#include "ServiceContext.hpp"
#include "ZkSocketDriver.hpp"
#include <iostream>

namespace zkfleet {

ServiceContext::ServiceContext(FleetConfig config,
                               DriverFactory factory,
                               std::unique_ptr<EventSink> sink)
    : config_(std::move(config)),
      factory_(factory ? std::move(factory) : DriverFactory(make_socket_driver)),
      sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = std::make_unique<EventForwarder>(config_.backend_url);
    }

    supervisor_ = std::make_unique<DeviceSupervisor>(
        config_.devices, factory_, config_.live_link, config_.supervisor, sink_.get());
    dispatcher_ = std::make_unique<FleetDispatcher>(
        config_.devices, factory_, config_.command_link);

    std::cout << "🔧 Service context ready: " << config_.devices.size() << " device(s)" << std::endl;
}

ServiceContext::~ServiceContext() {
    shutdown();
}

bool ServiceContext::start() {
    return supervisor_->start();
}

void ServiceContext::shutdown() {
    // Supervisor first: its readers still post through sink_
    if (supervisor_) supervisor_->shutdown();
    if (dispatcher_) dispatcher_->shutdown();
}

} // namespace zkfleet
