#include "ViewerRegistry.h"
#include <iostream>
#include <vector>

ViewerRegistry::ViewerRegistry(RelayState& state)
    : state_(state) {
}

uint64_t ViewerRegistry::registerViewer(const std::shared_ptr<ViewerConnection>& connection) {
    uint64_t id = state_.nextViewerId();
    state_.viewers()[id] = ViewerEntry{id, connection};

    std::cout << "[ViewerRegistry] Viewer " << id << " connected from " << connection->remoteAddress()
              << " (total: " << state_.viewers().size() << ")" << std::endl;
    return id;
}

void ViewerRegistry::unregisterViewer(const ViewerConnection* connection) {
    auto& viewers = state_.viewers();
    for (auto it = viewers.begin(); it != viewers.end(); ++it) {
        if (it->second.connection.get() != connection) {
            continue;
        }

        uint64_t id = it->first;
        viewers.erase(it);
        std::cout << "[ViewerRegistry] Viewer " << id << " disconnected (total: "
                  << viewers.size() << ")" << std::endl;

        if (viewers.empty() && empty_callback_) {
            try {
                empty_callback_();
            } catch (const std::exception& e) {
                std::cerr << "[ViewerRegistry] Empty callback error: " << e.what() << std::endl;
            }
        }
        return;
    }
}

template <typename SendFn>
void ViewerRegistry::deliver(SendFn&& send) {
    // Snapshot: sends may register or unregister viewers underneath us
    std::vector<std::shared_ptr<ViewerConnection>> targets;
    targets.reserve(state_.viewers().size());
    for (const auto& entry : state_.viewers()) {
        targets.push_back(entry.second.connection);
    }

    for (const auto& viewer : targets) {
        if (viewer->state() != ViewerState::OPEN) {
            continue;
        }
        try {
            send(*viewer);
        } catch (const std::exception& e) {
            send_failures_++;
            std::cerr << "[ViewerRegistry] Send to " << viewer->remoteAddress() << " failed: "
                      << e.what() << " - removing viewer" << std::endl;
            unregisterViewer(viewer.get());
        }
    }
}

void ViewerRegistry::broadcast(const Frame& frame) {
    frames_broadcast_++;
    deliver([&frame](ViewerConnection& viewer) { viewer.sendBinary(frame); });
}

void ViewerRegistry::broadcastText(const std::string& text) {
    deliver([&text](ViewerConnection& viewer) { viewer.sendText(text); });
}

void ViewerRegistry::closeAll() {
    std::vector<std::shared_ptr<ViewerConnection>> targets;
    for (const auto& entry : state_.viewers()) {
        targets.push_back(entry.second.connection);
    }
    // Cleared first so close() completions find nothing to unregister
    state_.viewers().clear();

    for (const auto& viewer : targets) {
        try {
            viewer->close();
        } catch (const std::exception& e) {
            std::cerr << "[ViewerRegistry] Close error: " << e.what() << std::endl;
        }
    }
    if (!targets.empty()) {
        std::cout << "[ViewerRegistry] Closed " << targets.size() << " viewer(s)" << std::endl;
    }
}

size_t ViewerRegistry::openCount() const {
    size_t count = 0;
    for (const auto& entry : state_.viewers()) {
        if (entry.second.connection->state() == ViewerState::OPEN) {
            count++;
        }
    }
    return count;
}
