// Full TrackerConfig builder: all available options with defaults.
//
//   cmake -B build -DDATRACK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_config

#include "datrack/datrack.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = datrack::TrackerConfig::builder("a1b2c3d4e5f60718293a4b5c6d7e8f90")
        .endpoint("collect.datrack.io:50000")                       // default: collect.datrack.io:50000
        .app_version("1.0.0")                                       // default: none
        .app_channel("store")                                       // default: none
        .auto_upload(true)                                          // default: true
        .send_on_wifi(false)                                        // default: false
        .upload_interval(std::chrono::seconds(15))                  // default: 15s between uploads
        .bulk_size(100)                                             // default: 100 records per batch
        .database_path("datrack.db")                                // default: datrack.db
        .max_queue_entries(10000)                                   // default: 10000 records on disk
        .overflow_policy(datrack::OverflowPolicy::DropOldest)       // default: evict oldest
        .session_timeout(std::chrono::milliseconds(30000))          // default: 30s in background
        .require_session(true)                                      // default: events need a session
        .compress(true)                                             // default: gzip batches
        .network_probe([] { return datrack::NetworkType::Wifi; })   // default: Unknown
        .network_timeout(std::chrono::milliseconds(30000))          // default: 30s TCP timeout
        .close_timeout(std::chrono::milliseconds(5000))             // default: 5s flush/close wait
        .log_level("info")                                          // default: warn
        .on_error([](const datrack::TrackerError& e) {              // default: errors are silent
            std::cerr << "[datrack] " << e.what() << std::endl;
        })
        .build();

    auto tracker = datrack::Tracker::create(std::move(config));

    tracker->enter_foreground();
    tracker->track_event("launch");

    // Upload settings can change at runtime
    tracker->set_send_on_wifi(true);
    tracker->set_upload_bulk_size(50);

    tracker->close();
}
