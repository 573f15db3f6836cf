// datrack: sessions, events, super properties, profile updates.
//
//   cmake -B build -DDATRACK_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_events

#include "datrack/datrack.hpp"

int main() {
    auto tracker = datrack::Tracker::create(
        datrack::TrackerConfig::development("a1b2c3d4e5f60718293a4b5c6d7e8f90")
    );

    // Sessions follow the app's foreground/background signals
    tracker->enter_foreground();

    // Merged into every event from now on
    tracker->register_super_properties(
        datrack::Props().add("plan", "pro").add("platform", "linux"));

    // Simple event
    tracker->track_event("click", datrack::Props().add("btn", "ok"));

    // Timed event: the next "checkout" carries the elapsed time as its cost
    tracker->track_timer("checkout");

    datrack::EventOptions options;
    options.categories = {"shop", "checkout"};
    options.attributes.add("items", 3);
    tracker->track_event("checkout", options);

    // Identity and profile
    tracker->login_user("user_123");
    tracker->people().set(datrack::Props().add("name", "Jane").add("plan", "pro"));
    tracker->people().track_charge(49.99, datrack::Props().add("sku", "annual_plan"));

    tracker->enter_background();
    tracker->flush();
    tracker->close();
}
