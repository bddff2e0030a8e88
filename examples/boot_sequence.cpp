#include <iostream>
#include <string>
#include <iomanip>
#include <stdexec/execution.hpp>
#include "beacon.hpp"

using namespace stdexec;

// --- 1. Boot Signals ---
struct BootController {
    beacon::signal<std::string>         firmware_loaded;  // Firmware Version
    beacon::signal<double, double>      telemetry;        // Temperature, Power Load
    beacon::signal<std::string, int>    stage;            // Stage Name, Completion %
    beacon::signal<int, std::string>    emergency_stop;   // Error Code, Reason
    beacon::signal<int>                 sensors_ready;    // Sensor Count
    beacon::signal<std::string>         online;           // Batch Id

    void boot(const std::string& batch_id, bool overheat) {
        firmware_loaded.dispatch("v2.0.4-LTS");
        for (int i = 0; i < 5; ++i) {
            double temp = overheat ? 80.0 + i * 10 : 45.5 + i;
            telemetry.dispatch(temp, 800.0 + (i * 50));
            stage.dispatch("Calibrating", (i + 1) * 20);
            if (temp > 100.0) {
                emergency_stop.dispatch(99, "Thermal Overload Detected");
                return;
            }
        }
        sensors_ready.dispatch(12);
        online.dispatch(batch_id);
    }
};

// --- 2. Visualization Utilities ---
struct Visualizer {
    static void print_header(const std::string& title) {
        std::cout << "\n\033[1;34m" << std::string(50, '=') << "\n"
                  << " SYSTEM: " << title << "\n"
                  << std::string(50, '=') << "\033[0m" << std::endl;
    }

    static void draw_progress(const std::string& step, int percent) {
        int width = 20;
        int pos = width * percent / 100;
        std::cout << "\033[1;32m[BOOT]\033[0m " << std::left << std::setw(15) << step
                  << " [\033[1;33m" << std::string(pos, '#') << std::string(width - pos, ' ')
                  << "\033[0m] " << percent << "%" << std::endl;
    }
};

struct Dashboard {
    int warnings = 0;

    void on_telemetry(double temp, double load) {
        if (temp > 90.0) {
            ++warnings;
        }
        std::cout << "\033[1;90m[TELEMETRY] Temp: " << temp << "°C | Load: " << load << "kW\033[0m" << std::endl;
    }
};

int main() {
    BootController controller;
    Dashboard dashboard;
    controller.online.memorize(true);

    // --- 3. Subscribers ---

    // A. Safety interlock runs first and stops lower priority handlers.
    controller.emergency_stop.add([](int code, const std::string& reason) {
        std::cerr << "\n\033[1;31m[!!! EMERGENCY STOP !!!]\033[0m\n"
                  << "Error: " << code << " | Reason: " << reason << std::endl;
        return false;
    }, 100);
    controller.emergency_stop.add([](int, const std::string&) {
        std::cout << "Audit log should never see this." << std::endl;
    });

    // B. Telemetry dashboard, bound to its receiver.
    auto telemetry_binding = controller.telemetry.add(&Dashboard::on_telemetry, &dashboard);

    // C. Progress UI as a sender pipeline.
    auto ui_binding = controller.stage.add(then([](std::string step, int percent) {
        Visualizer::draw_progress(step, percent);
    }));

    // D. Curried banner, parameters bound on the binding.
    auto banner = controller.firmware_loaded.add_once(
        beacon::curry<std::string>([](const std::string& unit, const std::string& version) {
            std::cout << "[" << unit << "] firmware " << version << std::endl;
        }));
    banner.params(std::string("LINE-A"));

    // E. Join: report once firmware and sensors are both up.
    beacon::compound_signal ready(controller.firmware_loaded, controller.sensors_ready);
    ready.add([](const std::tuple<std::string>& firmware, const std::tuple<int>& sensors) {
        std::cout << "\033[1;32m[READY]\033[0m firmware " << std::get<0>(firmware)
                  << " with " << std::get<0>(sensors) << " sensors" << std::endl;
    });

    // --- 4. Execution ---

    Visualizer::print_header("STARTING NOMINAL BOOT");
    controller.boot("GOLD_BATCH_001", false);

    // Late subscribers still see the remembered batch.
    auto [batch] = sync_wait(beacon::when_dispatched(controller.online)
        | then([](std::string id) { return id + " ONLINE"; })).value();
    std::cout << batch << std::endl;

    Visualizer::print_header("STARTING STRESS TEST (FAILURE SIMULATION)");

    // Blind the UI, the safety interlock must remain active.
    ui_binding.disable();
    controller.boot("BATCH_ERR_99", true);

    std::cout << "Telemetry warnings: " << dashboard.warnings
              << " | resolved: " << std::boolalpha << ready.is_resolved() << std::endl;
    telemetry_binding.detach();

    return 0;
}
