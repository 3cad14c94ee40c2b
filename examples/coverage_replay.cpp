// examples/coverage_replay.cpp
// Replay a recorded location track through a live coverage measurement
//
// This example shows:
// - Resending sessions left over from a previous process at launch
// - Feeding location / network samples from a producer thread
// - Stopping on Ctrl+C, on the control server's session limit or on poor accuracy
//
// Input CSV (header line optional, '#' starts a comment):
//   t_us,latitude,longitude,accuracy_m,network,technology
//   0,48.2082,16.3738,5,cellular,LTE
//   1000000,48.2083,16.3740,6,cellular,NRNSA
//   2000000,48.2084,16.3741,4,wifi,
//
// Timestamps are relative; the replay starts at the current wall clock and
// waits between rows, scaled by the optional speed factor.
//
// Usage:
//   coverage_replay <track.csv> [speed]
//
// Environment: COV_CONTROL_HOST, COV_CONTROL_PORT, COV_CONTROL_TLS, COV_DB_PATH,
// COV_PING_INTERVAL_MS, COV_FENCE_RADIUS_M, ... (see the *Config::from_env() docs)

#include "coverage_configs.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace coverage;

static std::atomic<bool> g_stop{false};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_stop.store(true);
    }
}

struct TrackRow {
    Duration offset;
    LocationSample location;   // timestamp filled at replay time
    NetworkType network;
    RadioTechnology technology;
};

// Parse one CSV row, false for headers, comments and malformed lines
bool parse_row(const std::string& line, TrackRow& row) {
    if (line.empty() || line[0] == '#') return false;

    std::vector<std::string> cols;
    std::stringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) {
        cols.push_back(col);
    }
    if (cols.size() < 4) return false;

    char* end = nullptr;
    row.offset = strtoll(cols[0].c_str(), &end, 10);
    if (end == cols[0].c_str()) return false;

    row.location.coordinate = Coordinate(atof(cols[1].c_str()), atof(cols[2].c_str()));
    row.location.horizontal_accuracy = cols[3].empty() ? -1.0 : atof(cols[3].c_str());
    row.network = (cols.size() > 4 && cols[4] == "wifi") ? NetworkType::WiFi : NetworkType::Cellular;
    row.technology = cols.size() > 5 ? parse_radio_technology(cols[5]) : RadioTechnology::Unknown;
    return true;
}

std::vector<TrackRow> load_track(const char* path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("cannot open ") + path);
    }
    std::vector<TrackRow> rows;
    std::string line;
    while (std::getline(in, line)) {
        TrackRow row;
        if (parse_row(line, row)) rows.push_back(row);
    }
    return rows;
}

template<typename Measurement, typename Client>
int replay(Client& client, const std::vector<TrackRow>& track, double speed) {
    RealClock clock;
    persistence::FenceStore store(persistence::PersistenceConfig::from_env());
    MeasurementConfig config = MeasurementConfig::from_env();

    // Sessions an earlier process could not deliver
    persistence::PersistedFencesResender<persistence::FenceStore, Client> launch_resender(
        store, client, config.max_resend_age);
    try {
        auto report = launch_resender.resend_persistent_sessions(true, clock.now());
        std::cout << "Launch resend: " << report.succeeded << "/" << report.attempted
                  << " sent, " << report.purged << " purged" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Launch resend failed: " << e.what() << std::endl;
    }

    std::mutex tech_mutex;
    std::optional<RadioTechnologySample> current_tech;
    auto technology = [&](Timestamp) {
        std::lock_guard<std::mutex> lock(tech_mutex);
        return current_tech;
    };

    Measurement measurement(clock, client, store, technology, config);
    measurement.start();

    std::atomic<bool> user_stop{false};
    std::thread producer([&]() {
        Timestamp origin = clock.now();
        Duration first = track.front().offset;
        std::optional<NetworkType> network;

        for (const auto& row : track) {
            if (g_stop.load() || user_stop.load()) break;

            Timestamp due = origin + static_cast<Duration>((row.offset - first) / speed);
            while (clock.now() < due && !g_stop.load() && !user_stop.load()) {
                clock.sleep_until(std::min(due, clock.now() + ms_to_us(100)));
            }
            Timestamp now = clock.now();

            if (row.technology != RadioTechnology::Unknown) {
                std::lock_guard<std::mutex> lock(tech_mutex);
                current_tech = RadioTechnologySample(row.technology, now);
            }
            if (!network || *network != row.network) {
                network = row.network;
                measurement.push_network_type(NetworkTypeSample(row.network, now));
            }

            LocationSample s = row.location;
            s.timestamp = now;
            measurement.push_location(s);
        }
        g_stop.store(true);
    });

    std::thread stopper([&]() {
        while (!g_stop.load() && !user_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        user_stop.store(true);
    });

    MeasurementResult result = measurement.run(user_stop);
    user_stop.store(true);
    producer.join();
    stopper.join();

    std::cout << "\n=== Coverage result ===" << std::endl;
    std::cout << "Stop reason: " << stop_reason_name(result.reason) << std::endl;
    std::cout << "Test UUID:   " << (result.test_uuid ? *result.test_uuid : "(none)") << std::endl;
    std::cout << "Fences:      " << result.fences.size()
              << (result.discarded ? " (discarded)" : result.submitted ? " (submitted)" : " (kept for resend)")
              << std::endl;
    for (const auto& f : result.fences) {
        auto ping = f.average_ping_ms();
        auto tech = f.significant_technology();
        printf("  %.6f,%.6f  %5.1fs  ping=%s  %s\n",
               f.starting_location.coordinate.latitude, f.starting_location.coordinate.longitude,
               f.date_exited ? us_to_sec(*f.date_exited - f.date_entered) : 0.0,
               ping ? std::to_string(*ping).c_str() : "-",
               tech && tech->code() ? tech->code() : "-");
    }
    return result.discarded ? 2 : 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <track.csv> [speed]" << std::endl;
        return 1;
    }
    double speed = argc > 2 ? atof(argv[2]) : 1.0;
    if (speed <= 0) speed = 1.0;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        std::vector<TrackRow> track = load_track(argv[1]);
        if (track.empty()) {
            std::cerr << "Track " << argv[1] << " has no samples" << std::endl;
            return 1;
        }
        std::cout << "Replaying " << track.size() << " samples at " << speed << "x" << std::endl;

        control::ControlServerConfig control = control::ControlServerConfig::from_env();
        if (control.use_tls) {
            DefaultControlClient client(control);
            return replay<DefaultCoverageMeasurement>(client, track, speed);
        }
        PlainControlClient client(control);
        return replay<PlainCoverageMeasurement>(client, track, speed);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
