#include "AsterLcd.h"
#include "ImageCache.h"
#include "LcdError.h"
#include "PanelConfig.h"
#include "PanelRenderer.h"
#include "PromClient.h"
#include "SensorStore.h"
#include "SystemMetrics.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static volatile sig_atomic_t running = 1;
static void signal_handler(int) { running = 0; }

static void sleep_while_running(std::chrono::milliseconds duration) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (running && std::chrono::steady_clock::now() < until) {
        auto left = until - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            left, std::chrono::milliseconds(100)));
    }
}

static std::unique_ptr<AsterLcd> open_display() {
    AsterLcdOptions options;
    options.no_init_check = getenv_bool("ASTER_WRITE_ONLY", false);
    options.enable_cache = getenv_bool("ASTER_CACHE", true);
    int timeout_ms = getenv_int("ASTER_SERIAL_TIMEOUT_MS", 1000);

    if (getenv_bool("ASTER_SIMULATE", false)) {
        std::cout << "[LCD] Using simulated display" << std::endl;
        return AsterLcd::Simulate(options);
    }
    std::string device = getenv_string("ASTER_DEVICE", "");
    if (!device.empty()) {
        return AsterLcd::OpenDevice(device, timeout_ms, options);
    }
    return AsterLcd::OpenUsbId(getenv_string("ASTER_USB", "416:90A1"), timeout_ms, options);
}

static std::string config_path(const std::string& config, const std::string& config_dir) {
    if (!config.empty() && config[0] == '/') return config;
    return config_dir + "/" + config;
}

static int run_image(AsterLcd& lcd, const std::string& path) {
    std::cout << "Loading and displaying background image " << path << "..." << std::endl;
    ImageRGBA image;
    if (!load_image(path, image)) return 1;
    if (image.w != DISPLAY_WIDTH || image.h != DISPLAY_HEIGHT) {
        image = resize_exact(image, DISPLAY_WIDTH, DISPLAY_HEIGHT);
    }
    auto start = std::chrono::steady_clock::now();
    SendStats stats = lcd.SendFrame(image);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cout << "Image sent in " << ms << "ms (" << stats.chunks_sent << " chunks)" << std::endl;

    int off_after = getenv_int("ASTER_OFF_AFTER", 0);
    if (off_after > 0) {
        std::cout << "Switching off display in " << off_after << "s" << std::endl;
        sleep_while_running(std::chrono::seconds(off_after));
        lcd.PowerOff();
    }
    return 0;
}

static int run_panels(AsterLcd& lcd, MonitorConfig& cfg, const std::string& config_dir) {
    PanelRenderer renderer(DISPLAY_WIDTH, DISPLAY_HEIGHT, getenv_string("ASTER_FONT_DIR", "fonts"),
                           config_dir,
                           getenv_string("ASTER_DEFAULT_FONT",
                                         "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"));
    renderer.setTextScale(static_cast<float>(getenv_double("ASTER_TEXT_SCALE", 0.75)));

    SensorStore store;
    std::vector<std::regex> filters;
    std::string filter_file = getenv_string("ASTER_SENSOR_FILTER", "");
    if (!filter_file.empty()) filters = read_filter_file(filter_file);

    SensorFileWatcher watcher(getenv_string("ASTER_SENSOR_PATH", "cfg/sensors"), store, filters);
    if (watcher.ReadAll()) watcher.Start();

    std::unique_ptr<PromClient> prom;
    std::string prom_url = getenv_string("ASTER_PROM_URL", "");
    if (!prom_url.empty()) {
        prom = std::make_unique<PromClient>(prom_url, store, filters);
        prom->Start();
    }

    std::unique_ptr<SystemMetrics> metrics;
    if (getenv_bool("ASTER_SYSINFO", true)) {
        metrics = std::make_unique<SystemMetrics>(store);
        metrics->Start();
    }

    auto refresh = std::chrono::milliseconds(static_cast<int>(cfg.setup.refresh * 1000.0f));
    auto switch_time = std::chrono::milliseconds(static_cast<int>(cfg.setup.switch_time * 1000.0f));

    auto last_log = std::chrono::steady_clock::now();
    double render_time_acc = 0.0;
    double send_time_acc = 0.0;
    size_t chunks_sent_acc = 0;
    size_t chunks_skipped_acc = 0;
    int frames = 0;
    int rc = 0;

    while (running) {
        const Panel* panel = cfg.NextActivePanel();
        if (!panel) {
            std::cerr << "No active panel" << std::endl;
            rc = 1;
            break;
        }
        std::cout << "Switching panel: " << panel->FriendlyName() << std::endl;
        auto panel_start = std::chrono::steady_clock::now();

        while (running) {
            auto update_start = std::chrono::steady_clock::now();

            RenderReport report;
            ImageRGBA frame;
            {
                SensorStore::Snapshot snapshot = store.Read();
                frame = renderer.render(*panel, snapshot.values(), report);
            }
            auto render_end = std::chrono::steady_clock::now();

            SendStats stats = lcd.SendFrame(frame);
            auto send_end = std::chrono::steady_clock::now();

            render_time_acc += std::chrono::duration<double>(render_end - update_start).count();
            send_time_acc += std::chrono::duration<double>(send_end - render_end).count();
            chunks_sent_acc += stats.chunks_sent;
            chunks_skipped_acc += stats.chunks_skipped;
            frames++;

            auto log_elapsed = std::chrono::duration_cast<std::chrono::seconds>(send_end - last_log).count();
            if (log_elapsed >= 5) {
                std::cerr << "LCD PERF: frames=" << frames
                          << " render_ms=" << (render_time_acc * 1000.0)
                          << " send_ms=" << (send_time_acc * 1000.0)
                          << " chunks_sent=" << chunks_sent_acc
                          << " chunks_skipped=" << chunks_skipped_acc
                          << " sensor_errors=" << report.errors.size()
                          << std::endl;
                render_time_acc = 0.0;
                send_time_acc = 0.0;
                chunks_sent_acc = 0;
                chunks_skipped_acc = 0;
                frames = 0;
                last_log = send_end;
            }

            auto elapsed = std::chrono::steady_clock::now() - update_start;
            if (refresh > elapsed) {
                sleep_while_running(std::chrono::duration_cast<std::chrono::milliseconds>(refresh - elapsed));
            }
            if (std::chrono::steady_clock::now() - panel_start >= switch_time) break;
        }
    }

    if (metrics) metrics->Stop();
    if (prom) prom->Stop();
    watcher.Stop();
    return rc;
}

int main() {
    std::cout << "Starting aster-lcd..." << std::endl;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<AsterLcd> lcd;
    try {
        lcd = open_display();

        if (getenv_bool("ASTER_OFF", false)) {
            lcd->PowerOff();
            return 0;
        }
        if (getenv_bool("ASTER_ON", false)) {
            lcd->PowerOn();
            return 0;
        }

        lcd->Init();

        std::string image = getenv_string("ASTER_IMAGE", "");
        if (!image.empty()) {
            return run_image(*lcd, image);
        }

        std::string config_dir = getenv_string("ASTER_CONFIG_DIR", "cfg");
        MonitorConfig cfg = load_config(config_path(getenv_string("ASTER_CONFIG", "monitor.json"), config_dir));
        std::cout << "Starting sensor panel mode" << std::endl;
        int rc = run_panels(*lcd, cfg, config_dir);
        lcd->Close();
        std::cout << "Bye bye!" << std::endl;
        return rc;
    } catch (const LcdError& e) {
        std::cerr << "[LCD] " << e.what() << std::endl;
        return 2;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        if (lcd) lcd->Close();
        return 1;
    }
}
