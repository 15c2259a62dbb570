#include "SensorStore.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

void SensorStore::Update(const SensorValues& values) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& kv : values) {
        values_[kv.first] = kv.second;
    }
}

void SensorStore::Set(const std::string& label, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    values_[label] = value;
}

size_t SensorStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return values_.size();
}

bool is_filtered(const std::string& key, const std::vector<std::regex>& filters) {
    for (const auto& re : filters) {
        if (std::regex_search(key, re)) return true;
    }
    return false;
}

bool read_key_value_file(const std::string& path, SensorValues& values,
                         const std::vector<std::regex>& filters) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Sensors] Failed to read sensor file " << path << std::endl;
        return false;
    }
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t sep = line.find(':');
        if (sep == std::string::npos) {
            std::cerr << "[Sensors] Skipping invalid entry in sensor value file: " << line << std::endl;
            continue;
        }
        std::string key = trim(line.substr(0, sep));
        if (is_filtered(key, filters)) continue;
        values[key] = trim(line.substr(sep + 1));
    }
    return true;
}

std::vector<std::regex> read_filter_file(const std::string& path) {
    std::vector<std::regex> filters;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Sensors] Failed to open sensor filter file " << path << std::endl;
        return filters;
    }
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        try {
            filters.emplace_back(line);
        } catch (const std::regex_error& e) {
            std::cerr << "[Sensors] Skipping invalid filter in sensor filter file: " << line
                      << ": " << e.what() << std::endl;
        }
    }
    return filters;
}

static bool has_txt_extension(const std::string& name) {
    return name.size() > 4 && name.compare(name.size() - 4, 4, ".txt") == 0;
}

SensorFileWatcher::SensorFileWatcher(const std::string& path, SensorStore& store,
                                     std::vector<std::regex> filters)
    : path_(path), store_(store), filters_(std::move(filters)) {
    debug_ = getenv_bool("ASTER_DEBUG", false);
    std::error_code ec;
    if (fs::is_directory(path_, ec)) {
        watch_dir_ = path_;
    } else {
        fs::path p(path_);
        watch_dir_ = p.has_parent_path() ? p.parent_path().string() : ".";
        watch_file_ = p.filename().string();
    }
}

SensorFileWatcher::~SensorFileWatcher() {
    Stop();
}

void SensorFileWatcher::readFile(const std::string& file) {
    SensorValues values;
    if (read_key_value_file(file, values, filters_)) {
        store_.Update(values);
    }
}

bool SensorFileWatcher::ReadAll() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        std::cerr << "[Sensors] Sensor path " << path_ << " does not exist" << std::endl;
        return false;
    }
    if (!watch_file_.empty()) {
        readFile(path_);
        return true;
    }
    for (const auto& entry : fs::directory_iterator(path_, ec)) {
        if (entry.is_regular_file(ec) && has_txt_extension(entry.path().filename().string())) {
            readFile(entry.path().string());
        }
    }
    return true;
}

void SensorFileWatcher::Start() {
    if (worker_.joinable()) return;
    running_ = true;
    worker_ = std::thread(&SensorFileWatcher::worker, this);
}

void SensorFileWatcher::Stop() {
    running_ = false;
    if (worker_.joinable()) worker_.join();
}

void SensorFileWatcher::worker() {
    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        std::cerr << "[Sensors] Failed to initialize watcher: " << std::strerror(errno) << std::endl;
        return;
    }
    int wd = inotify_add_watch(fd, watch_dir_.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO);
    if (wd < 0) {
        std::cerr << "[Sensors] Failed to start file watcher for " << watch_dir_ << ": "
                  << std::strerror(errno) << std::endl;
        close(fd);
        return;
    }
    watching_ = true;
    std::cout << "[Sensors] Watching " << path_ << " with " << filters_.size() << " filters"
              << std::endl;

    alignas(struct inotify_event) char buf[4096];
    while (running_) {
        struct pollfd pfd = {fd, POLLIN, 0};
        int r = poll(&pfd, 1, 500);
        if (r <= 0) continue;

        ssize_t len = read(fd, buf, sizeof(buf));
        if (len <= 0) continue;
        for (char* p = buf; p < buf + len;) {
            auto* event = reinterpret_cast<struct inotify_event*>(p);
            p += sizeof(struct inotify_event) + event->len;
            if (event->len == 0) continue;
            std::string name(event->name);
            bool wanted = watch_file_.empty() ? has_txt_extension(name) : name == watch_file_;
            if (!wanted) continue;
            std::string file = (fs::path(watch_dir_) / name).string();
            if (debug_) {
                std::cout << "[Sensors] Modified sensor file: " << file << std::endl;
            }
            readFile(file);
        }
    }

    watching_ = false;
    inotify_rm_watch(fd, wd);
    close(fd);
}
