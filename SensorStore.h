#ifndef SENSOR_STORE_H
#define SENSOR_STORE_H

#include <atomic>
#include <mutex>
#include <regex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// label -> value. "<label>#unit" holds an optional unit override.
using SensorValues = std::unordered_map<std::string, std::string>;

// Shared sensor values, written by background producers and read by the render loop.
class SensorStore {
public:
    // Read-only view that keeps the read lock until it goes out of scope.
    class Snapshot {
    public:
        Snapshot(std::shared_mutex& mutex, const SensorValues& values)
            : lock_(mutex), values_(&values) {}

        const SensorValues& values() const { return *values_; }
        const std::string* find(const std::string& label) const {
            auto it = values_->find(label);
            return it == values_->end() ? nullptr : &it->second;
        }

    private:
        std::shared_lock<std::shared_mutex> lock_;
        const SensorValues* values_;
    };

    Snapshot Read() const { return Snapshot(mutex_, values_); }

    // Merge a bulk update under the write lock.
    void Update(const SensorValues& values);
    void Set(const std::string& label, const std::string& value);
    size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    SensorValues values_;
};

bool is_filtered(const std::string& key, const std::vector<std::regex>& filters);

// "key: value" lines; blank and '#' lines are skipped. Returns false if the file can't be read.
bool read_key_value_file(const std::string& path, SensorValues& values,
                         const std::vector<std::regex>& filters);

// One regex per line; invalid expressions are skipped with a warning.
std::vector<std::regex> read_filter_file(const std::string& path);

// Reads a sensor value file, or every *.txt file of a directory, and keeps the store
// updated from an inotify watch on a worker thread.
class SensorFileWatcher {
public:
    SensorFileWatcher(const std::string& path, SensorStore& store,
                      std::vector<std::regex> filters = {});
    ~SensorFileWatcher();

    // Initial read of all files. Returns false if the path does not exist.
    bool ReadAll();
    void Start();
    void Stop();
    // True while the inotify watch is active.
    bool Watching() const { return watching_; }

private:
    void worker();
    void readFile(const std::string& file);

    std::string path_;
    std::string watch_dir_;
    std::string watch_file_;  // set when watching a single file
    SensorStore& store_;
    std::vector<std::regex> filters_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> watching_{false};
    bool debug_ = false;
};

#endif // SENSOR_STORE_H
