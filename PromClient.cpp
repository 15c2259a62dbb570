#include "PromClient.h"
#include "metrics.pb.h"
#include "utils.h"
#include <curl/curl.h>
#include <google/protobuf/io/coded_stream.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace prom = io::prometheus::client;

static size_t write_string_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<const char*>(contents), total);
    return total;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

static std::string number_to_string(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    return buf;
}

static void replace_colons(std::string& key) {
    // ':' is the key/value separator of sensor files
    std::replace(key.begin(), key.end(), ':', '_');
}

SensorValues parse_prom_text(const std::string& content) {
    SensorValues sensors;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t last = line.rfind(' ');
        if (last == std::string::npos) continue;
        std::string head = line.substr(0, last);
        std::string tail = line.substr(last + 1);

        std::string key;
        std::string value;
        double number;
        size_t prev = head.rfind(' ');
        if (prev != std::string::npos && parse_double(head.substr(prev + 1), number)) {
            // "<metric> <value> <timestamp>"
            key = head.substr(0, prev);
            value = number_to_string(number);
        } else {
            key = head;
            if (tail.size() > 4 && tail.find('e') != std::string::npos) {
                if (!parse_double(tail, number)) {
                    std::cerr << "[Prom] Invalid metric value: " << line << std::endl;
                    continue;
                }
                value = number_to_string(number);
            } else {
                value = tail;
            }
        }

        replace_colons(key);
        sensors[key] = value;
    }
    return sensors;
}

bool is_protobuf_content_type(const std::string& content_type) {
    std::string lower = content_type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("protobuf") != std::string::npos;
}

static bool metric_value(const prom::Metric& metric, prom::MetricType type, double& value,
                         std::string& error) {
    switch (type) {
        case prom::COUNTER:
            if (!metric.has_counter()) {
                error = "counter metric missing counter field";
                return false;
            }
            value = metric.counter().value();
            return true;
        case prom::GAUGE:
            if (!metric.has_gauge()) {
                error = "gauge metric missing gauge field";
                return false;
            }
            value = metric.gauge().value();
            return true;
        case prom::SUMMARY:
            error = "summary metrics are not supported";
            return false;
        case prom::HISTOGRAM:
        case prom::GAUGE_HISTOGRAM:
            error = "histogram metrics are not supported";
            return false;
        case prom::UNTYPED:
            break;
    }
    value = metric.has_untyped() ? metric.untyped().value() : 0.0;
    return true;
}

static void add_metric_family(const prom::MetricFamily& family, SensorValues& out) {
    for (const prom::Metric& metric : family.metric()) {
        double value = 0.0;
        std::string error;
        if (!metric_value(metric, family.type(), value, error)) {
            std::cerr << "[Prom] Failed to convert metric " << family.name() << ": " << error
                      << std::endl;
            continue;
        }
        std::string labels;
        for (const prom::LabelPair& pair : metric.label()) {
            if (!pair.has_name() || !pair.has_value()) continue;
            if (!labels.empty()) labels += ",";
            labels += pair.name() + "=\"" + pair.value() + "\"";
        }
        std::string key = labels.empty() ? family.name() : family.name() + "{" + labels + "}";
        replace_colons(key);
        out[key] = number_to_string(value);
    }
}

bool parse_prom_protobuf(const std::string& data, SensorValues& out) {
    const auto* buffer = reinterpret_cast<const uint8_t*>(data.data());
    const int size = static_cast<int>(data.size());
    google::protobuf::io::CodedInputStream input(buffer, size);

    while (input.CurrentPosition() < size) {
        uint32_t length = 0;
        if (!input.ReadVarint32(&length)) {
            std::cerr << "[Prom] Invalid message length prefix" << std::endl;
            return false;
        }
        int offset = input.CurrentPosition();
        if (length > static_cast<uint32_t>(size - offset)) {
            std::cerr << "[Prom] Truncated metric family at offset " << offset << std::endl;
            break;
        }
        prom::MetricFamily family;
        if (!family.ParseFromArray(buffer + offset, static_cast<int>(length))) {
            std::cerr << "[Prom] Failed to decode metric family at offset " << offset << std::endl;
            return false;
        }
        add_metric_family(family, out);
        if (!input.Skip(static_cast<int>(length))) return false;
    }
    return true;
}

bool parse_prom_response(const std::string& body, const std::string& content_type,
                         SensorValues& out) {
    if (is_protobuf_content_type(content_type)) {
        return parse_prom_protobuf(body, out);
    }
    out = parse_prom_text(body);
    return true;
}

PromClient::PromClient(const std::string& url, SensorStore& store, std::vector<std::regex> filters)
    : url_(url), store_(store), filters_(std::move(filters)) {
    poll_ms_ = getenv_int("ASTER_PROM_POLL_MS", 5000);
    protobuf_ = getenv_bool("ASTER_PROM_PROTOBUF", false);
    debug_ = getenv_bool("ASTER_DEBUG", false);
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

PromClient::~PromClient() {
    Stop();
    curl_global_cleanup();
}

void PromClient::Start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&PromClient::worker, this);
}

void PromClient::Stop() {
    if (!running_) return;
    running_ = false;
    if (worker_.joinable()) worker_.join();
}

bool PromClient::httpGet(const std::string& url, std::string& out,
                         std::string& content_type) const {
    CURL* curl = curl_easy_init();
    if (!curl) return false;
    out.clear();
    content_type = "text/plain";
    std::string accept = std::string("Accept: ") + (protobuf_ ? PROM_ACCEPT_PROTOBUF : PROM_ACCEPT_TEXT);
    struct curl_slist* headers = curl_slist_append(nullptr, accept.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_s_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    char* type = nullptr;
    if (res == CURLE_OK && curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &type) == CURLE_OK && type) {
        content_type = type;
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        std::cerr << "[Prom] Request to " << url << " failed: " << curl_easy_strerror(res) << std::endl;
        return false;
    }
    if (code != 200) {
        std::cerr << "[Prom] Request to " << url << " failed with status " << code << std::endl;
        return false;
    }
    return true;
}

bool PromClient::Poll() {
    std::string body;
    std::string content_type;
    if (!httpGet(url_, body, content_type)) return false;

    SensorValues metrics;
    if (!parse_prom_response(body, content_type, metrics)) {
        std::cerr << "[Prom] Failed to parse response from " << url_ << " (" << content_type << ")"
                  << std::endl;
        return false;
    }
    for (auto it = metrics.begin(); it != metrics.end();) {
        if (is_filtered(it->first, filters_)) {
            it = metrics.erase(it);
        } else {
            ++it;
        }
    }
    if (debug_) {
        std::cout << "[Prom] Scraped " << metrics.size() << " metrics from " << url_ << std::endl;
    }
    store_.Update(metrics);
    return true;
}

void PromClient::worker() {
    while (running_) {
        Poll();
        for (int waited = 0; running_ && waited < poll_ms_; waited += 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}
