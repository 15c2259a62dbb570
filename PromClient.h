#ifndef PROM_CLIENT_H
#define PROM_CLIENT_H

#include "SensorStore.h"
#include <atomic>
#include <regex>
#include <string>
#include <thread>
#include <vector>

const char* const PROM_ACCEPT_TEXT = "text/plain;version=0.0.4;q=0.3";
const char* const PROM_ACCEPT_PROTOBUF =
    "application/vnd.google.protobuf;proto=io.prometheus.client.MetricFamily;"
    "encoding=delimited;q=0.7,text/plain;version=0.0.4;q=0.3";

// Parse the Prometheus text exposition format into sensor values. Metric names with
// their label set become keys (':' replaced by '_'); trailing timestamps are dropped.
SensorValues parse_prom_text(const std::string& content);

// Parse varint length-delimited MetricFamily messages. Counter, gauge and untyped
// metrics become `name{label="value",...}` keys like in the text format; summaries and
// histograms are skipped. Returns false on a malformed message.
bool parse_prom_protobuf(const std::string& data, SensorValues& out);

bool is_protobuf_content_type(const std::string& content_type);

// Dispatch on the response Content-Type.
bool parse_prom_response(const std::string& body, const std::string& content_type,
                         SensorValues& out);

// Periodically scrapes a Prometheus endpoint and merges the metrics into a SensorStore.
class PromClient {
public:
    PromClient(const std::string& url, SensorStore& store, std::vector<std::regex> filters = {});
    ~PromClient();

    void Start();
    void Stop();

    // One scrape. Returns false on HTTP errors.
    bool Poll();

private:
    void worker();
    bool httpGet(const std::string& url, std::string& out, std::string& content_type) const;

    std::string url_;
    int poll_ms_ = 5000;
    long connect_timeout_s_ = 3;
    long timeout_s_ = 5;
    bool protobuf_ = false;
    SensorStore& store_;
    std::vector<std::regex> filters_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    bool debug_ = false;
};

#endif // PROM_CLIENT_H
