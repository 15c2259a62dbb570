#include "PromClient.h"
#include "metrics.pb.h"
#include <gtest/gtest.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <string>
#include <utility>
#include <vector>

namespace prom = io::prometheus::client;

namespace {

// Length-delimited stream as served with encoding=delimited.
std::string encode_delimited(const std::vector<prom::MetricFamily>& families) {
    std::string out;
    {
        google::protobuf::io::StringOutputStream stream(&out);
        google::protobuf::io::CodedOutputStream coded(&stream);
        for (const auto& family : families) {
            std::string message = family.SerializeAsString();
            coded.WriteVarint32(static_cast<uint32_t>(message.size()));
            coded.WriteString(message);
        }
    }
    return out;
}

prom::MetricFamily http_requests_family() {
    prom::MetricFamily family;
    family.set_name("http_requests_total");
    family.set_type(prom::COUNTER);
    for (auto code : {std::make_pair("200", 1027.0), std::make_pair("400", 3.0)}) {
        prom::Metric* metric = family.add_metric();
        prom::LabelPair* method = metric->add_label();
        method->set_name("method");
        method->set_value("post");
        prom::LabelPair* status = metric->add_label();
        status->set_name("code");
        status->set_value(code.first);
        metric->mutable_counter()->set_value(code.second);
    }
    return family;
}

}  // namespace

TEST(PromText, ParsesMetricsWithLabels) {
    const char* input = R"(
# HELP http_requests_total The total number of HTTP requests.
# TYPE http_requests_total counter
http_requests_total{method="post",code="200"} 1027
http_requests_total{method="post",code="400"} 3
)";
    SensorValues sensors = parse_prom_text(input);
    ASSERT_EQ(2u, sensors.size());
    EXPECT_EQ("1027", sensors[R"(http_requests_total{method="post",code="200"})"]);
    EXPECT_EQ("3", sensors[R"(http_requests_total{method="post",code="400"})"]);
}

TEST(PromText, DropsTimestamps) {
    const char* input = R"(
http_requests_total{method="post",code="200"} 1027 1395066363000
http_requests_total{method="post",code="400"} 3 1395066363000
)";
    SensorValues sensors = parse_prom_text(input);
    ASSERT_EQ(2u, sensors.size());
    EXPECT_EQ("1027", sensors[R"(http_requests_total{method="post",code="200"})"]);
    EXPECT_EQ("3", sensors[R"(http_requests_total{method="post",code="400"})"]);
}

TEST(PromText, NormalizesExponentValues) {
    SensorValues sensors = parse_prom_text("process_resident_memory_bytes 1.5e+03\nup 1\n");
    EXPECT_EQ("1500", sensors["process_resident_memory_bytes"]);
    EXPECT_EQ("1", sensors["up"]);
}

TEST(PromText, ReplacesColonsInKeys) {
    SensorValues sensors = parse_prom_text("node:cpu_usage:rate5m 0.25\n");
    ASSERT_EQ(1u, sensors.count("node_cpu_usage_rate5m"));
    EXPECT_EQ("0.25", sensors["node_cpu_usage_rate5m"]);
}

TEST(PromText, SkipsCommentsAndMalformedLines) {
    SensorValues sensors = parse_prom_text("# comment\n\nnovalue\nbad_exp 1.2eX4\nok 2\n");
    ASSERT_EQ(1u, sensors.size());
    EXPECT_EQ("2", sensors["ok"]);
}

TEST(PromProtobuf, ParsesDelimitedFamilies) {
    prom::MetricFamily gauge;
    gauge.set_name("node:load1");
    gauge.set_type(prom::GAUGE);
    gauge.add_metric()->mutable_gauge()->set_value(0.5);

    prom::MetricFamily untyped;
    untyped.set_name("build_info");
    untyped.set_type(prom::UNTYPED);
    untyped.add_metric();

    SensorValues sensors;
    ASSERT_TRUE(parse_prom_protobuf(encode_delimited({http_requests_family(), gauge, untyped}), sensors));
    ASSERT_EQ(4u, sensors.size());
    EXPECT_EQ("1027", sensors[R"(http_requests_total{method="post",code="200"})"]);
    EXPECT_EQ("3", sensors[R"(http_requests_total{method="post",code="400"})"]);
    EXPECT_EQ("0.5", sensors["node_load1"]);
    EXPECT_EQ("0", sensors["build_info"]);
}

TEST(PromProtobuf, SkipsUnsupportedAndIncompleteMetrics) {
    prom::MetricFamily summary;
    summary.set_name("rpc_duration_seconds");
    summary.set_type(prom::SUMMARY);
    summary.add_metric()->mutable_summary()->set_sample_count(3);

    prom::MetricFamily gauge;
    gauge.set_name("temperature");
    gauge.set_type(prom::GAUGE);
    gauge.add_metric();  // no gauge field
    gauge.add_metric()->mutable_gauge()->set_value(41.5);

    SensorValues sensors;
    ASSERT_TRUE(parse_prom_protobuf(encode_delimited({summary, gauge}), sensors));
    ASSERT_EQ(1u, sensors.size());
    EXPECT_EQ("41.5", sensors["temperature"]);
}

TEST(PromProtobuf, TruncatedStreamKeepsCompleteFamilies) {
    std::string data = encode_delimited({http_requests_family(), http_requests_family()});
    data.resize(data.size() - 5);
    SensorValues sensors;
    EXPECT_TRUE(parse_prom_protobuf(data, sensors));
    EXPECT_EQ(2u, sensors.size());
}

TEST(PromProtobuf, RejectsGarbage) {
    SensorValues sensors;
    // length prefix 2 followed by an invalid wire type
    EXPECT_FALSE(parse_prom_protobuf(std::string("\x02\xff\xff", 3), sensors));
    EXPECT_FALSE(parse_prom_protobuf(std::string("\xff", 1), sensors));
}

TEST(PromResponse, SelectsFormatByContentType) {
    EXPECT_TRUE(is_protobuf_content_type("application/vnd.google.protobuf"));
    EXPECT_TRUE(is_protobuf_content_type(
        "application/vnd.google.protobuf; proto=io.prometheus.client.MetricFamily; encoding=delimited"));
    EXPECT_FALSE(is_protobuf_content_type("text/plain"));
    EXPECT_FALSE(is_protobuf_content_type("text/plain; version=0.0.4"));

    SensorValues sensors;
    ASSERT_TRUE(parse_prom_response(encode_delimited({http_requests_family()}),
                                    "application/vnd.google.protobuf", sensors));
    EXPECT_EQ(2u, sensors.size());

    sensors.clear();
    ASSERT_TRUE(parse_prom_response("up 1\n", "text/plain; version=0.0.4", sensors));
    EXPECT_EQ("1", sensors["up"]);
}
