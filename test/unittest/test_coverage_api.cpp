// test/unittest/test_coverage_api.cpp
// Unit tests for the coverage control-server request/response bodies

#include "control/coverage_api.hpp"
#include "core/json.hpp"
#include "test_harness.hpp"

using namespace coverage;
using namespace coverage::control;

static Fence make_fence(Timestamp entered, std::optional<Timestamp> exited, double accuracy) {
    Fence f(LocationSample(Coordinate(48.2082, 16.3738), accuracy, entered),
            RadioTechnologySample(RadioTechnology::LTE, entered), 20.0, std::string("t-1"));
    f.date_exited = exited;
    return f;
}

TEST(request_body) {
    std::string body = encode_coverage_request(1700000000123456LL, std::nullopt);
    ASSERT_EQ(*json::find_int(body, "time"), 1700000000123LL);
    ASSERT_EQ(*json::find_string(body, "measurement_type"), "dedicated");
    ASSERT_TRUE(body.find("loop_uuid") == std::string::npos);

    std::string chained = encode_coverage_request(0, std::string("prev-uuid"), std::string("client"));
    ASSERT_EQ(*json::find_string(chained, "loop_uuid"), "prev-uuid");
    ASSERT_EQ(*json::find_string(chained, "client_uuid"), "client");
}

TEST(response_decoding) {
    std::string body = "{\"test_uuid\":\"t-1\",\"ping_token\":\"AAEC\",\"ping_host\":\"udp.example.net\","
                       "\"ping_port\":444,\"ip_version\":6,\"max_coverage_session_seconds\":3600,"
                       "\"max_coverage_measurement_seconds\":\"600\"}";
    CoverageResponse r = decode_coverage_response(body, std::string("loop"));

    ASSERT_EQ(r.credentials.test_uuid, "t-1");
    ASSERT_EQ(r.credentials.ping_token, "AAEC");
    ASSERT_EQ(r.credentials.ping_host, "udp.example.net");
    ASSERT_EQ(r.credentials.ping_port, 444);
    ASSERT_TRUE(r.credentials.ip_version == IpVersion::V6);
    ASSERT_EQ(*r.credentials.loop_uuid, "loop");
    ASSERT_EQ(*r.max_coverage_session_seconds, 3600);
    ASSERT_EQ(*r.max_coverage_measurement_seconds, 600);
}

TEST(response_optional_fields_absent) {
    std::string body = "{\"test_uuid\":\"t-2\",\"ping_token\":\"AA==\",\"ping_host\":\"h\",\"ping_port\":1}";
    CoverageResponse r = decode_coverage_response(body, std::nullopt);

    ASSERT_TRUE(r.credentials.ip_version == IpVersion::Any);
    ASSERT_FALSE(r.credentials.loop_uuid.has_value());
    ASSERT_FALSE(r.max_coverage_session_seconds.has_value());
    ASSERT_FALSE(r.max_coverage_measurement_seconds.has_value());
}

TEST(response_missing_required) {
    ASSERT_THROWS(decode_coverage_response("{\"ping_token\":\"AA==\",\"ping_host\":\"h\",\"ping_port\":1}",
                                           std::nullopt), std::runtime_error);
    ASSERT_THROWS(decode_coverage_response("{\"test_uuid\":\"t\",\"ping_token\":\"AA==\",\"ping_host\":\"h\","
                                           "\"ping_port\":70000}", std::nullopt), std::runtime_error);
}

TEST(offset_sign) {
    // Fences before the anchor (offline period) get negative offsets
    ASSERT_EQ(offset_ms(ms_to_us(5000), ms_to_us(6000)), -1000);
    ASSERT_EQ(offset_ms(ms_to_us(6000), ms_to_us(5000)), 1000);
    ASSERT_EQ(offset_ms(1499, 0), 1);
    ASSERT_EQ(offset_ms(1500, 0), 2);
    ASSERT_EQ(offset_ms(0, 0), 0);
}

TEST(result_body) {
    Fence closed = make_fence(ms_to_us(10000), ms_to_us(12500), 4.5);
    closed.pings.push_back(PingOutcome::success(ms_to_us(10100), 20000));
    closed.pings.push_back(PingOutcome::success(ms_to_us(10200), 30000));

    Fence unknown_accuracy = make_fence(ms_to_us(12500), std::nullopt, -1.0);
    unknown_accuracy.technologies.clear();

    std::string body = encode_coverage_result("t-1", {closed, unknown_accuracy}, ms_to_us(11000));

    ASSERT_EQ(*json::find_string(body, "test_uuid"), "t-1");
    ASSERT_TRUE(body.find("client_uuid") == std::string::npos);

    // First fence
    ASSERT_EQ(*json::find_int(body, "timestamp_microseconds"), 10000000);
    ASSERT_EQ(*json::find_int(body, "offset_ms"), -1000);
    ASSERT_EQ(*json::find_int(body, "duration_ms"), 2500);
    ASSERT_EQ(*json::find_int(body, "radius_m"), 20);
    ASSERT_EQ(*json::find_string(body, "technology"), "4G/LTE");
    ASSERT_EQ(*json::find_int(body, "technology_id"), 13);
    ASSERT_EQ(*json::find_int(body, "avg_ping_ms"), 25);
    ASSERT_NEAR(*json::find_double(body, "latitude"), 48.2082, 1e-9);
    ASSERT_NEAR(*json::find_double(body, "accuracy"), 4.5, 1e-9);

    // Second fence: no exit, no technology, no pings, no accuracy
    std::string second = body.substr(body.find("},{") + 2);
    ASSERT_EQ(*json::find_int(second, "offset_ms"), 1500);
    ASSERT_TRUE(second.find("duration_ms") == std::string::npos);
    ASSERT_TRUE(second.find("technology") == std::string::npos);
    ASSERT_TRUE(second.find("avg_ping_ms") == std::string::npos);
    ASSERT_TRUE(second.find("accuracy") == std::string::npos);
}

int main() {
    return run_all_tests("Coverage API");
}
