// test/unittest/test_control_server_client.cpp
// ControlServerClient over plaintext against a scripted local HTTP server

#include "control/control_server_client.hpp"
#include "core/json.hpp"
#include "test_harness.hpp"
#include <atomic>
#include <cstring>
#include <mutex>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace coverage;
using namespace coverage::control;

using PlainClient = ControlServerClient<ssl::NoSSLPolicy>;

// Helper: answers each connection with the next canned response
struct HttpResponder {
    int listen_fd;
    uint16_t port;
    std::vector<std::string> responses;
    std::vector<std::string> requests;
    std::mutex mutex;
    std::thread thread;

    explicit HttpResponder(std::vector<std::string> canned)
        : listen_fd(-1), port(0), responses(std::move(canned)) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (bind(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
            listen(listen_fd, 4) < 0) {
            close(listen_fd);
            throw std::runtime_error("listen socket setup failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);

        thread = std::thread([this]() { serve(); });
    }

    ~HttpResponder() {
        if (thread.joinable()) thread.join();
        close(listen_fd);
    }

    void serve() {
        for (const auto& response : responses) {
            int fd = accept(listen_fd, nullptr, nullptr);
            if (fd < 0) return;

            std::string request = read_request(fd);
            {
                std::lock_guard<std::mutex> lock(mutex);
                requests.push_back(request);
            }
            send(fd, response.data(), response.size(), MSG_NOSIGNAL);
            close(fd);
        }
    }

    static std::string read_request(int fd) {
        std::string data;
        char buf[4096];
        size_t expected = std::string::npos;
        while (expected == std::string::npos || data.size() < expected) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            data.append(buf, static_cast<size_t>(n));

            size_t header_end = data.find("\r\n\r\n");
            if (expected == std::string::npos && header_end != std::string::npos) {
                size_t cl = data.find("Content-Length: ");
                size_t body_len = cl == std::string::npos ? 0 : std::stoul(data.substr(cl + 16));
                expected = header_end + 4 + body_len;
            }
        }
        return data;
    }

    std::string request(size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.at(i);
    }
};

static std::string http_response(int status, const std::string& reason, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + body;
}

static ControlServerConfig local_config(uint16_t port) {
    ControlServerConfig c;
    c.host = "127.0.0.1";
    c.port = port;
    c.use_tls = false;
    c.socket.connect_timeout_ms = 1000;
    c.socket.io_timeout_ms = 2000;
    return c;
}

static const char* COVERAGE_BODY =
    "{\"test_uuid\":\"b3f1c2\",\"ping_token\":\"AAEC\",\"ping_host\":\"udp.example.net\","
    "\"ping_port\":444,\"ip_version\":4,\"max_coverage_session_seconds\":7200,"
    "\"max_coverage_measurement_seconds\":600}";

TEST(request_coverage_success) {
    HttpResponder server({http_response(200, "OK", COVERAGE_BODY)});
    ControlServerConfig config = local_config(server.port);
    config.client_uuid = std::string("client-1");
    PlainClient client(config);

    CoverageResponse r = client.request_coverage(std::string("prev"), ms_to_us(1700000000000LL));
    server.thread.join();

    ASSERT_EQ(r.credentials.test_uuid, "b3f1c2");
    ASSERT_EQ(r.credentials.ping_port, 444);
    ASSERT_TRUE(r.credentials.ip_version == IpVersion::V4);
    ASSERT_EQ(*r.credentials.loop_uuid, "prev");
    ASSERT_EQ(*r.max_coverage_session_seconds, 7200);

    std::string req = server.request(0);
    ASSERT_TRUE(req.rfind("POST /RMBTControlServer/coverageRequest HTTP/1.1\r\n", 0) == 0);
    std::string body = req.substr(req.find("\r\n\r\n") + 4);
    ASSERT_EQ(*json::find_string(body, "loop_uuid"), "prev");
    ASSERT_EQ(*json::find_string(body, "client_uuid"), "client-1");
    ASSERT_EQ(*json::find_int(body, "time"), 1700000000000LL);
}

TEST(submit_result_success) {
    HttpResponder server({http_response(200, "OK", "{}")});
    PlainClient client(local_config(server.port));

    Fence f(LocationSample(Coordinate(48.2, 16.3), 5.0, ms_to_us(2000)), std::nullopt, 20.0,
            std::string("b3f1c2"));
    f.date_exited = ms_to_us(3000);
    client.submit_coverage_result("b3f1c2", {f}, ms_to_us(1000));
    server.thread.join();

    std::string req = server.request(0);
    ASSERT_TRUE(req.find("/RMBTControlServer/coverageResult") != std::string::npos);
    std::string body = req.substr(req.find("\r\n\r\n") + 4);
    ASSERT_EQ(*json::find_string(body, "test_uuid"), "b3f1c2");
    ASSERT_EQ(*json::find_int(body, "offset_ms"), 1000);
    ASSERT_EQ(*json::find_int(body, "duration_ms"), 1000);
}

TEST(rejected_status_raises) {
    HttpResponder server({http_response(406, "Not Acceptable", "{\"error\":[\"bad\"]}")});
    PlainClient client(local_config(server.port));

    int status = -1;
    try {
        client.submit_coverage_result("b3f1c2", {}, 0);
    } catch (const SubmissionError& e) {
        status = e.status();
    }
    server.thread.join();
    ASSERT_EQ(status, 406);
}

TEST(acceptable_status_codes) {
    HttpResponder server({http_response(409, "Conflict", "{}")});
    ControlServerConfig config = local_config(server.port);
    config.acceptable_status_codes.insert(409);
    PlainClient client(config);

    http::Response r = client.post("/coverageResult", "{}");
    server.thread.join();
    ASSERT_EQ(r.status, 409);
}

TEST(malformed_response_is_transport_failure) {
    HttpResponder server({"this is not http\r\n\r\n"});
    PlainClient client(local_config(server.port));

    int status = -1;
    try {
        client.post("/coverageRequest", "{}");
    } catch (const SubmissionError& e) {
        status = e.status();
    }
    server.thread.join();
    ASSERT_EQ(status, 0);
}

TEST(incomplete_credentials_rejected) {
    HttpResponder server({http_response(200, "OK", "{\"test_uuid\":\"x\"}")});
    PlainClient client(local_config(server.port));

    bool threw = false;
    try {
        client.request_coverage(std::nullopt, 0);
    } catch (const SubmissionError&) {
        threw = false;
    } catch (const std::runtime_error&) {
        threw = true;
    }
    server.thread.join();
    ASSERT_TRUE(threw);
}

TEST(connection_refused) {
    // Reserve a port, then free it so nothing listens there
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    uint16_t port = ntohs(addr.sin_port);
    close(fd);

    PlainClient client(local_config(port));
    int status = -1;
    try {
        client.request_coverage(std::nullopt, 0);
    } catch (const SubmissionError& e) {
        status = e.status();
    }
    ASSERT_EQ(status, 0);
}

TEST(config_from_env) {
    setenv("COV_CONTROL_HOST", "control.example.net", 1);
    setenv("COV_CONTROL_PORT", "8443", 1);
    setenv("COV_CONTROL_TLS", "0", 1);
    setenv("COV_CONTROL_INSECURE", "1", 1);
    setenv("COV_CLIENT_UUID", "c-9", 1);
    ControlServerConfig c = ControlServerConfig::from_env();
    unsetenv("COV_CONTROL_HOST");
    unsetenv("COV_CONTROL_PORT");
    unsetenv("COV_CONTROL_TLS");
    unsetenv("COV_CONTROL_INSECURE");
    unsetenv("COV_CLIENT_UUID");

    ASSERT_EQ(c.host, "control.example.net");
    ASSERT_EQ(c.port, 8443);
    ASSERT_FALSE(c.use_tls);
    ASSERT_FALSE(c.verify_peer);
    ASSERT_EQ(*c.client_uuid, "c-9");
    ASSERT_EQ(c.path_prefix, "/RMBTControlServer");
}

int main() {
    return run_all_tests("ControlServerClient");
}
