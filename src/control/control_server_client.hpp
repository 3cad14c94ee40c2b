// control/control_server_client.hpp
// Control-server client for coverage session tokens and result submission
//
// One short-lived connection per request (Connection: close), TLS through the
// SSL policy. Any HTTP status outside [200, 300) raises SubmissionError unless
// it is listed in ControlServerConfig::acceptable_status_codes.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/http.hpp"
#include "../core/timing.hpp"
#include "../model/fence.hpp"
#include "../policy/ssl.hpp"
#include "../transport/tcp_socket.hpp"
#include "../transport/transport_policy.hpp"
#include "coverage_api.hpp"

namespace coverage {
namespace control {

/**
 * Control server configuration
 */
struct ControlServerConfig {
    std::string host;
    uint16_t port;
    bool use_tls;
    bool verify_peer;
    std::string path_prefix;                 // prepended to endpoint paths
    std::optional<std::string> client_uuid;
    std::set<int> acceptable_status_codes;   // non-2xx codes treated as success (default: none)
    transport::TcpSocketConfig socket;

    ControlServerConfig()
        : host("localhost")
        , port(443)
        , use_tls(true)
        , verify_peer(true)
        , path_prefix("/RMBTControlServer")
    {}

    /**
     * Defaults overridden by COV_CONTROL_HOST, COV_CONTROL_PORT, COV_CONTROL_TLS,
     * COV_CONTROL_PREFIX, COV_CONTROL_INSECURE, COV_CLIENT_UUID
     */
    static ControlServerConfig from_env() {
        ControlServerConfig c;
        if (const char* v = getenv("COV_CONTROL_HOST")) c.host = v;
        if (const char* v = getenv("COV_CONTROL_PORT")) {
            int port = atoi(v);
            if (port > 0 && port <= 65535) c.port = static_cast<uint16_t>(port);
        }
        if (const char* v = getenv("COV_CONTROL_TLS")) c.use_tls = atoi(v) != 0;
        if (const char* v = getenv("COV_CONTROL_PREFIX")) c.path_prefix = v;
        if (const char* v = getenv("COV_CONTROL_INSECURE")) c.verify_peer = atoi(v) == 0;
        if (const char* v = getenv("COV_CLIENT_UUID")) c.client_uuid = std::string(v);
        return c;
    }
};

/**
 * ControlServerClient - HTTP(S) client for the coverage endpoints
 *
 * @tparam SSLPolicy OpenSSLPolicy for TLS, NoSSLPolicy for plaintext
 */
template<typename SSLPolicy>
class ControlServerClient {
public:
    explicit ControlServerClient(ControlServerConfig config = ControlServerConfig())
        : config_(std::move(config)) {}

    /**
     * POST /coverageRequest
     *
     * @param loop_uuid test_uuid of the preceding sub-session, if any
     * @throws SubmissionError on transport failure or non-success status
     * @throws std::runtime_error if the response lacks required fields
     */
    CoverageResponse request_coverage(const std::optional<std::string>& loop_uuid, Timestamp now) {
        std::string body = encode_coverage_request(now, loop_uuid, config_.client_uuid);
        http::Response response = post("/coverageRequest", body);
        return decode_coverage_response(response.body, loop_uuid);
    }

    /**
     * POST /coverageResult
     *
     * @throws SubmissionError on transport failure or non-success status
     */
    void submit_coverage_result(const std::string& test_uuid, const std::vector<Fence>& fences,
                                Timestamp anchor) {
        std::string body = encode_coverage_result(test_uuid, fences, anchor, config_.client_uuid);
        post("/coverageResult", body);
        printf("[Control] Submitted %zu fences for %s\n", fences.size(), test_uuid.c_str());
    }

    /**
     * Send one request and read the full response
     *
     * @throws SubmissionError on transport failure or rejected status
     */
    http::Response post(const std::string& endpoint, const std::string& body) {
        std::string path = config_.path_prefix + endpoint;
        std::string request = http::build_post_request(config_.host, path, {}, body);

        std::string raw;
        try {
            transport::TransportPolicy<transport::TcpSocket, SSLPolicy> conn;
            conn.ssl.set_verify_peer(config_.verify_peer);
            conn.init(config_.socket);
            conn.connect(config_.host.c_str(), config_.port);
            conn.ssl_handshake();

            size_t sent = 0;
            while (sent < request.size()) {
                ssize_t n = conn.ssl_send(request.data() + sent, request.size() - sent);
                if (n <= 0) {
                    throw std::runtime_error(std::string("send failed: ") + strerror(errno));
                }
                sent += static_cast<size_t>(n);
            }

            http::Response response;
            char buf[8192];
            for (;;) {
                ssize_t n = conn.ssl_recv(buf, sizeof(buf));
                bool eof = n <= 0;
                if (n > 0) raw.append(buf, static_cast<size_t>(n));

                http::ParseResult pr = http::parse_response(raw.data(), raw.size(), eof, response);
                if (pr == http::ParseResult::Complete) break;
                if (pr == http::ParseResult::Invalid || eof) {
                    throw std::runtime_error("malformed HTTP response");
                }
            }
            conn.close();

            if (!http::is_success(response.status) &&
                config_.acceptable_status_codes.count(response.status) == 0) {
                printf("[Control] POST %s -> HTTP %d\n", path.c_str(), response.status);
                throw SubmissionError(response.status, "HTTP " + std::to_string(response.status) + " from " + path);
            }
            return response;
        } catch (const SubmissionError&) {
            throw;
        } catch (const std::runtime_error& e) {
            printf("[Control] POST %s failed: %s\n", path.c_str(), e.what());
            throw SubmissionError(0, std::string(path) + ": " + e.what());
        }
    }

    const ControlServerConfig& config() const { return config_; }

private:
    ControlServerConfig config_;
};

} // namespace control
} // namespace coverage
