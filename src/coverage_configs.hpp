// coverage_configs.hpp
// Pre-configured coverage measurement instantiations using policy-based design
//
// Template parameters of CoverageMeasurement:
//   - Api:       control::ControlServerClient<SSLPolicy>
//   - Transport: transport::UdpSocket<EventPolicy> or LoopbackTransport
//   - Store:     persistence::FenceStore
//   - Clock:     RealClock or VirtualClock
//
#pragma once

#include "coverage_measurement.hpp"
#include "control/control_server_client.hpp"
#include "persistence/fence_store.hpp"
#include "policy/event.hpp"
#include "policy/ssl.hpp"
#include "transport/udp_socket.hpp"

namespace coverage {

// ============================================================================
// Configuration 1: Production (TLS control server, UDP pings, SQLite)
// ============================================================================
// Policy composition:
//   - SSLPolicy: OpenSSLPolicy (peer verification on by default)
//   - EventPolicy: EpollPolicy (SelectPolicy with USE_SELECT)
//   - Transport: connected UdpSocket, single receive-await

using DefaultSSLPolicy = ssl::OpenSSLPolicy;
using DefaultControlClient = control::ControlServerClient<DefaultSSLPolicy>;
using DefaultPingTransport = transport::UdpSocket<DefaultEventPolicy>;

using DefaultCoverageMeasurement = CoverageMeasurement<
    DefaultControlClient,
    DefaultPingTransport,
    persistence::FenceStore,
    RealClock
>;

// ============================================================================
// Configuration 2: Plaintext control server (local test servers)
// ============================================================================

using PlainControlClient = control::ControlServerClient<ssl::NoSSLPolicy>;

using PlainCoverageMeasurement = CoverageMeasurement<
    PlainControlClient,
    DefaultPingTransport,
    persistence::FenceStore,
    RealClock
>;

} // namespace coverage
