#pragma once

// raslink - client connectivity for a remote terminal daemon
// Three transport families tried cheapest-first: LAN WebSocket, mesh-VPN UDP, WebRTC

// Core types and utilities
#include <raslink/common.hpp>
#include <raslink/config.hpp>
#include <raslink/endpoint.hpp>
#include <raslink/version.hpp>

// Crypto
#include <raslink/crypto/codec.hpp>

// Base classes
#include <raslink/datagram.hpp>
#include <raslink/transport.hpp>

// Datagram implementations
#include <raslink/datagram/udp.hpp>

// Transport implementations
#include <raslink/transport/lan.hpp>
#include <raslink/transport/mesh.hpp>
#include <raslink/transport/rtc_client.hpp>
#include <raslink/transport/webrtc.hpp>

// Connection establishment
#include <raslink/connection/cancel.hpp>
#include <raslink/connection/context.hpp>
#include <raslink/connection/lan_strategy.hpp>
#include <raslink/connection/mesh_strategy.hpp>
#include <raslink/connection/orchestrator.hpp>
#include <raslink/connection/path.hpp>
#include <raslink/connection/progress.hpp>
#include <raslink/connection/strategy.hpp>
#include <raslink/connection/webrtc_strategy.hpp>

// Session protocol
#include <raslink/session/envelope.hpp>
#include <raslink/session/manager.hpp>
#include <raslink/session/terminal.hpp>

// All types are in the raslink:: namespace
// Entry points:
//   - raslink::Orchestrator (strategies in, transport out)
//   - raslink::ConnectionManager (owns the transport, encrypts, keepalive)
//   - raslink::TerminalSession (attach/detach/input/output)
