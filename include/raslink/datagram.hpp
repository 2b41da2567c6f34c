#pragma once

#include <raslink/endpoint.hpp>

#include <memory>

namespace raslink {

    // Abstract base class for a connectionless datagram socket
    // Message boundaries are preserved, delivery is not guaranteed
    class DatagramSocket {
      public:
        virtual ~DatagramSocket() = default;

        // Bind to a local address (optional for clients)
        virtual dp::Res<void> bind(const UdpEndpoint &endpoint) = 0;

        // Send one datagram to dest
        virtual dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) = 0;

        // Receive one datagram, waiting at most timeout_ms (0 blocks forever)
        // Returns the payload and its source
        virtual dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from(dp::u32 timeout_ms) = 0;

        // Close and release resources
        virtual void close() = 0;

        virtual bool is_open() const = 0;
    };

    // Creates sockets for the mesh transport
    // Platform code routes them through the VPN interface; tests hand out fakes
    class DatagramSocketFactory {
      public:
        virtual ~DatagramSocketFactory() = default;

        virtual dp::Res<std::unique_ptr<DatagramSocket>> create() = 0;
    };

} // namespace raslink
