#pragma once

#include <raslink/config.hpp>
#include <raslink/datagram.hpp>
#include <raslink/transport.hpp>

#include <atomic>
#include <mutex>

namespace raslink {
    namespace mesh {

        /// Wire format over the mesh VPN, one message per datagram, big-endian:
        ///   data:      [length:4][payload:length]
        ///   handshake: [magic:4 = "RAST"][reserved:4 = 0]
        ///   auth:      data frame carrying [id_len:4][device_id:id_len][token:32], id in UTF-8
        ///   verdict:   data frame carrying [status:1], 0x01 = authenticated
        constexpr dp::u32 HANDSHAKE_MAGIC = 0x52415354;
        constexpr dp::usize HANDSHAKE_SIZE = 8;
        constexpr dp::usize HEADER_SIZE = 4;
        constexpr dp::usize MAX_PACKET_SIZE = 65507;
        constexpr dp::usize AUTH_TOKEN_SIZE = 32;
        constexpr dp::u8 AUTH_SUCCESS = 0x01;

        inline Message encode_handshake() {
            Message msg;
            append_u32_be(msg, HANDSHAKE_MAGIC);
            append_u32_be(msg, 0);
            return msg;
        }

        /// A handshake (or a late duplicate reply to one)
        inline bool is_handshake(const Message &packet) {
            return packet.size() == HANDSHAKE_SIZE && decode_u32_be(packet.data()) == HANDSHAKE_MAGIC;
        }

        inline Message encode_frame(const Message &payload) {
            Message packet;
            packet.reserve(HEADER_SIZE + payload.size());
            append_u32_be(packet, static_cast<dp::u32>(payload.size()));
            packet.insert(packet.end(), payload.begin(), payload.end());
            return packet;
        }

        /// Extract the payload of one data frame
        /// Trailing bytes past the declared length are ignored
        inline dp::Res<Message> decode_frame(const Message &packet) {
            if (packet.size() < HEADER_SIZE) {
                echo::warn("mesh packet too small: ", packet.size(), " bytes");
                return dp::result::err(dp::Error::invalid_argument(dp::String("Packet too small: ") +
                                                                   to_dp_string(packet.size()) + " bytes"));
            }
            dp::u32 length = decode_u32_be(packet.data());
            if (length > packet.size() - HEADER_SIZE) {
                echo::warn("mesh frame declares ", length, " bytes, packet carries ", packet.size() - HEADER_SIZE);
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("Invalid message length: ") + to_dp_string(length)));
            }
            return dp::result::ok(Message(packet.begin() + HEADER_SIZE, packet.begin() + HEADER_SIZE + length));
        }

        inline Message encode_auth(const dp::String &device_id, const Message &auth_token) {
            Message msg;
            append_u32_be(msg, static_cast<dp::u32>(device_id.size()));
            append_string(msg, device_id);
            msg.insert(msg.end(), auth_token.begin(), auth_token.end());
            return msg;
        }

        struct AuthRequest {
            dp::String device_id;
            Message auth_token;
        };

        /// Daemon side of encode_auth; the token must fill the rest of the payload exactly
        inline dp::Res<AuthRequest> decode_auth(const Message &payload) {
            if (payload.size() < HEADER_SIZE + AUTH_TOKEN_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("auth payload too short"));
            }
            dp::u32 id_len = decode_u32_be(payload.data());
            if (static_cast<dp::usize>(id_len) != payload.size() - HEADER_SIZE - AUTH_TOKEN_SIZE) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("Invalid device id length: ") +
                                                                   to_dp_string(id_len)));
            }
            AuthRequest request;
            request.device_id = dp::String(reinterpret_cast<const char *>(payload.data() + HEADER_SIZE), id_len);
            request.auth_token = Message(payload.begin() + HEADER_SIZE + id_len, payload.end());
            return dp::result::ok(std::move(request));
        }

        /// Whether a datagram came from the daemon we are talking to
        /// Hostnames cannot be compared with the numeric source, so only the port counts for them
        inline bool is_from(const UdpEndpoint &source, const UdpEndpoint &remote) {
            if (source.port != remote.port) {
                return false;
            }
            return !ipv4::parse(remote.host) || source.host == remote.host;
        }

    } // namespace mesh

    // Direct UDP link to the daemon across the mesh VPN
    // One socket for the whole session: handshake retries, auth and data all share it
    class MeshTransport : public Transport {
      private:
        std::unique_ptr<DatagramSocket> socket_;
        UdpEndpoint remote_;
        dp::u32 stale_budget_;
        std::atomic<bool> closed_;
        mutable std::mutex send_mutex_;
        TransportStats stats_;

        MeshTransport(std::unique_ptr<DatagramSocket> socket, const UdpEndpoint &remote, dp::u32 stale_budget)
            : socket_(std::move(socket)), remote_(remote), stale_budget_(stale_budget), closed_(false) {
            stats_.mark_connected();
        }

        // Next datagram from the daemon within timeout_ms; anyone else's datagrams are skipped
        static dp::Res<Message> recv_from_daemon(DatagramSocket &socket, const UdpEndpoint &remote,
                                                 dp::u32 timeout_ms) {
            dp::u64 deadline = steady_now_ms() + timeout_ms;
            while (true) {
                dp::u64 now = steady_now_ms();
                if (now >= deadline) {
                    return dp::result::err(dp::Error::timeout("Receive timeout"));
                }
                auto recv_res = socket.recv_from(static_cast<dp::u32>(deadline - now));
                if (recv_res.is_err()) {
                    return dp::result::err(recv_res.error());
                }
                auto [packet, source] = std::move(recv_res.value());
                if (!mesh::is_from(source, remote)) {
                    echo::warn("mesh: ignoring ", packet.size(), "-byte datagram from ", source.to_string(),
                               ", expected ", remote.to_string());
                    continue;
                }
                return dp::result::ok(std::move(packet));
            }
        }

      public:
        ~MeshTransport() override { close(); }

        MeshTransport(const MeshTransport &) = delete;
        MeshTransport &operator=(const MeshTransport &) = delete;

        /// Handshake with the daemon
        /// Sends the magic and waits for it to come back, retrying on the same socket
        /// Failure is a timeout error (recoverable) after every attempt went unanswered
        static dp::Res<std::shared_ptr<MeshTransport>> connect(std::unique_ptr<DatagramSocket> socket,
                                                               const UdpEndpoint &remote, const Config &config) {
            if (!socket) {
                return dp::result::err(dp::Error::invalid_argument("no socket"));
            }
            echo::debug("mesh handshake with ", remote.to_string());

            Message handshake = mesh::encode_handshake();
            dp::u32 attempts = config.mesh_handshake_attempts == 0 ? 1 : config.mesh_handshake_attempts;

            for (dp::u32 attempt = 1; attempt <= attempts; ++attempt) {
                auto send_res = socket->send_to(handshake, remote);
                if (send_res.is_err()) {
                    echo::warn("mesh handshake send failed (attempt ", attempt, "/", attempts,
                               "): ", send_res.error().message.c_str());
                    continue;
                }
                echo::trace("mesh handshake sent (attempt ", attempt, "/", attempts, ")");

                auto recv_res = recv_from_daemon(*socket, remote, config.mesh_handshake_timeout_ms);
                if (recv_res.is_err()) {
                    echo::warn("mesh handshake attempt ", attempt, "/", attempts,
                               " failed: ", recv_res.error().message.c_str());
                    continue;
                }

                const Message &reply = recv_res.value();
                if (!mesh::is_handshake(reply)) {
                    echo::warn("mesh handshake attempt ", attempt, "/", attempts, ": unexpected ", reply.size(),
                               "-byte reply from ", remote.to_string());
                    continue;
                }

                echo::info("mesh handshake complete with ", remote.to_string());
                return dp::result::ok(std::shared_ptr<MeshTransport>(
                    new MeshTransport(std::move(socket), remote, config.mesh_stale_handshake_budget)));
            }

            socket->close();
            echo::error("mesh handshake failed after ", attempts, " attempts");
            return dp::result::err(dp::Error::timeout(dp::String("Handshake failed after ") + to_dp_string(attempts) +
                                                      " attempts - daemon may not be listening"));
        }

        /// Prove the pairing to the daemon
        /// Any answer other than a single 0x01 (or no answer) closes the transport
        dp::Res<void> authenticate(const dp::String &device_id, const Message &auth_token, dp::u32 timeout_ms) {
            if (auth_token.size() != mesh::AUTH_TOKEN_SIZE) {
                close();
                return dp::result::err(dp::Error::invalid_argument("auth token must be 32 bytes"));
            }

            auto send_res = send(mesh::encode_auth(device_id, auth_token));
            if (send_res.is_err()) {
                close();
                return send_res;
            }

            auto reply_res = recv(timeout_ms);
            if (reply_res.is_err()) {
                echo::error("mesh auth: no verdict: ", reply_res.error().message.c_str());
                close();
                return dp::result::err(dp::Error::io_error("Authentication failed"));
            }

            const Message &reply = reply_res.value();
            if (reply.empty() || reply[0] != mesh::AUTH_SUCCESS) {
                echo::error("mesh auth rejected (", reply.size(), " byte verdict)");
                close();
                return dp::result::err(dp::Error::io_error("Authentication failed"));
            }

            echo::info("mesh auth accepted for ", device_id.c_str());
            return dp::result::ok();
        }

        dp::Res<void> send(const Message &msg) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            if (msg.size() > mesh::MAX_PACKET_SIZE - mesh::HEADER_SIZE) {
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("Message too large: ") + to_dp_string(msg.size())));
            }

            std::lock_guard<std::mutex> lock(send_mutex_);
            auto send_res = socket_->send_to(mesh::encode_frame(msg), remote_);
            if (send_res.is_err()) {
                if (closed_) {
                    return dp::result::err(dp::Error::not_found("Transport is closed"));
                }
                return send_res;
            }
            stats_.record_sent(msg.size());
            echo::trace("mesh sent ", msg.size(), " bytes");
            return dp::result::ok();
        }

        dp::Res<Message> recv(dp::u32 timeout_ms) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }

            dp::u32 stale_seen = 0;
            while (true) {
                auto recv_res = socket_->recv_from(timeout_ms);
                if (recv_res.is_err()) {
                    if (closed_) {
                        return dp::result::err(dp::Error::not_found("Transport is closed"));
                    }
                    if (is_timeout(recv_res.error())) {
                        return dp::result::err(dp::Error::timeout("Receive timeout"));
                    }
                    return dp::result::err(recv_res.error());
                }

                auto [packet, source] = std::move(recv_res.value());
                if (mesh::is_handshake(packet)) {
                    ++stale_seen;
                    if (stale_seen > stale_budget_) {
                        echo::warn("mesh recv: ", stale_seen, " stale handshake packets in one call");
                        return dp::result::err(dp::Error::invalid_argument("too many stale handshake packets"));
                    }
                    echo::debug("mesh recv: skipping stale handshake reply from ", source.to_string());
                    continue;
                }

                auto frame_res = mesh::decode_frame(packet);
                if (frame_res.is_err()) {
                    return frame_res;
                }
                stats_.record_received(frame_res.value().size());
                echo::trace("mesh received ", frame_res.value().size(), " bytes");
                return frame_res;
            }
        }

        void close() override {
            if (closed_.exchange(true)) {
                return;
            }
            echo::debug("closing mesh transport to ", remote_.to_string());
            socket_->close();
        }

        bool is_connected() const override { return !closed_; }

        TransportType type() const override { return TransportType::MESH; }

        TransportStatsSnapshot stats() const override { return stats_.snapshot(); }

        const UdpEndpoint &remote() const { return remote_; }
    };

} // namespace raslink
