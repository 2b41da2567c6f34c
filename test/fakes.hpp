#pragma once

// In-memory stand-ins for the collaborators raslink consumes through interfaces

#include <raslink/raslink.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace fakes {

    using raslink::Message;

    inline bool same_bytes(const Message &a, const Message &b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (dp::usize i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }

    // ============================================================================
    // Datagram socket with scripted replies
    // ============================================================================

    struct SocketScript {
        std::mutex mutex;
        std::deque<Message> replies; // Handed out one per recv_from, in order
        std::deque<raslink::UdpEndpoint> sources; // Sender of each reply; the last destination once exhausted
        dp::usize recv_calls = 0;
        dp::Vector<Message> sent;
        dp::Vector<raslink::UdpEndpoint> destinations;
        bool closed = false;
        bool reply_after_send = false; // Only release one reply per send_to
        dp::usize releasable = 0;
    };

    class FakeSocket : public raslink::DatagramSocket {
      private:
        std::shared_ptr<SocketScript> script_;

      public:
        explicit FakeSocket(std::shared_ptr<SocketScript> script) : script_(std::move(script)) {}

        dp::Res<void> bind(const raslink::UdpEndpoint &) override { return dp::result::ok(); }

        dp::Res<void> send_to(const Message &msg, const raslink::UdpEndpoint &dest) override {
            std::lock_guard<std::mutex> lock(script_->mutex);
            if (script_->closed) {
                return dp::result::err(dp::Error::not_found("socket closed"));
            }
            script_->sent.push_back(msg);
            script_->destinations.push_back(dest);
            ++script_->releasable;
            return dp::result::ok();
        }

        dp::Res<dp::Pair<Message, raslink::UdpEndpoint>> recv_from(dp::u32) override {
            std::lock_guard<std::mutex> lock(script_->mutex);
            ++script_->recv_calls;
            if (script_->closed) {
                return dp::result::err(dp::Error::not_found("socket closed"));
            }
            bool allowed = !script_->reply_after_send || script_->releasable > 0;
            if (script_->replies.empty() || !allowed) {
                return dp::result::err(dp::Error::timeout("receive timeout"));
            }
            if (script_->reply_after_send) {
                --script_->releasable;
            }
            Message reply = std::move(script_->replies.front());
            script_->replies.pop_front();
            if (reply.empty()) {
                // An empty entry scripts one timeout
                return dp::result::err(dp::Error::timeout("receive timeout"));
            }
            raslink::UdpEndpoint source{"100.64.0.2", 9876};
            if (!script_->sources.empty()) {
                source = script_->sources.front();
                script_->sources.pop_front();
            } else if (!script_->destinations.empty()) {
                source = script_->destinations.back();
            }
            return dp::result::ok(dp::Pair<Message, raslink::UdpEndpoint>(std::move(reply), source));
        }

        void close() override {
            std::lock_guard<std::mutex> lock(script_->mutex);
            script_->closed = true;
        }

        bool is_open() const override {
            std::lock_guard<std::mutex> lock(script_->mutex);
            return !script_->closed;
        }
    };

    class FakeSocketFactory : public raslink::DatagramSocketFactory {
      public:
        std::shared_ptr<SocketScript> script = std::make_shared<SocketScript>();
        dp::usize created = 0;

        dp::Res<std::unique_ptr<raslink::DatagramSocket>> create() override {
            ++created;
            return dp::result::ok(std::unique_ptr<raslink::DatagramSocket>(std::make_unique<FakeSocket>(script)));
        }
    };

    inline Message handshake_reply() { return raslink::mesh::encode_handshake(); }

    inline Message auth_ok() { return raslink::mesh::encode_frame(Message{raslink::mesh::AUTH_SUCCESS}); }

    inline Message timeout_marker() { return Message(); }

    // ============================================================================
    // Transport pair over in-memory queues
    // ============================================================================

    struct Queue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Message> items;
        bool closed = false;

        void push(Message msg) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                items.push_back(std::move(msg));
            }
            cv.notify_all();
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                closed = true;
            }
            cv.notify_all();
        }

        dp::Res<Message> pop(dp::u32 timeout_ms) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !items.empty() || closed; });
            if (!items.empty()) {
                Message msg = std::move(items.front());
                items.pop_front();
                return dp::result::ok(std::move(msg));
            }
            if (closed) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            return dp::result::err(dp::Error::timeout("Receive timeout"));
        }
    };

    class MemoryTransport : public raslink::Transport {
      private:
        std::shared_ptr<Queue> inbound_;
        std::shared_ptr<Queue> outbound_;
        raslink::TransportType type_;
        std::atomic<bool> closed_{false};
        raslink::TransportStats stats_;

      public:
        MemoryTransport(std::shared_ptr<Queue> inbound, std::shared_ptr<Queue> outbound,
                        raslink::TransportType type = raslink::TransportType::MESH)
            : inbound_(std::move(inbound)), outbound_(std::move(outbound)), type_(type) {
            stats_.mark_connected();
        }

        dp::Res<void> send(const Message &msg) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            outbound_->push(msg);
            stats_.record_sent(msg.size());
            return dp::result::ok();
        }

        dp::Res<Message> recv(dp::u32 timeout_ms) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            auto res = inbound_->pop(timeout_ms);
            if (res.is_ok()) {
                stats_.record_received(res.value().size());
            }
            return res;
        }

        void close() override {
            if (closed_.exchange(true)) {
                return;
            }
            inbound_->close();
            outbound_->close();
        }

        bool is_connected() const override { return !closed_; }

        raslink::TransportType type() const override { return type_; }

        raslink::TransportStatsSnapshot stats() const override { return stats_.snapshot(); }
    };

    inline Message test_token() {
        Message token(32);
        for (dp::usize i = 0; i < token.size(); ++i) {
            token[i] = static_cast<dp::u8>(i + 1);
        }
        return token;
    }

    /// Daemon end of a MemoryTransport: decrypts commands, encrypts events
    class FakeDaemon {
      private:
        std::shared_ptr<Queue> to_client_;
        std::shared_ptr<Queue> from_client_;
        std::unique_ptr<raslink::crypto::BytesCodec> codec_;

      public:
        explicit FakeDaemon(const Message &token = test_token())
            : to_client_(std::make_shared<Queue>()), from_client_(std::make_shared<Queue>()) {
            codec_ = std::move(raslink::crypto::BytesCodec::create(token).value());
        }

        std::shared_ptr<MemoryTransport> client_transport() {
            return std::make_shared<MemoryTransport>(to_client_, from_client_);
        }

        std::optional<raslink::Command> next_command(dp::u32 timeout_ms = 1000) {
            auto frame = from_client_->pop(timeout_ms);
            if (frame.is_err()) {
                return std::nullopt;
            }
            auto plain = codec_->decode(frame.value());
            if (plain.is_err()) {
                return std::nullopt;
            }
            auto cmd = raslink::envelope::decode_command(plain.value());
            if (cmd.is_err()) {
                return std::nullopt;
            }
            return cmd.value();
        }

        /// Next command that is not a keepalive ping
        std::optional<raslink::Command> next_non_ping(dp::u32 timeout_ms = 1000) {
            while (true) {
                auto cmd = next_command(timeout_ms);
                if (!cmd || !std::holds_alternative<raslink::command::Ping>(*cmd)) {
                    return cmd;
                }
            }
        }

        void send_event(const raslink::Event &ev) {
            auto frame = codec_->encode(raslink::envelope::encode_event(ev));
            to_client_->push(frame.value());
        }

        void send_raw(const Message &frame) { to_client_->push(frame); }

        void hang_up() {
            to_client_->close();
            from_client_->close();
        }
    };

    // ============================================================================
    // Connection collaborators
    // ============================================================================

    class FakeSignaling : public raslink::SignalingChannel {
      public:
        std::optional<raslink::Capabilities> capabilities;
        std::optional<dp::String> answer;
        dp::Vector<dp::String> offers;
        dp::usize exchanges = 0;

        dp::Res<raslink::Capabilities> exchange_capabilities(const raslink::Capabilities &, dp::u32) override {
            ++exchanges;
            if (!capabilities) {
                return dp::result::err(dp::Error::timeout("no reply"));
            }
            return dp::result::ok(*capabilities);
        }

        dp::Res<dp::String> send_offer(const dp::String &offer_sdp, dp::u32) override {
            offers.push_back(offer_sdp);
            if (!answer) {
                return dp::result::err(dp::Error::timeout("no answer"));
            }
            return dp::result::ok(*answer);
        }
    };

    class FakeMeshDetector : public raslink::MeshDetector {
      public:
        std::optional<raslink::MeshInfo> info;
        std::optional<raslink::MeshInfo> detect() override { return info; }
    };

    class FakeLanDiscovery : public raslink::LanDiscovery {
      public:
        std::optional<raslink::LanEndpoint> endpoint;
        dp::Vector<dp::u32> timeouts;

        std::optional<raslink::LanEndpoint> discover(const dp::String &, dp::u32 timeout_ms) override {
            timeouts.push_back(timeout_ms);
            return endpoint;
        }
    };

    class FakeHintStore : public raslink::MeshHintStore {
      public:
        struct Hint {
            dp::String device_id;
            dp::String ip;
            dp::u16 port;
        };
        dp::Vector<Hint> saved;
        bool fail = false;
        bool throws = false;

        dp::Res<void> save_mesh_hint(const dp::String &device_id, const dp::String &ip, dp::u16 port) override {
            if (throws) {
                throw std::runtime_error("hint storage offline");
            }
            if (fail) {
                return dp::result::err(dp::Error::io_error("disk full"));
            }
            saved.push_back(Hint{device_id, ip, port});
            return dp::result::ok();
        }
    };

    struct WebRtcScript {
        dp::String offer = "v=0\r\n"
                           "a=candidate:1 1 udp 2122260223 192.168.1.20 50000 typ host\r\n"
                           "a=candidate:2 1 udp 2122194687 100.101.102.103 50001 typ host\r\n"
                           "a=candidate:3 1 udp 1686052607 203.0.113.7 50002 typ srflx\r\n";
        bool offer_fails = false;
        bool answer_rejected = false;
        bool channel_fails = false;
        std::optional<dp::Pair<raslink::CandidateInfo, raslink::CandidateInfo>> pair;
        dp::String remote_answer;
        dp::usize closes = 0;
        bool open = false;
    };

    class FakeWebRtcClient : public raslink::WebRtcClient {
      private:
        std::shared_ptr<WebRtcScript> script_;

      public:
        explicit FakeWebRtcClient(std::shared_ptr<WebRtcScript> script) : script_(std::move(script)) {}

        dp::Res<dp::String> create_offer(dp::u32) override {
            if (script_->offer_fails) {
                return dp::result::err(dp::Error::io_error("gathering failed"));
            }
            return dp::result::ok(script_->offer);
        }

        dp::Res<void> set_remote_answer(const dp::String &answer_sdp) override {
            if (script_->answer_rejected) {
                return dp::result::err(dp::Error::invalid_argument("bad answer"));
            }
            script_->remote_answer = answer_sdp;
            return dp::result::ok();
        }

        dp::Res<void> wait_for_data_channel(dp::u32, const raslink::CancelToken &cancel) override {
            if (cancel.is_cancelled()) {
                return dp::result::err(dp::Error::not_found("cancelled"));
            }
            if (script_->channel_fails) {
                return dp::result::err(dp::Error::io_error("ICE connection failed"));
            }
            script_->open = true;
            return dp::result::ok();
        }

        dp::Res<void> send(const Message &) override { return dp::result::ok(); }

        dp::Res<Message> recv(dp::u32) override { return dp::result::err(dp::Error::timeout("Receive timeout")); }

        std::optional<dp::Pair<raslink::CandidateInfo, raslink::CandidateInfo>> selected_candidate_pair() override {
            return script_->pair;
        }

        bool is_open() const override { return script_->open; }

        void close() override {
            ++script_->closes;
            script_->open = false;
        }
    };

    class FakeWebRtcFactory : public raslink::WebRtcClientFactory {
      public:
        std::shared_ptr<WebRtcScript> script = std::make_shared<WebRtcScript>();

        dp::Res<std::unique_ptr<raslink::WebRtcClient>> create(const raslink::Config &) override {
            return dp::result::ok(std::unique_ptr<raslink::WebRtcClient>(std::make_unique<FakeWebRtcClient>(script)));
        }
    };

    /// Strategy with a fixed outcome that records how often it was used
    class ScriptedStrategy : public raslink::ConnectionStrategy {
      public:
        dp::String name_;
        dp::i32 priority_;
        bool available = true;
        bool succeed = false;
        bool can_retry = true;
        bool detect_throws = false;
        bool connect_throws = false;
        dp::String error = "failed";
        raslink::TransportPtr transport;
        dp::usize detect_calls = 0;
        dp::usize connect_calls = 0;
        std::optional<dp::String> seen_mesh_ip;
        std::function<void(const raslink::StepSink &)> steps;
        dp::Vector<dp::String> *call_log = nullptr;

        ScriptedStrategy(const dp::String &name, dp::i32 priority) : name_(name), priority_(priority) {}

        dp::String name() const override { return name_; }
        dp::i32 priority() const override { return priority_; }

        raslink::DetectionResult detect() override {
            ++detect_calls;
            if (call_log) {
                call_log->push_back(name_ + ".detect");
            }
            if (detect_throws) {
                throw std::runtime_error("no route table");
            }
            if (!available) {
                return raslink::DetectUnavailable{"not here"};
            }
            return raslink::DetectAvailable{"ready"};
        }

        raslink::ConnectionResult connect(const raslink::ConnectionContext &context, const raslink::StepSink &on_step,
                                          const raslink::CancelToken &) override {
            ++connect_calls;
            if (call_log) {
                call_log->push_back(name_ + ".connect");
            }
            seen_mesh_ip = context.mesh_ip;
            if (connect_throws) {
                throw std::runtime_error("socket exploded");
            }
            if (steps) {
                steps(on_step);
            }
            if (succeed) {
                return raslink::ConnectSuccess{transport};
            }
            return raslink::ConnectFailed{error, can_retry};
        }
    };

} // namespace fakes
