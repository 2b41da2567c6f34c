#pragma once

#include <raslink/config.hpp>
#include <raslink/crypto/codec.hpp>
#include <raslink/session/envelope.hpp>
#include <raslink/transport.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace raslink {

    /// Owns the live transport to the daemon
    ///
    /// Outbound commands are enveloped, encrypted and written under one send mutex.
    /// A receiver thread decrypts and decodes inbound events and fans them out to
    /// listeners; a keepalive thread pings the daemon. Listeners run on the receiver
    /// thread and must not block. remove_listener() returns only once no other thread
    /// is still inside that listener.
    class ConnectionManager {
      public:
        using EventListener = std::function<void(const Event &)>;
        using ConnectivityListener = std::function<void(bool connected)>;
        using ListenerId = dp::u64;

      private:
        Config config_;
        Message auth_token_;

        TransportPtr transport_;
        std::unique_ptr<crypto::BytesCodec> codec_;
        mutable std::mutex send_mutex_;  // Guards transport_ writes and the send path
        mutable std::mutex codec_mutex_; // Guards codec_

        std::thread receiver_thread_;
        std::thread keepalive_thread_;
        std::atomic<bool> running_;
        std::atomic<bool> connected_;
        std::atomic<dp::u64> generation_; // Bumped per attach so a detached old receiver cannot touch a new session

        std::mutex keepalive_mutex_;
        std::condition_variable keepalive_cv_;

        std::atomic<dp::u64> last_inbound_ms_;
        std::atomic<dp::i64> last_rtt_ms_;

        std::mutex listener_mutex_;
        std::condition_variable dispatch_cv_;
        ListenerId next_listener_id_ = 1;
        std::map<ListenerId, EventListener> event_listeners_;
        std::map<ListenerId, ConnectivityListener> connectivity_listeners_;
        std::map<std::thread::id, dp::usize> dispatching_; // Threads currently running listeners

        // Receivers that called disconnect() from their own listener; joined by the next other thread
        std::vector<std::thread> retired_threads_;

        dp::Res<Message> encrypt(const Message &plain) const {
            std::lock_guard<std::mutex> lock(codec_mutex_);
            if (!codec_) {
                return dp::result::err(dp::Error::not_found("No encryption codec available"));
            }
            return codec_->encode(plain);
        }

        dp::Res<Message> decrypt(const Message &frame) const {
            std::lock_guard<std::mutex> lock(codec_mutex_);
            if (!codec_) {
                return dp::result::err(dp::Error::not_found("No encryption codec available"));
            }
            return codec_->decode(frame);
        }

        dp::Res<void> send_on(const TransportPtr &transport, const Command &cmd) {
            Message plain = envelope::encode_command(cmd);
            if (plain.size() > config_.max_message_size) {
                echo::error("command too large: ", plain.size(), " bytes");
                return dp::result::err(dp::Error::invalid_argument("Message too large"));
            }
            auto frame = encrypt(plain);
            if (frame.is_err()) {
                return dp::result::err(frame.error());
            }
            return transport->send(frame.value());
        }

        /// Marks the calling thread as inside listeners for its lifetime
        /// Constructed with listener_mutex_ held
        class DispatchScope {
          private:
            ConnectionManager &manager_;
            std::thread::id self_;

          public:
            explicit DispatchScope(ConnectionManager &manager) : manager_(manager), self_(std::this_thread::get_id()) {
                ++manager_.dispatching_[self_];
            }

            ~DispatchScope() {
                {
                    std::lock_guard<std::mutex> lock(manager_.listener_mutex_);
                    auto it = manager_.dispatching_.find(self_);
                    if (--it->second == 0) {
                        manager_.dispatching_.erase(it);
                    }
                }
                manager_.dispatch_cv_.notify_all();
            }

            DispatchScope(const DispatchScope &) = delete;
            DispatchScope &operator=(const DispatchScope &) = delete;
        };

        // Caller holds listener_mutex_
        bool other_threads_dispatching() const {
            auto self = std::this_thread::get_id();
            for (const auto &[thread_id, depth] : dispatching_) {
                if (thread_id != self) {
                    return true;
                }
            }
            return false;
        }

        // Listeners are copied and called without the lock so they may add or remove listeners
        template <typename Listener, typename Arg>
        void call_listeners(const std::map<ListenerId, Listener> &registered, const Arg &arg) {
            dp::Vector<Listener> listeners;
            std::optional<DispatchScope> scope;
            {
                std::lock_guard<std::mutex> lock(listener_mutex_);
                for (const auto &[id, listener] : registered) {
                    listeners.push_back(listener);
                }
                scope.emplace(*this);
            }
            for (const auto &listener : listeners) {
                listener(arg);
            }
        }

        void dispatch(const Event &ev) { call_listeners(event_listeners_, ev); }

        void notify_connectivity(bool connected) { call_listeners(connectivity_listeners_, connected); }

        void handle_frame(const Message &frame) {
            if (frame.empty()) {
                echo::warn("dropping empty message");
                return;
            }
            if (frame.size() > config_.max_message_size) {
                echo::warn("dropping oversized message: ", frame.size(), " bytes");
                return;
            }
            auto plain = decrypt(frame);
            if (plain.is_err()) {
                echo::warn("dropping undecryptable message: ", plain.error().message.c_str());
                return;
            }
            auto ev = envelope::decode_event(plain.value());
            if (ev.is_err()) {
                echo::warn("dropping undecodable message: ", ev.error().message.c_str());
                return;
            }

            last_inbound_ms_ = steady_now_ms();
            if (const auto *pong = std::get_if<event::Pong>(&ev.value())) {
                dp::u64 now = wall_now_ms();
                if (now >= pong->timestamp_ms) {
                    last_rtt_ms_ = static_cast<dp::i64>(now - pong->timestamp_ms);
                    echo::trace("pong rtt=", now - pong->timestamp_ms, "ms");
                }
            }
            dispatch(ev.value());
        }

        bool is_current(dp::u64 generation) const { return running_ && generation_ == generation; }

        void receiver_loop(TransportPtr transport, dp::u64 generation) {
            echo::debug("connection manager receiver thread started");

            while (is_current(generation)) {
                auto recv_res = transport->recv(config_.receive_poll_ms);
                if (recv_res.is_err()) {
                    const auto &err = recv_res.error();
                    // Timeout is expected - just continue to check running_ flag
                    if (is_timeout(err)) {
                        continue;
                    }
                    if (is_protocol_error(err)) {
                        echo::warn("dropping malformed frame: ", err.message.c_str());
                        continue;
                    }
                    if (is_current(generation)) {
                        echo::warn("transport lost: ", err.message.c_str());
                    }
                    break;
                }
                handle_frame(recv_res.value());
            }

            if (generation_ != generation) {
                echo::debug("stale receiver thread stopped");
                return;
            }
            bool was_running = running_.exchange(false);
            wake_keepalive();
            if (was_running && connected_.exchange(false)) {
                // Peer went away without disconnect() being called
                notify_connectivity(false);
            }
            echo::debug("connection manager receiver thread stopped");
        }

        void keepalive_loop(TransportPtr transport, dp::u64 generation) {
            echo::debug("keepalive thread started, interval=", config_.keepalive_interval_ms, "ms");
            while (true) {
                {
                    std::unique_lock<std::mutex> lock(keepalive_mutex_);
                    if (keepalive_cv_.wait_for(lock, std::chrono::milliseconds(config_.keepalive_interval_ms),
                                               [this, generation] { return !is_current(generation); })) {
                        break;
                    }
                }
                std::lock_guard<std::mutex> lock(send_mutex_);
                auto res = send_on(transport, command::Ping{wall_now_ms()});
                if (res.is_err()) {
                    echo::debug("keepalive ping failed: ", res.error().message.c_str());
                }
            }
            echo::debug("keepalive thread stopped");
        }

        void wake_keepalive() {
            {
                std::lock_guard<std::mutex> lock(keepalive_mutex_);
            }
            keepalive_cv_.notify_all();
        }

        void join_threads() {
            auto self = std::this_thread::get_id();
            for (auto *t : {&keepalive_thread_, &receiver_thread_}) {
                if (!t->joinable()) {
                    continue;
                }
                if (t->get_id() == self) {
                    // Called from a listener on this thread; it exits once the callback returns
                    retired_threads_.push_back(std::move(*t));
                } else {
                    t->join();
                }
            }
            join_retired(self);
        }

        void join_retired(std::thread::id self) {
            for (auto it = retired_threads_.begin(); it != retired_threads_.end();) {
                if (it->get_id() == self) {
                    ++it;
                    continue;
                }
                it->join();
                it = retired_threads_.erase(it);
            }
        }

      public:
        /// auth_token is the 32-byte secret from pairing; a copy is kept
        explicit ConnectionManager(const Message &auth_token, const Config &config = Config{})
            : config_(config), auth_token_(auth_token.begin(), auth_token.end()), running_(false), connected_(false),
              generation_(0), last_inbound_ms_(0), last_rtt_ms_(-1) {}

        ~ConnectionManager() {
            disconnect();
            for (auto &t : retired_threads_) {
                if (t.joinable()) {
                    // Destroyed from its own receiver thread; nothing else is left to join it
                    t.detach();
                }
            }
            secure_zero(auth_token_);
        }

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        /// Take ownership of an established transport
        /// ConnectionReady has been written to the daemon by the time this returns
        dp::Res<void> attach_transport(TransportPtr transport) {
            if (!transport) {
                return dp::result::err(dp::Error::invalid_argument("null transport"));
            }
            disconnect();

            auto codec_res = crypto::BytesCodec::create(auth_token_);
            if (codec_res.is_err()) {
                echo::error("cannot create codec: ", codec_res.error().message.c_str());
                transport->close();
                return dp::result::err(codec_res.error());
            }
            {
                std::lock_guard<std::mutex> lock(codec_mutex_);
                codec_ = std::move(codec_res.value());
            }

            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                auto ready = send_on(transport, command::ConnectionReady{});
                if (ready.is_err()) {
                    echo::error("failed to send ConnectionReady: ", ready.error().message.c_str());
                    transport->close();
                    std::lock_guard<std::mutex> codec_lock(codec_mutex_);
                    codec_->zero_key();
                    codec_.reset();
                    return ready;
                }
                transport_ = transport;
            }

            echo::info("connection manager attached to ", transport_type_name(transport->type()), " transport");
            last_inbound_ms_ = steady_now_ms();
            last_rtt_ms_ = -1;
            dp::u64 generation = ++generation_;
            running_ = true;
            connected_ = true;
            receiver_thread_ = std::thread(&ConnectionManager::receiver_loop, this, transport, generation);
            if (config_.keepalive_interval_ms > 0) {
                keepalive_thread_ = std::thread(&ConnectionManager::keepalive_loop, this, transport, generation);
            }
            notify_connectivity(true);
            return dp::result::ok();
        }

        /// Send one command to the daemon
        /// Thread-safe - can be called from multiple threads
        dp::Res<void> send_command(const Command &cmd) {
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (!transport_ || !connected_) {
                return dp::result::err(dp::Error::not_found("Not connected"));
            }
            return send_on(transport_, cmd);
        }

        dp::Res<void> send_session_command(const Message &body) { return send_command(command::SessionCommand{body}); }

        dp::Res<void> send_unpair_request(const dp::String &device_id) {
            return send_command(command::UnpairRequest{device_id});
        }

        /// Stop the threads, close the transport and zero the session key
        void disconnect() {
            running_ = false;
            wake_keepalive();

            TransportPtr transport;
            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                transport = transport_;
            }
            if (transport) {
                transport->close();
            }
            join_threads();

            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                transport_.reset();
            }
            {
                std::lock_guard<std::mutex> lock(codec_mutex_);
                if (codec_) {
                    codec_->zero_key();
                    codec_.reset();
                }
            }

            if (connected_.exchange(false)) {
                echo::info("connection manager disconnected");
                notify_connectivity(false);
            }
        }

        bool is_connected() const { return connected_; }

        /// False once the daemon has been silent for longer than max_idle_ms
        bool is_healthy() const {
            if (!connected_) {
                return false;
            }
            return steady_now_ms() - last_inbound_ms_.load() <= config_.max_idle_ms;
        }

        /// Round trip of the most recent keepalive, if any Pong arrived
        std::optional<dp::u64> last_rtt_ms() const {
            dp::i64 rtt = last_rtt_ms_;
            if (rtt < 0) {
                return std::nullopt;
            }
            return static_cast<dp::u64>(rtt);
        }

        std::optional<TransportStatsSnapshot> transport_stats() const {
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (!transport_) {
                return std::nullopt;
            }
            return transport_->stats();
        }

        std::optional<TransportType> transport_type() const {
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (!transport_) {
                return std::nullopt;
            }
            return transport_->type();
        }

        ListenerId add_event_listener(EventListener listener) {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            ListenerId id = next_listener_id_++;
            event_listeners_[id] = std::move(listener);
            return id;
        }

        ListenerId add_connectivity_listener(ConnectivityListener listener) {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            ListenerId id = next_listener_id_++;
            connectivity_listeners_[id] = std::move(listener);
            return id;
        }

        /// Unregister a listener and wait until no other thread is still running listeners
        /// A listener may remove itself; the wait is skipped for the dispatching thread
        void remove_listener(ListenerId id) {
            std::unique_lock<std::mutex> lock(listener_mutex_);
            event_listeners_.erase(id);
            connectivity_listeners_.erase(id);
            dispatch_cv_.wait(lock, [this] { return !other_threads_dispatching(); });
        }
    };

} // namespace raslink
