#pragma once

#include <raslink/config.hpp>
#include <raslink/connection/cancel.hpp>
#include <raslink/connection/path.hpp>
#include <raslink/transport.hpp>

#include <atomic>
#include <optional>
#include <sstream>
#include <string>

namespace raslink {

    // Seam over a native WebRTC peer connection with one data channel
    // The WebRTC strategy drives it; the WebRTC transport owns it afterwards
    class WebRtcClient {
      public:
        virtual ~WebRtcClient() = default;

        // Create the data channel, gather candidates and return the complete offer SDP
        virtual dp::Res<dp::String> create_offer(dp::u32 timeout_ms) = 0;

        // Apply the daemon's answer; ICE starts here
        virtual dp::Res<void> set_remote_answer(const dp::String &answer_sdp) = 0;

        // Block until the data channel opens
        // timeout error when time runs out or ICE fails, not_found when cancelled
        virtual dp::Res<void> wait_for_data_channel(dp::u32 timeout_ms, const CancelToken &cancel) = 0;

        virtual dp::Res<void> send(const Message &msg) = 0;

        virtual dp::Res<Message> recv(dp::u32 timeout_ms) = 0;

        // Local and remote candidates ICE settled on, once connected
        virtual std::optional<dp::Pair<CandidateInfo, CandidateInfo>> selected_candidate_pair() = 0;

        virtual bool is_open() const = 0;

        // Release every native resource, idempotent
        virtual void close() = 0;
    };

    class WebRtcClientFactory {
      public:
        virtual ~WebRtcClientFactory() = default;
        virtual dp::Res<std::unique_ptr<WebRtcClient>> create(const Config &config) = 0;
    };

    namespace sdp {

        inline bool is_candidate_line(const std::string &line) { return line.rfind("a=candidate:", 0) == 0; }

        /// Connection address of an "a=candidate:" line (fifth field)
        inline std::string candidate_address(const std::string &line) {
            std::istringstream fields(line);
            std::string field;
            for (int i = 0; i < 5; ++i) {
                if (!(fields >> field)) {
                    return std::string();
                }
            }
            return field;
        }

        inline dp::usize count_candidates(const dp::String &sdp) {
            std::istringstream in(sdp.c_str());
            std::string line;
            dp::usize count = 0;
            while (std::getline(in, line)) {
                if (is_candidate_line(line)) {
                    ++count;
                }
            }
            return count;
        }

        /// Drop candidates in the mesh range; used when this device is not on the mesh
        inline dp::String filter_mesh_candidates(const dp::String &sdp) {
            std::istringstream in(sdp.c_str());
            std::string line;
            std::string out;
            while (std::getline(in, line)) {
                std::string bare = line;
                if (!bare.empty() && bare.back() == '\r') {
                    bare.pop_back();
                }
                if (is_candidate_line(bare) && ipv4::is_mesh(dp::String(candidate_address(bare).c_str()))) {
                    echo::trace("sdp: dropping mesh candidate ", bare.c_str());
                    continue;
                }
                out += line;
                out += '\n';
            }
            return dp::String(out.c_str());
        }

    } // namespace sdp

    // Data channel link to the daemon
    class WebRtcTransport : public Transport {
      private:
        std::unique_ptr<WebRtcClient> client_;
        std::atomic<bool> closed_;
        TransportStats stats_;

      public:
        explicit WebRtcTransport(std::unique_ptr<WebRtcClient> client) : client_(std::move(client)), closed_(false) {
            stats_.mark_connected();
        }

        ~WebRtcTransport() override { close(); }

        WebRtcTransport(const WebRtcTransport &) = delete;
        WebRtcTransport &operator=(const WebRtcTransport &) = delete;

        dp::Res<void> send(const Message &msg) override {
            if (closed_ || !client_->is_open()) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            auto res = client_->send(msg);
            if (res.is_ok()) {
                stats_.record_sent(msg.size());
            }
            return res;
        }

        dp::Res<Message> recv(dp::u32 timeout_ms) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            auto res = client_->recv(timeout_ms);
            if (res.is_ok()) {
                stats_.record_received(res.value().size());
            }
            return res;
        }

        void close() override {
            if (closed_.exchange(true)) {
                return;
            }
            echo::debug("closing webrtc transport");
            client_->close();
        }

        bool is_connected() const override { return !closed_ && client_->is_open(); }

        TransportType type() const override { return TransportType::WEBRTC; }

        TransportStatsSnapshot stats() const override { return stats_.snapshot(); }

        /// The negotiated route, for diagnostics and mesh-hint caching
        std::optional<ConnectionPath> connection_path() const {
            auto pair = client_->selected_candidate_pair();
            if (!pair) {
                return std::nullopt;
            }
            auto [local, remote] = *pair;
            return ConnectionPath::from(local, remote);
        }
    };

} // namespace raslink
