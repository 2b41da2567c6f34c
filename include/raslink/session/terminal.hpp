#pragma once

#include <raslink/config.hpp>
#include <raslink/session/manager.hpp>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace raslink {

    /// Stable error codes reported by the daemon, plus the client-side ones
    namespace TerminalErrorCode {
        constexpr const char *SESSION_NOT_FOUND = "SESSION_NOT_FOUND";
        constexpr const char *SESSION_KILLING = "SESSION_KILLING";
        constexpr const char *NOT_ATTACHED = "NOT_ATTACHED";
        constexpr const char *ALREADY_ATTACHED = "ALREADY_ATTACHED";
        constexpr const char *INVALID_SEQUENCE = "INVALID_SEQUENCE";
        constexpr const char *PIPE_ERROR = "PIPE_ERROR";
        constexpr const char *PIPE_SETUP_FAILED = "PIPE_SETUP_FAILED";
        constexpr const char *RATE_LIMITED = "RATE_LIMITED";
        constexpr const char *INPUT_TOO_LARGE = "INPUT_TOO_LARGE";
        constexpr const char *INVALID_SESSION_ID = "INVALID_SESSION_ID";
        constexpr const char *ATTACH_TIMEOUT = "ATTACH_TIMEOUT";
        constexpr const char *ATTACH_FAILED = "ATTACH_FAILED";
        constexpr const char *DETACHED = "DETACHED"; // Daemon detached us for a reason other than our request
    } // namespace TerminalErrorCode

    /// Human-readable text for a terminal error code; unknown codes keep the daemon's message
    inline dp::String terminal_error_display(const dp::String &code, const dp::String &fallback) {
        namespace ec = TerminalErrorCode;
        struct Entry {
            const char *code;
            const char *text;
        };
        static const Entry table[] = {
            {ec::SESSION_NOT_FOUND, "Session not found"},
            {ec::SESSION_KILLING, "Session is being terminated"},
            {ec::NOT_ATTACHED, "Not attached to terminal"},
            {ec::ALREADY_ATTACHED, "Already attached to this session"},
            {ec::INVALID_SEQUENCE, "Reconnection sequence not available"},
            {ec::PIPE_ERROR, "Terminal communication error"},
            {ec::PIPE_SETUP_FAILED, "Failed to setup terminal"},
            {ec::RATE_LIMITED, "Too many inputs, please slow down"},
            {ec::INPUT_TOO_LARGE, "Input too large"},
            {ec::INVALID_SESSION_ID, "Invalid session ID"},
            {ec::ATTACH_TIMEOUT, "Terminal did not respond in time"},
            {ec::ATTACH_FAILED, "Failed to attach to terminal"},
        };
        for (const auto &entry : table) {
            if (code == entry.code) {
                return entry.text;
            }
        }
        return fallback;
    }

    constexpr dp::usize MAX_TERMINAL_INPUT = 64 * 1024;
    constexpr dp::usize SESSION_ID_LENGTH = 12;

    /// Session ids are exactly 12 ASCII letters or digits
    inline bool is_valid_session_id(const dp::String &session_id) {
        if (session_id.size() != SESSION_ID_LENGTH) {
            return false;
        }
        for (char c : session_id) {
            bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
            if (!alnum) {
                return false;
            }
        }
        return true;
    }

    struct TerminalErrorInfo {
        dp::String code;
        dp::String message;
        std::optional<dp::String> session_id;

        dp::String display_message() const { return terminal_error_display(code, message); }
    };

    /// Output the daemon dropped while we were away
    struct OutputSkippedInfo {
        dp::u64 from_sequence = 0;
        dp::u64 to_sequence = 0;
        dp::u64 bytes_skipped = 0;

        dp::String display_text() const {
            constexpr dp::u64 KB = 1024;
            constexpr dp::u64 MB = 1024 * 1024;
            if (bytes_skipped >= MB) {
                return dp::String("~") + to_dp_string(bytes_skipped / MB) + "MB output skipped";
            }
            if (bytes_skipped >= KB) {
                return dp::String("~") + to_dp_string(bytes_skipped / KB) + "KB output skipped";
            }
            return dp::String("~") + to_dp_string(bytes_skipped) + " bytes output skipped";
        }
    };

    struct TerminalState {
        std::optional<dp::String> session_id;
        bool is_attached = false;
        bool is_attaching = false;
        bool is_raw_mode = false;
        dp::u16 cols = 80;
        dp::u16 rows = 24;
        dp::u64 buffer_start_seq = 0;
        dp::u64 last_sequence = 0;
        std::optional<OutputSkippedInfo> output_skipped;
        std::optional<TerminalErrorInfo> error;

        bool can_send_input() const { return is_attached && session_id.has_value() && !error.has_value(); }
    };

    /// Client half of the terminal protocol
    ///
    /// One session object drives one terminal on the daemon at a time. attach() blocks
    /// until the daemon confirms, fails or the attach timeout fires; everything else is
    /// fire-and-forget. Events arrive on the manager's receiver thread and are applied to
    /// the state under one mutex. Events for a session id other than the current one are
    /// dropped.
    class TerminalSession {
      public:
        using OutputSink = std::function<void(const Message &data, dp::u64 sequence)>;

      private:
        /// Single-slot rendezvous between attach() and the receiver thread
        struct PendingAttach {
            dp::String session_id;
            std::mutex mutex;
            std::condition_variable cv;
            bool completed;
            dp::Res<void> result;

            explicit PendingAttach(const dp::String &id)
                : session_id(id), completed(false), result(dp::result::err(dp::Error::timeout("timeout"))) {}

            void complete(dp::Res<void> res) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (completed) {
                        return;
                    }
                    result = std::move(res);
                    completed = true;
                }
                cv.notify_all();
            }
        };

        ConnectionManager &manager_;
        Config config_;
        ConnectionManager::ListenerId event_listener_;
        ConnectionManager::ListenerId connectivity_listener_;

        mutable std::mutex state_mutex_;
        TerminalState state_;
        std::shared_ptr<PendingAttach> pending_;

        std::mutex attach_mutex_; // One attach in flight

        std::mutex sink_mutex_;
        OutputSink output_sink_;

        // Caller holds state_mutex_
        bool is_current_session(const dp::String &session_id) const {
            return state_.session_id && *state_.session_id == session_id;
        }

        // Caller holds state_mutex_
        std::shared_ptr<PendingAttach> take_pending() {
            auto pending = std::move(pending_);
            pending_.reset();
            return pending;
        }

        void emit_output(const Message &data, dp::u64 sequence) {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            if (output_sink_) {
                output_sink_(data, sequence);
            }
        }

        void on_attached(const event::Attached &e) {
            std::shared_ptr<PendingAttach> pending;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!is_current_session(e.session_id)) {
                    echo::debug("terminal: ignoring attached for other session ", e.session_id.c_str());
                    return;
                }
                echo::info("terminal: attached to ", e.session_id.c_str(), " seq=", e.current_seq);
                state_.is_attached = true;
                state_.is_attaching = false;
                state_.cols = e.cols;
                state_.rows = e.rows;
                state_.buffer_start_seq = e.buffer_start_seq;
                state_.last_sequence = std::max(state_.last_sequence, e.current_seq);
                state_.error.reset();
                if (pending_ && pending_->session_id == e.session_id) {
                    pending = take_pending();
                }
            }
            if (pending) {
                pending->complete(dp::result::ok());
            }
        }

        void on_detached(const event::Detached &e) {
            std::shared_ptr<PendingAttach> pending;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!is_current_session(e.session_id)) {
                    return;
                }
                echo::info("terminal: detached from ", e.session_id.c_str(), " reason=", e.reason.c_str());
                state_.is_attached = false;
                state_.is_attaching = false;
                if (e.reason != "user_request") {
                    state_.error = TerminalErrorInfo{TerminalErrorCode::DETACHED, e.reason, e.session_id};
                }
                pending = take_pending();
            }
            if (pending) {
                pending->complete(dp::result::err(dp::Error::io_error(dp::String("Detached: ") + e.reason)));
            }
        }

        void on_output(const dp::String &session_id, dp::u64 sequence, const Message &data) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!is_current_session(session_id)) {
                    echo::trace("terminal: dropping output for other session ", session_id.c_str());
                    return;
                }
                state_.last_sequence = std::max(state_.last_sequence, sequence);
            }
            echo::trace("terminal: output ", data.size(), " bytes seq=", sequence);
            emit_output(data, sequence);
        }

        void on_error(const event::Error &e) {
            std::shared_ptr<PendingAttach> pending;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!e.session_id.empty() && !is_current_session(e.session_id)) {
                    return;
                }
                echo::error("terminal error ", e.code.c_str(), ": ", e.message.c_str());
                std::optional<dp::String> sid;
                if (!e.session_id.empty()) {
                    sid = e.session_id;
                }
                state_.error = TerminalErrorInfo{e.code, e.message, sid};
                state_.is_attaching = false;
                if (e.code == TerminalErrorCode::NOT_ATTACHED) {
                    state_.is_attached = false;
                }
                pending = take_pending();
                if (pending) {
                    state_.is_attached = false;
                }
            }
            if (pending) {
                pending->complete(dp::result::err(dp::Error::io_error(e.code + ": " + e.message)));
            }
        }

        void on_skipped(const event::Skipped &e) {
            if (e.bytes_skipped == 0) {
                return;
            }
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!is_current_session(e.session_id)) {
                return;
            }
            echo::warn("terminal: output skipped seq ", e.from_sequence, "-", e.to_sequence, ", ", e.bytes_skipped,
                       " bytes");
            state_.output_skipped = OutputSkippedInfo{e.from_sequence, e.to_sequence, e.bytes_skipped};
        }

        void handle_event(const Event &ev) {
            if (const auto *e = std::get_if<event::Attached>(&ev)) {
                on_attached(*e);
            } else if (const auto *e = std::get_if<event::Detached>(&ev)) {
                on_detached(*e);
            } else if (const auto *e = std::get_if<event::Output>(&ev)) {
                on_output(e->session_id, e->sequence, e->data);
            } else if (const auto *e = std::get_if<event::Snapshot>(&ev)) {
                on_output(e->session_id, e->sequence, e->data);
            } else if (const auto *e = std::get_if<event::Error>(&ev)) {
                on_error(*e);
            } else if (const auto *e = std::get_if<event::Skipped>(&ev)) {
                on_skipped(*e);
            }
        }

        // A dropped transport is not a terminal error; keep what resumption needs
        void handle_connectivity(bool connected) {
            if (connected) {
                return;
            }
            std::shared_ptr<PendingAttach> pending;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_.is_attached = false;
                state_.is_attaching = false;
                pending = take_pending();
            }
            echo::debug("terminal: connection lost, attachment cleared");
            if (pending) {
                pending->complete(dp::result::err(dp::Error::not_found("Connection lost")));
            }
        }

        // Caller holds state_mutex_
        dp::Res<dp::String> attached_session_locked() const {
            if (!state_.is_attached || !state_.session_id) {
                return dp::result::err(dp::Error::invalid_argument("Not attached to terminal"));
            }
            return dp::result::ok(*state_.session_id);
        }

        dp::Res<dp::String> require_attached() const {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return attached_session_locked();
        }

        void fail_attach(const char *code, const dp::String &message, const dp::String &session_id) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.is_attaching = false;
            state_.is_attached = false;
            state_.error = TerminalErrorInfo{code, message, session_id};
            pending_.reset();
        }

      public:
        explicit TerminalSession(ConnectionManager &manager, const Config &config = Config{})
            : manager_(manager), config_(config) {
            event_listener_ = manager_.add_event_listener([this](const Event &ev) { handle_event(ev); });
            connectivity_listener_ =
                manager_.add_connectivity_listener([this](bool connected) { handle_connectivity(connected); });
        }

        ~TerminalSession() {
            manager_.remove_listener(event_listener_);
            manager_.remove_listener(connectivity_listener_);
            cancel_attach();
        }

        TerminalSession(const TerminalSession &) = delete;
        TerminalSession &operator=(const TerminalSession &) = delete;

        /// Receives every Output and Snapshot chunk for the current session
        void set_output_sink(OutputSink sink) {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            output_sink_ = std::move(sink);
        }

        /// Attach to a terminal and wait for the daemon to confirm
        /// Resumes from the last seen sequence when re-attaching to the same session
        /// Errors: invalid_argument for a bad id, timeout when the daemon stays silent,
        /// io_error carrying "CODE: message" when the daemon refuses
        dp::Res<void> attach(const dp::String &session_id, std::optional<dp::u64> from_sequence = std::nullopt) {
            if (!is_valid_session_id(session_id)) {
                echo::error("terminal: invalid session id");
                return dp::result::err(dp::Error::invalid_argument("Invalid session ID"));
            }

            std::lock_guard<std::mutex> attach_lock(attach_mutex_);

            std::optional<dp::String> previous;
            std::shared_ptr<PendingAttach> pending;
            command::Attach cmd;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                bool same = is_current_session(session_id);
                if (same && (state_.is_attached || state_.is_attaching)) {
                    echo::debug("terminal: already attached to ", session_id.c_str());
                    return dp::result::ok();
                }
                if (!same && state_.is_attached && state_.session_id) {
                    previous = state_.session_id;
                }
                if (!same) {
                    state_.last_sequence = 0;
                    state_.buffer_start_seq = 0;
                    state_.output_skipped.reset();
                }
                cmd.session_id = session_id;
                cmd.from_sequence = from_sequence ? *from_sequence : state_.last_sequence;
                cmd.cols = state_.cols;
                cmd.rows = state_.rows;

                state_.session_id = session_id;
                state_.is_attached = false;
                state_.is_attaching = true;
                state_.error.reset();
                pending = std::make_shared<PendingAttach>(session_id);
                pending_ = pending;
            }

            if (previous) {
                echo::info("terminal: switching from ", previous->c_str(), " to ", session_id.c_str());
                auto detach_res = manager_.send_command(command::Detach{*previous});
                if (detach_res.is_err()) {
                    echo::warn("terminal: detach of previous session failed: ", detach_res.error().message.c_str());
                }
            }

            echo::debug("terminal: attaching to ", session_id.c_str(), " from seq ", cmd.from_sequence);
            auto send_res = manager_.send_command(cmd);
            if (send_res.is_err()) {
                fail_attach(TerminalErrorCode::ATTACH_FAILED, send_res.error().message, session_id);
                return send_res;
            }

            std::unique_lock<std::mutex> lock(pending->mutex);
            if (!pending->cv.wait_for(lock, std::chrono::milliseconds(config_.attach_timeout_ms),
                                      [&pending] { return pending->completed; })) {
                lock.unlock();
                bool claimed = false;
                {
                    std::lock_guard<std::mutex> state_lock(state_mutex_);
                    if (pending_ == pending) {
                        pending_.reset();
                        state_.is_attaching = false;
                        state_.is_attached = false;
                        state_.error = TerminalErrorInfo{TerminalErrorCode::ATTACH_TIMEOUT,
                                                         "Attach timed out", session_id};
                    } else {
                        // An event handler took it at the deadline; its result is on the way
                        claimed = true;
                    }
                }
                if (!claimed) {
                    echo::error("terminal: attach to ", session_id.c_str(), " timed out");
                    return dp::result::err(dp::Error::timeout("Attach timed out"));
                }
                lock.lock();
                pending->cv.wait(lock, [&pending] { return pending->completed; });
            }
            return pending->result;
        }

        /// Resolve an in-flight attach without waiting for the daemon
        void cancel_attach() {
            std::shared_ptr<PendingAttach> pending;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                pending = take_pending();
                if (pending) {
                    state_.is_attaching = false;
                }
            }
            if (pending) {
                echo::debug("terminal: attach cancelled");
                pending->complete(dp::result::err(dp::Error::not_found("Attach cancelled")));
            }
        }

        dp::Res<void> detach() {
            std::optional<dp::String> session_id;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_id = state_.session_id;
            }
            if (!session_id) {
                echo::warn("terminal: cannot detach, no session");
                return dp::result::ok();
            }
            echo::debug("terminal: detaching from ", session_id->c_str());
            return manager_.send_command(command::Detach{*session_id});
        }

        dp::Res<void> send_input(const Message &data) {
            if (data.size() > MAX_TERMINAL_INPUT) {
                echo::error("terminal: input too large: ", data.size(), " bytes");
                return dp::result::err(dp::Error::invalid_argument("Input too large"));
            }
            auto sid = require_attached();
            if (sid.is_err()) {
                return dp::result::err(sid.error());
            }
            return manager_.send_command(command::Input{sid.value(), data});
        }

        dp::Res<void> send_input(const dp::String &text) { return send_input(to_bytes(text)); }

        /// Text followed by carriage return, as the Enter key sends it
        dp::Res<void> send_line(const dp::String &line) { return send_input(line + "\r"); }

        dp::Res<void> send_special_key(const dp::String &key, dp::u8 modifiers = envelope::Modifiers::None) {
            auto sid = require_attached();
            if (sid.is_err()) {
                return dp::result::err(sid.error());
            }
            return manager_.send_command(command::SpecialKey{sid.value(), key, modifiers});
        }

        /// Remembered for the next attach; sent right away when attached
        dp::Res<void> resize(dp::u16 cols, dp::u16 rows) {
            if (cols == 0 || rows == 0) {
                return dp::result::err(dp::Error::invalid_argument("terminal size must be non-zero"));
            }
            dp::Res<dp::String> sid = dp::result::err(dp::Error::invalid_argument("Not attached to terminal"));
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_.cols = cols;
                state_.rows = rows;
                sid = attached_session_locked();
            }
            if (sid.is_err()) {
                return dp::result::ok();
            }
            return manager_.send_command(command::Resize{sid.value(), cols, rows});
        }

        void set_raw_mode(bool enabled) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.is_raw_mode = enabled;
        }

        void toggle_raw_mode() {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.is_raw_mode = !state_.is_raw_mode;
        }

        void clear_error() {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.error.reset();
        }

        void clear_output_skipped() {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.output_skipped.reset();
        }

        /// Forget everything, including what resumption would need
        void reset() {
            cancel_attach();
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = TerminalState{};
        }

        TerminalState state() const {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_;
        }

        bool can_send_input() const { return state().can_send_input(); }
    };

} // namespace raslink
