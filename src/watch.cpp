#include "watch.hpp"
#include "crypto.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <csignal>
#include <pthread.h>
#include <stdexcept>
#include <thread>

// ---------------- Cancellation ----------------
// Notify under the lock: a waiter that sees the flag may return and destroy
// the token, so nothing here may touch it after the lock is released.
void CancelToken::cancel() {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
    cv_.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
}

bool CancelToken::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_until(lock, deadline, [this] { return cancelled_; });
}

bool start_signal_listener(CancelToken& token) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
        audit_log_level(LogLevel::ERROR,
            "start_signal_listener: pthread_sigmask failed",
            "watch_module",
            "failure");
        return false;
    }

    std::thread([set, &token]() {
        int sig = 0;
        while (sigwait(&set, &sig) != 0) {
        }
        audit_log_level(LogLevel::INFO,
            std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM"),
            "watch_module",
            "notify");
        token.cancel();
        }).detach();
    return true;
}


// ---------------- Outcome naming ----------------
const char* tick_outcome_str(TickOutcome outcome) {
    switch (outcome) {
    case TickOutcome::IDLE:               return "idle";
    case TickOutcome::SENT:               return "sent";
    case TickOutcome::RECEIVED:           return "received";
    case TickOutcome::SEND_FAILED:        return "send_failed";
    case TickOutcome::RECEIVE_FAILED:     return "receive_failed";
    case TickOutcome::LOCAL_READ_FAILED:  return "local_read_failed";
    case TickOutcome::REMOTE_READ_FAILED: return "remote_read_failed";
    default:                              return "unknown";
    }
}


// ---------------- Session ----------------
WatchSession::WatchSession(PeerDescriptor peer,
    LocalClipboard& local,
    RemoteClipboard& remote,
    CancelToken& cancel,
    std::chrono::milliseconds interval,
    HistoryHook on_history,
    std::ostream& out,
    std::ostream& err)
    : peer_(std::move(peer)),
    local_(local),
    remote_(remote),
    cancel_(cancel),
    interval_(interval),
    on_history_(std::move(on_history)),
    out_(out),
    err_(err)
{
    if (interval_ < std::chrono::milliseconds(MIN_WATCH_INTERVAL_MS)) {
        throw std::invalid_argument("watch interval must be at least " +
            std::to_string(MIN_WATCH_INTERVAL_MS) + " ms, got " +
            std::to_string(interval_.count()) + " ms");
    }
    // larger values overflow steady_clock arithmetic in run()
    if (interval_ > std::chrono::milliseconds(MAX_WATCH_INTERVAL_MS)) {
        throw std::invalid_argument("watch interval must be at most " +
            std::to_string(MAX_WATCH_INTERVAL_MS) + " ms, got " +
            std::to_string(interval_.count()) + " ms");
    }
}

void WatchSession::init_state() {
    Bytes data;
    if (local_.read(data)) {
        state_.last_local = fingerprint(data);
    }
    else {
        local_reachable_ = false;
    }

    data.clear();
    if (remote_.read(data)) {
        state_.last_remote = fingerprint(data);
    }
    else {
        remote_reachable_ = false;
    }

    audit_log_level(LogLevel::INFO,
        "Initial state local=" + fingerprint_hex(state_.last_local).substr(0, 12) +
        " remote=" + fingerprint_hex(state_.last_remote).substr(0, 12),
        "watch_init",
        (local_reachable_ && remote_reachable_) ? "success" : "partial");
}

// Reads failing while the peer is offline are expected; only log transitions
void WatchSession::note_read(bool& reachable, bool ok, const char* side) {
    if (ok == reachable) return;
    reachable = ok;
    audit_log_level(LogLevel::INFO,
        std::string(side) + " clipboard " + (ok ? "readable again" : "unreadable"),
        "watch_read",
        ok ? "success" : "failure");
}

void WatchSession::notify_history(const char* kind, uint64_t bytes) {
    if (!on_history_) return;
    try {
        on_history_(kind, peer_.name, bytes);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::WARN,
            std::string("history hook failed: ") + e.what(),
            "watch_history",
            "failure");
    }
}

TickOutcome WatchSession::tick() {
    Bytes local;
    bool ok = local_.read(local);
    note_read(local_reachable_, ok, "local");
    if (!ok) {
        return TickOutcome::LOCAL_READ_FAILED;
    }
    Fingerprint local_fp = fingerprint(local);

    // Local changed, and is not what we last received
    if (local_fp != state_.last_local && local_fp != state_.last_remote) {
        if (!remote_.write(local)) {
            err_ << "watch: failed to send to " << peer_.name << std::endl;
            audit_log_level(LogLevel::WARN,
                "Send of " + std::to_string(local.size()) + " bytes failed",
                "watch_send",
                "failure");
            return TickOutcome::SEND_FAILED;
        }

        out_ << "→ sent " << format_size(local.size()) << " to " << peer_.name << std::endl;
        state_.last_local = local_fp;
        state_.last_remote = local_fp; // the peer now holds it; not a remote change
        audit_log_level(LogLevel::INFO,
            "Sent " + std::to_string(local.size()) + " bytes",
            "watch_send",
            "success");
        notify_history("watch:send", local.size());
        return TickOutcome::SENT;
    }

    Bytes remote;
    ok = remote_.read(remote);
    note_read(remote_reachable_, ok, "remote");
    if (!ok) {
        return TickOutcome::REMOTE_READ_FAILED;
    }
    Fingerprint remote_fp = fingerprint(remote);

    TickOutcome outcome = TickOutcome::IDLE;
    if (remote_fp != state_.last_remote && remote_fp != state_.last_local) {
        if (!local_.write(remote)) {
            err_ << "watch: failed to receive from " << peer_.name << std::endl;
            audit_log_level(LogLevel::WARN,
                "Receive of " + std::to_string(remote.size()) + " bytes failed",
                "watch_recv",
                "failure");
            outcome = TickOutcome::RECEIVE_FAILED;
        }
        else {
            out_ << "← received " << format_size(remote.size()) << " from " << peer_.name << std::endl;
            state_.last_remote = remote_fp;
            state_.last_local = remote_fp;
            audit_log_level(LogLevel::INFO,
                "Received " + std::to_string(remote.size()) + " bytes",
                "watch_recv",
                "success");
            notify_history("watch:recv", remote.size());
            outcome = TickOutcome::RECEIVED;
        }
    }

    // Track what was observed this tick. After a receive this puts last_local
    // back to the pre-write content; the next tick reads the written content,
    // finds it equal to last_remote and does not send it back.
    state_.last_local = local_fp;
    state_.last_remote = remote_fp;
    return outcome;
}

void WatchSession::run() {
    if (stopped_ || cancel_.cancelled()) {
        stopped_ = true;
        return;
    }

    audit_log_level(LogLevel::INFO,
        "Watch started with " + peer_.address + " every " +
        std::to_string(interval_.count()) + " ms",
        "watch",
        "notify");

    init_state();

    auto next = std::chrono::steady_clock::now() + interval_;
    while (!cancel_.wait_until(next)) {
        tick();

        // fixed rate; fires missed during a slow tick are dropped
        auto now = std::chrono::steady_clock::now();
        next += interval_;
        if (next <= now) {
            next = now + interval_;
        }
    }

    stopped_ = true;
    audit_log_level(LogLevel::INFO,
        "Watch stopped",
        "watch",
        "notify");
}
