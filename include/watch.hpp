#pragma once
#include "clipwire_common.hpp"
#include "clipboard.hpp"
#include "remote.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

// ---------- Cancellation ----------
// Set once, from any thread; wakes a waiting watch loop immediately.
class CancelToken {
public:
    void cancel();
    bool cancelled() const;

    // Sleeps until `deadline` or cancellation; true if cancelled
    bool wait_until(std::chrono::steady_clock::time_point deadline);

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

// Blocks SIGINT/SIGTERM in the calling thread (and threads it creates
// afterwards) and starts a detached thread that cancels `token` on receipt.
// Call before any other thread is started.
bool start_signal_listener(CancelToken& token);


// ---------- Sync state ----------
// Fingerprints of local and remote content as last observed or propagated
struct SyncState {
    Fingerprint last_local{};
    Fingerprint last_remote{};
};

enum class TickOutcome {
    IDLE,               // nothing changed (or change was an echo)
    SENT,               // local -> remote
    RECEIVED,           // remote -> local
    SEND_FAILED,
    RECEIVE_FAILED,
    LOCAL_READ_FAILED,
    REMOTE_READ_FAILED
};

const char* tick_outcome_str(TickOutcome outcome);

// kind is "watch:send" or "watch:recv"
using HistoryHook = std::function<void(const std::string& kind,
    const std::string& peer,
    uint64_t bytes)>;


// ---------- Watch session ----------
// Two-way clipboard sync with one peer, one tick per interval.
//
// A change is propagated only if its fingerprint differs from both tracked
// fingerprints; content that equals what was just sent or received is an
// echo and is left alone. Not reentrant; one session per peer.
class WatchSession {
public:
    // Throws std::invalid_argument unless
    // MIN_WATCH_INTERVAL_MS <= interval <= MAX_WATCH_INTERVAL_MS
    WatchSession(PeerDescriptor peer,
        LocalClipboard& local,
        RemoteClipboard& remote,
        CancelToken& cancel,
        std::chrono::milliseconds interval = std::chrono::milliseconds(DEFAULT_WATCH_INTERVAL_MS),
        HistoryHook on_history = HistoryHook(),
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr);

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    // Best-effort read of both sides; a failed read leaves the zero fingerprint
    void init_state();

    // One poll of both sides
    TickOutcome tick();

    // init_state(), then tick every interval until cancelled
    void run();

    const SyncState& state() const { return state_; }
    bool stopped() const { return stopped_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void note_read(bool& reachable, bool ok, const char* side);
    void notify_history(const char* kind, uint64_t bytes);

    PeerDescriptor peer_;
    LocalClipboard& local_;
    RemoteClipboard& remote_;
    CancelToken& cancel_;
    std::chrono::milliseconds interval_;
    HistoryHook on_history_;
    std::ostream& out_;
    std::ostream& err_;

    SyncState state_;
    bool local_reachable_ = true;
    bool remote_reachable_ = true;
    bool stopped_ = false;
};
