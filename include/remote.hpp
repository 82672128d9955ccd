#pragma once
#include "clipwire_common.hpp"

#include <string>
#include <vector>

// -------- Remote clipboard capability --------
// false from read/write is a transient failure; no detail is given
class RemoteClipboard {
public:
    virtual ~RemoteClipboard() = default;
    virtual bool read(Bytes& out) = 0;
    virtual bool write(const Bytes& data) = 0;
};

// Peer clipboard reached with `ssh <address> <remote_cmd> paste|copy`
class SshRemoteClipboard : public RemoteClipboard {
public:
    // quiet: ssh stderr goes to /dev/null (polling an offline peer)
    explicit SshRemoteClipboard(PeerDescriptor peer, bool quiet = true)
        : peer_(std::move(peer)), quiet_(quiet)
    {
    }

    bool read(Bytes& out) override;
    bool write(const Bytes& data) override;

    const PeerDescriptor& peer() const { return peer_; }

private:
    PeerDescriptor peer_;
    bool quiet_ = true;
};

// argv for one request; verb is "paste" or "copy"
std::vector<std::string> remote_command(const PeerDescriptor& peer, const char* verb);
