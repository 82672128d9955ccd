#include "remote.hpp"
#include "process.hpp"

std::vector<std::string> remote_command(const PeerDescriptor& peer, const char* verb) {
    return { "ssh", peer.address, peer.remote_cmd, verb };
}

bool SshRemoteClipboard::read(Bytes& out) {
    return run_capture(remote_command(peer_, "paste"), out, quiet_);
}

bool SshRemoteClipboard::write(const Bytes& data) {
    return run_with_input(remote_command(peer_, "copy"), data, quiet_);
}
