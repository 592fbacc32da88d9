#pragma once

#include "../interfaces/i_port_lookup.hpp"
#include "../procfs_reader.hpp"

namespace stackstop {

// Native lookup: LISTEN entries of /proc/net/tcp{,6} matched against the
// socket inodes each process holds in /proc/<pid>/fd.
class ProcfsPortLookup : public IPortLookup {
public:
    explicit ProcfsPortLookup(ProcfsReader reader = ProcfsReader());
    ~ProcfsPortLookup() override = default;

    [[nodiscard]] std::string name() const override { return "procfs"; }
    [[nodiscard]] bool available() const override;
    std::optional<int> find_listener(int port) override;

private:
    ProcfsReader reader_;
};

} // namespace stackstop
