#pragma once

#include "interfaces/i_port_lookup.hpp"
#include <memory>
#include <vector>

namespace stackstop {

// Tries each backend in order; the first one that finds a listener wins.
class PortLookupChain : public IPortLookup {
public:
    PortLookupChain() = default;
    ~PortLookupChain() override = default;

    // Unavailable backends are dropped here
    void add(std::unique_ptr<IPortLookup> backend);

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] bool available() const override { return !backends_.empty(); }
    std::optional<int> find_listener(int port) override;

    [[nodiscard]] size_t size() const { return backends_.size(); }

private:
    std::vector<std::unique_ptr<IPortLookup>> backends_;
};

} // namespace stackstop
