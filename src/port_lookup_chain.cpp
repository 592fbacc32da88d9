#include "port_lookup_chain.hpp"

namespace stackstop {

void PortLookupChain::add(std::unique_ptr<IPortLookup> backend) {
    if (backend && backend->available()) {
        backends_.push_back(std::move(backend));
    }
}

std::string PortLookupChain::name() const {
    if (backends_.empty()) {
        return "none";
    }

    std::string result;
    for (const auto& backend : backends_) {
        if (!result.empty()) result += " -> ";
        result += backend->name();
    }
    return result;
}

std::optional<int> PortLookupChain::find_listener(int port) {
    for (const auto& backend : backends_) {
        if (auto pid = backend->find_listener(port)) {
            return pid;
        }
    }
    return std::nullopt;
}

} // namespace stackstop
