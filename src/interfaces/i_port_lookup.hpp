#pragma once

#include <optional>
#include <string>

namespace stackstop {

// Maps a listening TCP port to the process that owns it.
class IPortLookup {
public:
    virtual ~IPortLookup() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // False when the mechanism cannot work on this host (missing tool, no procfs)
    [[nodiscard]] virtual bool available() const = 0;

    // Lowest pid listening on the port, if any
    virtual std::optional<int> find_listener(int port) = 0;
};

} // namespace stackstop
