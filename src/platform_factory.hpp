#pragma once

#include "interfaces/i_process_table.hpp"
#include "interfaces/i_port_lookup.hpp"
#include "interfaces/i_process_killer.hpp"
#include <memory>

namespace stackstop {

// Factory functions to create platform-specific backends.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<IProcessTable> make_process_table();
std::unique_ptr<IPortLookup> make_port_lookup(); // primary plus every fallback found on this host
std::unique_ptr<IProcessKiller> make_process_killer();

} // namespace stackstop
