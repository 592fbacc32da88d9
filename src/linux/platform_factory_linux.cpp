#include "../platform_factory.hpp"
#include "../port_lookup_chain.hpp"

#include "linux_process_table.hpp"
#include "linux_process_killer.hpp"
#include "procfs_port_lookup.hpp"
#include "command_port_lookup.hpp"

namespace stackstop {

std::unique_ptr<IProcessTable> make_process_table() {
    return std::make_unique<LinuxProcessTable>();
}

std::unique_ptr<IPortLookup> make_port_lookup() {
    auto chain = std::make_unique<PortLookupChain>();
    chain->add(std::make_unique<ProcfsPortLookup>());
    chain->add(std::make_unique<CommandPortLookup>(CommandPortLookup::Tool::lsof));
    chain->add(std::make_unique<CommandPortLookup>(CommandPortLookup::Tool::ss));
    chain->add(std::make_unique<CommandPortLookup>(CommandPortLookup::Tool::netstat));
    return chain;
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<LinuxProcessKiller>();
}

} // namespace stackstop
