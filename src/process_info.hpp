#pragma once

#include <string>

namespace stackstop {

// Process state characters as reported by /proc/<pid>/stat:
// 'R' = Running/Runnable
// 'S' = Sleeping (interruptible)
// 'D' = Disk sleep (uninterruptible)
// 'Z' = Zombie
// 'T' = Stopped (signal or debugger)
// 'I' = Idle
// '?' = Unknown

struct ProcessInfo {
    int pid = 0;
    int parent_pid = 0;
    std::string name;
    std::string command_line;       // argv joined with single spaces
    char state_char = '?';
};

// A TCP socket in LISTEN state, as found in /proc/net/tcp{,6}
struct ListeningSocket {
    std::string protocol;           // "tcp" or "tcp6"
    int port = 0;
    unsigned long inode = 0;
};

} // namespace stackstop
