#pragma once

#include "interfaces/i_clock.hpp"
#include "interfaces/i_port_lookup.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_table.hpp"

#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stackstop::fakes {

// Time only moves when someone sleeps
class FakeClock : public IClock {
public:
    void sleep_for(std::chrono::milliseconds duration) override {
        now += duration;
        sleeps.push_back(duration);
    }

    std::chrono::milliseconds now{0};
    std::vector<std::chrono::milliseconds> sleeps;
};

struct FakeProcess {
    std::string command_line;
    bool alive = true;
    // How long after SIGTERM the process exits; nullopt ignores SIGTERM
    std::optional<std::chrono::milliseconds> exits_after_term = std::chrono::milliseconds{0};
    bool dies_on_kill = true;
    SignalStatus term_status = SignalStatus::delivered;
    SignalStatus kill_status = SignalStatus::delivered;
    std::optional<std::chrono::milliseconds> term_received_at;
};

struct SentSignal {
    int pid = 0;
    bool force = false;
};

// Process table and signal delivery over a scripted set of processes
class FakeSystem : public IProcessKiller, public IProcessTable {
public:
    explicit FakeSystem(FakeClock* clock) : clock_(clock) {}

    FakeProcess& spawn(int pid, std::string command_line = {}) {
        auto& process = processes[pid];
        process.command_line = std::move(command_line);
        return process;
    }

    bool is_running(int pid) override {
        ++probes;
        auto it = processes.find(pid);
        if (it == processes.end()) return false;
        advance(it->second);
        return it->second.alive;
    }

    KillResult kill_process(int pid, bool force) override {
        signals.push_back({pid, force});

        KillResult result;
        auto it = processes.find(pid);
        if (it == processes.end() || !it->second.alive) {
            result.status = SignalStatus::target_vanished;
            result.error_message = "Process not found.";
            return result;
        }

        auto& process = it->second;
        result.status = force ? process.kill_status : process.term_status;
        if (result.status != SignalStatus::delivered) {
            result.error_message = "scripted failure";
            return result;
        }

        if (force) {
            if (process.dies_on_kill) process.alive = false;
        } else {
            process.term_received_at = clock_->now;
            advance(process);
        }
        return result;
    }

    std::vector<ProcessInfo> get_all_processes() override {
        std::vector<ProcessInfo> result;
        for (auto& [pid, process] : processes) {
            advance(process);
            if (!process.alive) continue;
            ProcessInfo info;
            info.pid = pid;
            info.command_line = process.command_line;
            info.state_char = 'S';
            result.push_back(info);
        }
        return result;
    }

    [[nodiscard]] int count_signals(bool force) const {
        int count = 0;
        for (const auto& signal : signals) {
            if (signal.force == force) ++count;
        }
        return count;
    }

    std::map<int, FakeProcess> processes;
    std::vector<SentSignal> signals;
    int probes = 0;

private:
    void advance(FakeProcess& process) const {
        if (process.alive && process.term_received_at && process.exits_after_term &&
            clock_->now - *process.term_received_at >= *process.exits_after_term) {
            process.alive = false;
        }
    }

    FakeClock* clock_;
};

class FakePortLookup : public IPortLookup {
public:
    explicit FakePortLookup(std::string name = "fake", bool available = true)
        : name_(std::move(name)), available_(available) {}

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] bool available() const override { return available_; }

    std::optional<int> find_listener(int port) override {
        queried_ports.push_back(port);
        if (auto it = listeners.find(port); it != listeners.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::map<int, int> listeners;
    std::vector<int> queried_ports;

private:
    std::string name_;
    bool available_;
};

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "stackstop-test-XXXXXX").string();
        if (mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::filesystem::path& relative, const std::string& content) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream(target) << content;
        return target;
    }

    std::filesystem::path mkdir(const std::filesystem::path& relative) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target);
        return target;
    }

private:
    std::filesystem::path path_;
};

} // namespace stackstop::fakes
