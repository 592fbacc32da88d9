#include "role.hpp"
#include <format>

namespace stackstop {

namespace {

constexpr std::string_view kBenchHelper = "frappe.utils.bench_helper frappe";

Role bench_command(std::string name, std::string_view command) {
    Role role;
    role.name = std::move(name);
    role.command_pattern = std::format("{} {}", kBenchHelper, command);
    role.grace_timeout = kAppGraceTimeout;
    return role;
}

Role node_process(std::string name, std::string pattern) {
    Role role;
    role.name = std::move(name);
    role.command_pattern = std::move(pattern);
    role.grace_timeout = kAuxGraceTimeout;
    return role;
}

Role redis_store(const RunContext& context, std::string_view store) {
    Role role;
    role.name = std::format("Redis ({})", store);
    role.pid_file = context.pids_dir / std::format("redis_{}.pid", store);
    role.port_source = PortSource{PortSource::Format::redis_conf,
                                  context.config_dir / std::format("redis_{}.conf", store), {}};
    role.grace_timeout = kAuxGraceTimeout;
    return role;
}

PortSource site_config_port(const RunContext& context, std::string key) {
    return PortSource{PortSource::Format::json_key, context.common_site_config(), std::move(key)};
}

} // namespace

std::vector<Role> default_roles(const RunContext& context) {
    std::vector<Role> roles;

    // Workers first so they can finish their current jobs
    roles.push_back(bench_command("Bench Worker", "worker"));
    roles.push_back(bench_command("Bench Schedule", "schedule"));

    roles.push_back(bench_command("Bench Watch", "watch"));
    roles.push_back(node_process("Esbuild Watch", "esbuild --watch"));
    roles.push_back(node_process("Yarn Watch", "yarn run watch"));

    Role serve = bench_command("Bench Serve", "serve");
    serve.port_source = site_config_port(context, "webserver_port");
    roles.push_back(std::move(serve));

    Role socketio = node_process("Socket.io", "socketio.js");
    socketio.port_source = site_config_port(context, "socketio_port");
    roles.push_back(std::move(socketio));

    // Stores last, everything above may still be talking to them
    roles.push_back(redis_store(context, "cache"));
    roles.push_back(redis_store(context, "queue"));
    roles.push_back(redis_store(context, "socketio"));

    return roles;
}

} // namespace stackstop
