#include "config_readers.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace stackstop;
using stackstop::fakes::TempDir;

TEST(ConfigReaders, pid_file_trims_whitespace) {
    EXPECT_EQ(parse_pid("  4242\n"), 4242);
    EXPECT_EQ(parse_pid("17"), 17);
}

TEST(ConfigReaders, pid_zero_or_garbage_is_no_process) {
    EXPECT_FALSE(parse_pid(""));
    EXPECT_FALSE(parse_pid("0"));
    EXPECT_FALSE(parse_pid("-5"));
    EXPECT_FALSE(parse_pid("12ab"));
    EXPECT_FALSE(parse_pid("\n\n"));
}

TEST(ConfigReaders, missing_pid_file_is_empty) {
    TempDir dir;
    EXPECT_FALSE(read_pid_file(dir.path() / "pids" / "redis_cache.pid"));
}

TEST(ConfigReaders, reads_pid_file) {
    TempDir dir;
    const auto file = dir.write("pids/redis_cache.pid", "31337\n");
    EXPECT_EQ(read_pid_file(file), 31337);
}

TEST(ConfigReaders, redis_port_directive) {
    EXPECT_EQ(parse_redis_port("dbfilename redis_cache.rdb\nport 13000\nmaxmemory 294mb\n"), 13000);
    EXPECT_EQ(parse_redis_port("  port\t11000  \n"), 11000);
    EXPECT_EQ(parse_redis_port("PORT 12000\n"), 12000);
}

TEST(ConfigReaders, redis_last_port_wins) {
    EXPECT_EQ(parse_redis_port("port 13000\nport 13001\n"), 13001);
}

TEST(ConfigReaders, redis_ignores_comments_and_similar_keys) {
    EXPECT_FALSE(parse_redis_port("# port 13000\ntls-port 6380\n"));
    EXPECT_EQ(parse_redis_port("# port 1\nport 13000\n"), 13000);
}

TEST(ConfigReaders, redis_port_zero_disables_tcp) {
    EXPECT_FALSE(parse_redis_port("port 0\n"));
    EXPECT_FALSE(parse_redis_port("port 70000\n"));
}

TEST(ConfigReaders, missing_redis_config_is_empty) {
    TempDir dir;
    EXPECT_FALSE(read_redis_port(dir.path() / "redis_cache.conf"));
}

TEST(ConfigReaders, json_numeric_value) {
    EXPECT_EQ(parse_json_port(R"({"webserver_port": 8000, "socketio_port": 9000})", "socketio_port"), 9000);
    EXPECT_EQ(parse_json_port("{\n  \"webserver_port\"  :\n 8001\n}", "webserver_port"), 8001);
}

TEST(ConfigReaders, json_url_value) {
    const std::string config = R"({
 "redis_cache": "redis://127.0.0.1:13000",
 "redis_queue": "redis://localhost:11000/0",
 "redis_socketio": "12000"
})";
    EXPECT_EQ(parse_json_port(config, "redis_cache"), 13000);
    EXPECT_EQ(parse_json_port(config, "redis_queue"), 11000);
    EXPECT_EQ(parse_json_port(config, "redis_socketio"), 12000);
}

TEST(ConfigReaders, json_nested_key) {
    const std::string config = R"({"services": {"realtime": {"socketio_port": 9100}}})";
    EXPECT_EQ(parse_json_port(config, "socketio_port"), 9100);
}

TEST(ConfigReaders, json_top_level_key_wins_over_nested) {
    const std::string config = R"({"apps": {"webserver_port": 1}, "webserver_port": 8000})";
    EXPECT_EQ(parse_json_port(config, "webserver_port"), 8000);
}

TEST(ConfigReaders, json_escaped_key) {
    EXPECT_EQ(parse_json_port(R"({"webserver\u005fport": 9000})", "webserver_port"), 9000);
}

TEST(ConfigReaders, json_integral_float_value) {
    EXPECT_EQ(parse_json_port(R"({"webserver_port": 8000.0})", "webserver_port"), 8000);
    EXPECT_FALSE(parse_json_port(R"({"webserver_port": 8000.5})", "webserver_port"));
}

TEST(ConfigReaders, json_malformed_document) {
    EXPECT_FALSE(parse_json_port(R"({"webserver_port": 8000)", "webserver_port"));
}

TEST(ConfigReaders, json_key_used_as_value_is_skipped) {
    const std::string config = R"({"label": "socketio_port", "socketio_port": 9200})";
    EXPECT_EQ(parse_json_port(config, "socketio_port"), 9200);
}

TEST(ConfigReaders, json_missing_or_unusable_value) {
    EXPECT_FALSE(parse_json_port(R"({"webserver_port": 8000})", "socketio_port"));
    EXPECT_FALSE(parse_json_port(R"({"socketio_port": "not-a-port"})", "socketio_port"));
    EXPECT_FALSE(parse_json_port(R"({"socketio_port": null})", "socketio_port"));
    EXPECT_FALSE(parse_json_port(R"({"socketio_port": 0})", "socketio_port"));
}

TEST(ConfigReaders, read_port_dispatches_on_format) {
    TempDir dir;
    const auto conf = dir.write("config/redis_queue.conf", "port 11000\n");
    const auto json = dir.write("sites/common_site_config.json", R"({"webserver_port": 8000})");

    EXPECT_EQ(read_port(PortSource{PortSource::Format::redis_conf, conf, {}}), 11000);
    EXPECT_EQ(read_port(PortSource{PortSource::Format::json_key, json, "webserver_port"}), 8000);
    EXPECT_FALSE(read_port(PortSource{PortSource::Format::json_key, dir.path() / "absent.json", "webserver_port"}));
}

TEST(ConfigReaders, readers_leave_files_untouched) {
    TempDir dir;
    const auto file = dir.write("pids/redis_queue.pid", "99\n");
    const auto before = std::filesystem::last_write_time(file);

    EXPECT_EQ(read_pid_file(file), 99);
    EXPECT_EQ(std::filesystem::last_write_time(file), before);
    EXPECT_TRUE(std::filesystem::exists(file));
}
