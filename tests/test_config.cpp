#define BOOST_TEST_MODULE config
#include <boost/test/unit_test.hpp>

#include "TestSupport.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

using ftpget::core::Config;
using ftpget::core::Logger;
using ftpget::core::LogLevel;
using namespace ftpget::test;

namespace {

struct ConfigFixture {
    ConfigFixture() { Config::instance().setDefaults(); }
    ~ConfigFixture() { Config::instance().setDefaults(); }

    TempDir dir;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ConfigTest, ConfigFixture)

BOOST_AUTO_TEST_CASE(defaults_match_transfer_defaults) {
    auto& config = Config::instance();

    BOOST_CHECK_EQUAL(config.get<int>("transfer.chunkSize"), 8192);
    BOOST_CHECK(config.get<bool>("transfer.binary"));
    BOOST_CHECK(!config.get<bool>("transfer.overwrite"));
    BOOST_CHECK(config.get<bool>("transfer.createDir"));
    BOOST_CHECK_EQUAL(config.get<int>("ftp.port"), 21);
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.username"), "anonymous");
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.password"), "abc@def.org");
    BOOST_CHECK_EQUAL(config.get<long>("ftp.connectTimeoutSeconds"), 30);
    BOOST_CHECK_EQUAL(config.get<std::string>("logging.level"), "info");
    BOOST_CHECK_EQUAL(config.get<int>("ui.pollIntervalMs"), 200);
}

BOOST_AUTO_TEST_CASE(missing_key_or_wrong_type_yields_default) {
    auto& config = Config::instance();

    BOOST_CHECK(!config.has("ftp.account"));
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.account", "none"), "none");
    BOOST_CHECK_EQUAL(config.get<int>("ftp.username", -1), -1);
}

BOOST_AUTO_TEST_CASE(set_then_get) {
    auto& config = Config::instance();

    config.set("ftp.port", 2121);
    config.set("ftp.account", std::string("ops"));

    BOOST_CHECK_EQUAL(config.get<int>("ftp.port"), 2121);
    BOOST_CHECK(config.has("ftp.account"));
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.account"), "ops");
}

BOOST_AUTO_TEST_CASE(load_merges_over_defaults) {
    const auto path = dir / "config.json";
    writeFile(path, R"({"ftp": {"username": "mirror", "port": 2100}, "transfer": {"overwrite": true}})");

    auto& config = Config::instance();
    BOOST_REQUIRE(config.load(path.string()));

    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.username"), "mirror");
    BOOST_CHECK_EQUAL(config.get<int>("ftp.port"), 2100);
    BOOST_CHECK(config.get<bool>("transfer.overwrite"));
    // Untouched keys keep their defaults
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.password"), "abc@def.org");
    BOOST_CHECK_EQUAL(config.get<int>("transfer.chunkSize"), 8192);
}

BOOST_AUTO_TEST_CASE(load_rejects_missing_or_malformed_file) {
    auto& config = Config::instance();

    BOOST_CHECK(!config.load((dir / "absent.json").string()));

    const auto path = dir / "broken.json";
    writeFile(path, "{\"ftp\": ");
    BOOST_CHECK(!config.load(path.string()));
    BOOST_CHECK_EQUAL(config.get<std::string>("ftp.username"), "anonymous");
}

BOOST_AUTO_TEST_CASE(ranged_integer_accepts_values_in_range) {
    auto& config = Config::instance();

    BOOST_CHECK_EQUAL(config.getInRange("ftp.port", 21, 1, 65535), 21);
    BOOST_CHECK_EQUAL(config.getInRange("ftp.account", 7, 1, 65535), 7);

    config.set("ftp.port", 65535);
    BOOST_CHECK_EQUAL(config.getInRange("ftp.port", 21, 1, 65535), 65535);
}

BOOST_AUTO_TEST_CASE(ranged_integer_rejects_values_that_would_wrap) {
    const auto path = dir / "config.json";
    writeFile(path, R"({"ftp": {"port": 65557}, "transfer": {"chunkSize": -1}})");

    auto& config = Config::instance();
    BOOST_REQUIRE(config.load(path.string()));

    BOOST_CHECK_THROW(config.getInRange("ftp.port", 21, 1, 65535), std::out_of_range);
    BOOST_CHECK_THROW(config.getInRange("transfer.chunkSize", 8192, 0, 1 << 26),
                      std::out_of_range);

    config.set("ftp.port", std::string("21"));
    BOOST_CHECK_THROW(config.getInRange("ftp.port", 21, 1, 65535), std::out_of_range);
    config.set("ftp.port", 18446744073709551615ull);
    BOOST_CHECK_THROW(config.getInRange("ftp.port", 21, 1, 65535), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LoggerTest)

BOOST_AUTO_TEST_CASE(parses_level_names) {
    BOOST_CHECK(Logger::parseLevel("trace") == LogLevel::Trace);
    BOOST_CHECK(Logger::parseLevel("DEBUG") == LogLevel::Debug);
    BOOST_CHECK(Logger::parseLevel("warning") == LogLevel::Warn);
    BOOST_CHECK(Logger::parseLevel("Error") == LogLevel::Error);
    BOOST_CHECK(Logger::parseLevel("critical") == LogLevel::Critical);
    BOOST_CHECK(Logger::parseLevel("off") == LogLevel::Off);
    BOOST_CHECK(Logger::parseLevel("verbose") == LogLevel::Info);
}

BOOST_AUTO_TEST_CASE(file_sink_receives_trace_and_critical) {
    TempDir dir;
    Logger::instance().initialize(LogLevel::Trace, dir.path().string());

    LOG_TRACE("chunk of {} bytes written", 8192);
    LOG_CRITICAL("Unhandled exception: {}", "boom");

    const std::string log = readFile(dir / "ftpget.log");
    Logger::instance().initialize(LogLevel::Warn);

    BOOST_CHECK(log.find("[trace]") != std::string::npos);
    BOOST_CHECK(log.find("chunk of 8192 bytes written") != std::string::npos);
    BOOST_CHECK(log.find("[critical] [") != std::string::npos);
    BOOST_CHECK(log.find("Unhandled exception: boom") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
