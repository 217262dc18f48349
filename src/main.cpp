#include "config.hpp"
#include "router.hpp"

#include <rtc/rtc.hpp>

#include <iostream>

namespace {

rtc::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "fatal") return rtc::LogLevel::Fatal;
    if (level == "error") return rtc::LogLevel::Error;
    if (level == "warning") return rtc::LogLevel::Warning;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "verbose") return rtc::LogLevel::Verbose;
    return rtc::LogLevel::Info;
}

} // namespace

int main(int argc, char** argv) {
    sfuctl::Config config;
    if (argc > 1) {
        try {
            config = sfuctl::LoadConfig(argv[1]);
        } catch (const sfuctl::ConfigError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    rtc::InitLogger(ParseLogLevel(config.logLevel));
    sfuctl::Router router(std::move(config));
    router.Run();

    return 0;
}
