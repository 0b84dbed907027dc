#pragma once

#include <map>
#include <string>
#include "Crypto.hpp"
#include "Encoder.hpp"
#include "Logger.hpp"

namespace nexus_keycode {

// Process-level settings taken from the command line
struct GeneratorConfig {
    LogLevel logLevel = LogLevel::Warning;
    std::string logFile;
    bool consoleOutput = true;
    RetryPolicy retry;

    void apply() const;
};

// nexus_keycode <full|small> --type TYPE [--name value | --flag]...
class CommandLine {
public:
    // Throws std::invalid_argument on malformed arguments
    static CommandLine parse(int argc, const char* const argv[]);
    static std::string usage(const std::string& program);

    const std::string& family() const { return family_; }
    const std::string& type() const { return type_; }
    const GeneratorConfig& config() const { return config_; }

    bool has(const std::string& name) const;
    const std::string& option(const std::string& name) const;
    uint64_t number(const std::string& name, uint64_t maxValue) const;
    SecretKey key(const std::string& name) const;

private:
    std::string family_;
    std::string type_;
    std::map<std::string, std::string> options_;
    GeneratorConfig config_;
};

// Builds the message the command line asks for
Message buildMessage(const CommandLine& args);

} // namespace nexus_keycode
