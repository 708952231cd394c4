#pragma once
#include "ClusterConfig.h"
#include "IConfigSource.h"
#include "args.hxx"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace Kdc::apps {

    class CommandLineConfig : public IConfigSource {
    public:
        CommandLineConfig()
            : port_(ClusterConfig::kDefaultPort),
              auto_rejoin_(ClusterConfig::kDefaultAutoRejoin),
              retry_rejoin_forever_(ClusterConfig::kDefaultRetryRejoinForever),
              cleanup_(ClusterConfig::kDefaultCleanup),
              log_level_(Kdc::LogLevel::INFO),
              enable_logging_file_(false),
              log_dir_("logs"),
              native_log_level_(ClusterConfig::kDefaultNativeLogLevel),
              native_stack_log_level_(ClusterConfig::kDefaultNativeStackLogLevel) {}

        bool initialize(int argc, char *argv[]) override {
            std::lock_guard<std::mutex> lock(mutex_);
            return parseArguments(argc, argv);
        }

        std::string getClusterConfigPath() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return cluster_config_path_;
        }

        uint16_t getPort() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return port_;
        }

        std::string getCuk() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return cuk_;
        }

        bool getAutoRejoin() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return auto_rejoin_;
        }

        bool getRetryRejoinForever() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return retry_rejoin_forever_;
        }

        bool getCleanup() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return cleanup_;
        }

        Kdc::LogLevel getLogLevel() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return log_level_;
        }

        bool getEnableLoggingFile() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return enable_logging_file_;
        }

        std::string getLogDir() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return log_dir_;
        }

        NativeLogLevel getNativeLogLevel() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return native_log_level_;
        }

        NativeStackLogLevel getNativeStackLogLevel() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return native_stack_log_level_;
        }

        std::string getNativeLogFile() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return native_log_file_;
        }

        void setLogLevel(Kdc::LogLevel level) override {
            std::lock_guard<std::mutex> lock(mutex_);
            log_level_ = level;
        }

    private:
        // 实际参数解析逻辑
        bool parseArguments(int argc, char *argv[]) {
            args::ArgumentParser parser("kdc client", "Client shell for a k2hdkc-style key-value cluster.");
            args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
            args::ValueFlag<std::string> conf(parser, "file", "Cluster configuration file", {'c', "conf"}, "");
            args::ValueFlag<int> port(parser, "port", "Control port of the membership process", {'p', "port"},
                                      ClusterConfig::kDefaultPort);
            args::ValueFlag<std::string> cuk(parser, "cuk", "Cluster unique key", {"cuk"}, "");
            args::ValueFlag<std::string> rejoin(parser, "bool", "Rejoin the cluster automatically", {"rejoin"}, "true");
            args::ValueFlag<std::string> rejoin_forever(parser, "bool", "Retry rejoining forever", {"rejoin-forever"}, "true");
            args::ValueFlag<std::string> cleanup(parser, "bool", "Clean up on close", {"cleanup"}, "true");
            args::ValueFlag<std::string> log_level(parser, "level", "Log level (trace/debug/info/warn/error/fatal)",
                                                   {'l', "loglevel"}, "info");
            args::ValueFlag<std::string> native_level(parser, "level", "Native log level (silent/error/warning/info/dump)",
                                                      {"native-loglevel"}, "error");
            args::ValueFlag<std::string> native_stack(parser, "stack",
                                                      "Native log stack (silent/comlog/client/membership/storage)",
                                                      {"native-stack"}, "silent");
            args::ValueFlag<std::string> native_file(parser, "file", "Native log file", {"native-logfile"}, "");
            args::ValueFlag<std::string> enable_log_file(parser, "bool", "Enable file logging", {'f', "logfile"}, "false");
            args::ValueFlag<std::string> log_dir(parser, "dir", "Directory of log files", {"logdir"}, "logs");

            try {
                parser.ParseCLI(argc, argv);
            } catch (const args::Help &) {
                std::cout << parser;
                return false;
            } catch (const args::ParseError &e) {
                std::cerr << "Command line parse error: " << e.what() << std::endl;
                std::cerr << parser;
                return false;
            } catch (const args::ValidationError &e) {
                std::cerr << "Command line validation error: " << e.what() << std::endl;
                return false;
            }

            try {
                int port_value = args::get(port);
                if (port_value < 0 || port_value > 65535) {
                    throw std::invalid_argument("port out of range: " + std::to_string(port_value));
                }
                cluster_config_path_ = args::get(conf);
                port_ = static_cast<uint16_t>(port_value);
                cuk_ = args::get(cuk);
                auto_rejoin_ = parseBool(args::get(rejoin));
                retry_rejoin_forever_ = parseBool(args::get(rejoin_forever));
                cleanup_ = parseBool(args::get(cleanup));
                log_level_ = Kdc::ParseLogLevel(args::get(log_level));
                native_log_level_ = ParseNativeLogLevel(args::get(native_level));
                native_stack_log_level_ = ParseNativeStackLogLevel(args::get(native_stack));
                native_log_file_ = args::get(native_file);
                enable_logging_file_ = parseBool(args::get(enable_log_file));
                log_dir_ = args::get(log_dir);
            } catch (const std::invalid_argument &e) {
                std::cerr << "Invalid option value: " << e.what() << std::endl;
                return false;
            }
            return true;
        }

        // true/false/1/0/yes/no/on/off
        static bool parseBool(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (text == "true" || text == "1" || text == "yes" || text == "on") {
                return true;
            }
            if (text == "false" || text == "0" || text == "no" || text == "off") {
                return false;
            }
            throw std::invalid_argument("invalid boolean: " + text);
        }

        mutable std::mutex mutex_;
        std::string cluster_config_path_;
        uint16_t port_;
        std::string cuk_;
        bool auto_rejoin_;
        bool retry_rejoin_forever_;
        bool cleanup_;
        Kdc::LogLevel log_level_;
        bool enable_logging_file_;
        std::string log_dir_;
        NativeLogLevel native_log_level_;
        NativeStackLogLevel native_stack_log_level_;
        std::string native_log_file_;
    };

}// namespace Kdc::apps
