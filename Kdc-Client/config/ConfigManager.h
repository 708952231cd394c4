#pragma once
#include "ClusterConfig.h"
#include "CommandLineConfig.h"
#include "IConfigSource.h"
#include "core/singleton.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace Kdc::apps {

    // 配置管理器（单例，统一管理所有配置源，最后加入的配置源优先）
    class ConfigManager : public Singleton<ConfigManager> {
        friend class Singleton<ConfigManager>;

    public:
        ~ConfigManager() = default;

        bool initialize(int argc, char *argv[]) {
            std::lock_guard<std::mutex> lock(mutex_);

            auto cmd_config = std::make_unique<CommandLineConfig>();
            if (!cmd_config->initialize(argc, argv)) {
                return false;
            }
            config_sources_.push_back(std::move(cmd_config));
            return true;
        }

        std::string getClusterConfigPath() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return getLatestConfig()->getClusterConfigPath();
        }

        uint16_t getPort() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return getLatestConfig()->getPort();
        }

        Kdc::LogLevel getLogLevel() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return getLatestConfig()->getLogLevel();
        }

        bool getEnableLoggingFile() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return getLatestConfig()->getEnableLoggingFile();
        }

        std::string getLogDir() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return getLatestConfig()->getLogDir();
        }

        void setLogLevel(Kdc::LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &source: config_sources_) {
                source->setLogLevel(level);
            }
        }

        /**
         * 由最新的配置源生成集群配置
         * 路径为空抛出 InvalidArgument，文件不存在抛出 ConnectionError
         */
        ClusterConfig BuildClusterConfig() const {
            std::lock_guard<std::mutex> lock(mutex_);
            const IConfigSource *source = getLatestConfig();
            return ClusterConfig::Of(source->getClusterConfigPath(),
                                     source->getPort(),
                                     source->getCuk(),
                                     source->getAutoRejoin(),
                                     source->getRetryRejoinForever(),
                                     source->getCleanup())
                    .WithNativeLog(source->getNativeLogFile(),
                                   source->getNativeStackLogLevel(),
                                   source->getNativeLogLevel());
        }

    private:
        ConfigManager() = default;

        const IConfigSource *getLatestConfig() const {
            if (config_sources_.empty()) {
                throw std::runtime_error("No config sources initialized");
            }
            return config_sources_.back().get();
        }

        mutable std::mutex mutex_;
        std::vector<std::unique_ptr<IConfigSource>> config_sources_;
    };

}// namespace Kdc::apps
