#include "ClusterConfig.h"
#include "common/errors.hpp"
#include "utils/logger.hpp"
#include <filesystem>

namespace Kdc {
    namespace fs = std::filesystem;

    ClusterConfig ClusterConfig::Of(const std::string &path,
                                    u16 port,
                                    const std::string &cuk,
                                    bool auto_rejoin,
                                    bool retry_rejoin_forever,
                                    bool cleanup) {
        if (path.empty()) {
            throw InvalidArgument("cluster config path should not be empty");
        }

        std::error_code ec;
        fs::path abs_path = fs::absolute(path, ec);
        if (ec) {
            throw ConnectionError("cannot resolve cluster config path " + path + ": " + ec.message());
        }
        if (!fs::exists(abs_path, ec)) {
            KDC_LOG_ERROR("Cluster config {} doesn't exist", abs_path.string());
            throw ConnectionError("cluster config " + abs_path.string() + " doesn't exist");
        }

        ClusterConfig config;
        config.path_ = abs_path.lexically_normal().string();
        config.port_ = port;
        config.cuk_ = cuk;
        config.auto_rejoin_ = auto_rejoin;
        config.retry_rejoin_forever_ = retry_rejoin_forever;
        config.cleanup_ = cleanup;
        return config;
    }

    ClusterConfig ClusterConfig::WithNativeLog(const std::string &log_file,
                                               NativeStackLogLevel stack_level,
                                               NativeLogLevel level) const {
        ClusterConfig copy = *this;
        if (log_file.empty()) {
            copy.native_log_file_.reset();
        } else {
            copy.native_log_file_ = fs::absolute(log_file).lexically_normal().string();
        }
        copy.native_stack_log_level_ = stack_level;
        copy.native_log_level_ = level;
        return copy;
    }

    std::string ClusterConfig::ToString() const {
        return fmt::format("ClusterConfig[path={}, port={}, cuk={}, auto_rejoin={}, retry_rejoin_forever={}, "
                           "cleanup={}, native_log_level={}, native_stack_log_level={}, native_log_file={}]",
                           path_, port_, cuk_, auto_rejoin_, retry_rejoin_forever_, cleanup_,
                           Kdc::ToString(native_log_level_), Kdc::ToString(native_stack_log_level_),
                           native_log_file_.value_or(""));
    }

}// namespace Kdc
