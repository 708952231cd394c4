#include "native_log.hpp"
#include "errors.hpp"
#include <unordered_map>

namespace Kdc {

    std::string ToString(NativeLogLevel level) {
        switch (level) {
            case NativeLogLevel::Silent:
                return "silent";
            case NativeLogLevel::Error:
                return "error";
            case NativeLogLevel::Warning:
                return "warning";
            case NativeLogLevel::Info:
                return "info";
            case NativeLogLevel::Dump:
                return "dump";
        }
        return "unknown";
    }

    std::string ToString(NativeStackLogLevel level) {
        switch (level) {
            case NativeStackLogLevel::Silent:
                return "silent";
            case NativeStackLogLevel::Comlog:
                return "comlog";
            case NativeStackLogLevel::Client:
                return "client";
            case NativeStackLogLevel::Membership:
                return "membership";
            case NativeStackLogLevel::Storage:
                return "storage";
        }
        return "unknown";
    }

    std::string ToString(NativeLayer layer) {
        switch (layer) {
            case NativeLayer::Client:
                return "client";
            case NativeLayer::Membership:
                return "membership";
            case NativeLayer::Storage:
                return "storage";
        }
        return "unknown";
    }

    NativeLogLevel ParseNativeLogLevel(const std::string &text) {
        static const std::unordered_map<std::string, NativeLogLevel> level_map = {
                {"silent", NativeLogLevel::Silent},
                {"error", NativeLogLevel::Error},
                {"warning", NativeLogLevel::Warning},
                {"warn", NativeLogLevel::Warning},
                {"info", NativeLogLevel::Info},
                {"dump", NativeLogLevel::Dump}};

        auto it = level_map.find(text);
        if (it == level_map.end()) {
            throw InvalidArgument("invalid native log level: " + text);
        }
        return it->second;
    }

    NativeStackLogLevel ParseNativeStackLogLevel(const std::string &text) {
        static const std::unordered_map<std::string, NativeStackLogLevel> level_map = {
                {"silent", NativeStackLogLevel::Silent},
                {"comlog", NativeStackLogLevel::Comlog},
                {"client", NativeStackLogLevel::Client},
                {"membership", NativeStackLogLevel::Membership},
                {"storage", NativeStackLogLevel::Storage}};

        auto it = level_map.find(text);
        if (it == level_map.end()) {
            throw InvalidArgument("invalid native stack log level: " + text);
        }
        return it->second;
    }

}// namespace Kdc
