#include "cluster/Cluster.hpp"
#include "codec/value_codec.hpp"
#include "command/commands.hpp"
#include "common/errors.hpp"
#include "config/ConfigManager.h"
#include "session/Session.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <fmt/ranges.h>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace Kdc;
using namespace Kdc::Commands;

namespace {

    using Args = std::vector<std::string>;
    using Handler = std::function<void(Session &, const Args &)>;

    // 参数个数不足时抛出，由主循环打印用法
    void Expect(const Args &args, size_t min_count, const char *usage) {
        if (args.size() < min_count) {
            throw std::invalid_argument(std::string("usage: ") + usage);
        }
    }

    const std::string &Arg(const Args &args, size_t index, const std::string &fallback) {
        return index < args.size() ? args[index] : fallback;
    }

    template<typename T>
    void Print(const Result<T> &result) {
        fmt::print("{} {} (code={}, subcode={})\n",
                   ToString(result.GetStatus()),
                   result.GetValue(),
                   ToString(result.GetCode()),
                   ToString(result.GetSubcode()));
    }

    Bytes EncodeCas(const std::string &text, size_t width) {
        return Codec::FromUnsigned(static_cast<u64>(std::stoll(text)), Codec::DataTypeForWidth(width));
    }

    i64 DecodeCas(const Bytes &bytes) {
        switch (bytes.size()) {
            case 1:
                return Codec::BytesToByte(bytes);
            case 2:
                return Codec::BytesToShort(bytes);
            case 4:
                return Codec::BytesToInt(bytes);
            default:
                return Codec::BytesToLong(bytes);
        }
    }

    std::unordered_map<std::string, Handler> BuildHandlers() {
        static const std::string kNone;
        std::unordered_map<std::string, Handler> handlers;

        handlers["get"] = [](Session &s, const Args &a) {
            Expect(a, 1, "get <key> [pass]");
            Print(GetCommand(a[0], Arg(a, 1, kNone)).Execute(s));
        };
        handlers["set"] = [](Session &s, const Args &a) {
            Expect(a, 2, "set <key> <value> [pass] [ttl]");
            Print(SetCommand(a[0], a[1], kDefaultIsClearSubkeys, Arg(a, 2, kNone),
                             std::chrono::seconds(std::stol(Arg(a, 3, "0"))))
                          .Execute(s));
        };
        handlers["rm"] = [](Session &s, const Args &a) {
            Expect(a, 1, "rm <key> [all]");
            Print(RemoveCommand(a[0], Arg(a, 1, kNone) == "all").Execute(s));
        };
        handlers["mv"] = [](Session &s, const Args &a) {
            Expect(a, 2, "mv <key> <new_key> [parent_key]");
            Print(RenameCommand(a[0], a[1], Arg(a, 2, kNone), kDefaultCheckParentAttrs, kNone, kDefaultExpiration)
                          .Execute(s));
        };
        handlers["subkeys"] = [](Session &s, const Args &a) {
            Expect(a, 1, "subkeys <key>");
            Print(GetSubkeysCommand(a[0]).Execute(s));
        };
        handlers["setsubkeys"] = [](Session &s, const Args &a) {
            Expect(a, 2, "setsubkeys <key> <subkey>...");
            Print(SetSubkeysCommand(a[0], Args(a.begin() + 1, a.end())).Execute(s));
        };
        handlers["addsubkey"] = [](Session &s, const Args &a) {
            Expect(a, 2, "addsubkey <key> <subkey>");
            Print(AddSubkeyCommand(a[0], a[1]).Execute(s));
        };
        handlers["rmsubkey"] = [](Session &s, const Args &a) {
            Expect(a, 2, "rmsubkey <key> <subkey> [recursive]");
            Print(RemoveSubkeyCommand(a[0], a[1], Arg(a, 2, kNone) == "recursive").Execute(s));
        };
        handlers["clearsubkeys"] = [](Session &s, const Args &a) {
            Expect(a, 1, "clearsubkeys <key>");
            Print(ClearSubkeysCommand(a[0]).Execute(s));
        };
        handlers["attrs"] = [](Session &s, const Args &a) {
            Expect(a, 1, "attrs <key>");
            Print(GetAttrsCommand(a[0]).Execute(s));
        };
        handlers["casinit"] = [](Session &s, const Args &a) {
            Expect(a, 2, "casinit <key> <value> [width]");
            size_t width = std::stoul(Arg(a, 2, "4"));
            Print(CasInitCommand(a[0], EncodeCas(a[1], width)).Execute(s));
        };
        handlers["casget"] = [](Session &s, const Args &a) {
            Expect(a, 1, "casget <key> [width]");
            auto type = Codec::DataTypeForWidth(std::stoul(Arg(a, 1, "4")));
            auto result = CasGetCommand(a[0], type).Execute(s);
            Print(result);
            if (result.IsSuccess()) {
                fmt::print("value = {}\n", DecodeCas(result.GetValue()));
            }
        };
        handlers["casset"] = [](Session &s, const Args &a) {
            Expect(a, 3, "casset <key> <old> <new> [width]");
            size_t width = std::stoul(Arg(a, 3, "4"));
            Print(CasSetCommand(a[0], EncodeCas(a[1], width), EncodeCas(a[2], width)).Execute(s));
        };
        handlers["casinc"] = [](Session &s, const Args &a) {
            Expect(a, 1, "casinc <key>");
            Print(CasIncDecCommand(a[0], true).Execute(s));
        };
        handlers["casdec"] = [](Session &s, const Args &a) {
            Expect(a, 1, "casdec <key>");
            Print(CasIncDecCommand(a[0], false).Execute(s));
        };
        handlers["qpush"] = [](Session &s, const Args &a) {
            Expect(a, 2, "qpush <prefix> <value>");
            Print(QueueAddCommand(a[0], a[1]).Execute(s));
        };
        handlers["qpop"] = [](Session &s, const Args &a) {
            Expect(a, 1, "qpop <prefix> [count] [lifo]");
            Print(QueueRemoveCommand(a[0], std::stol(Arg(a, 1, "1")), Arg(a, 2, kNone) != "lifo").Execute(s));
        };
        handlers["kqpush"] = [](Session &s, const Args &a) {
            Expect(a, 3, "kqpush <prefix> <key> <value>");
            Print(KeyQueueAddCommand(a[0], a[1], a[2]).Execute(s));
        };
        handlers["kqpop"] = [](Session &s, const Args &a) {
            Expect(a, 1, "kqpop <prefix> [count] [lifo]");
            Print(KeyQueueRemoveCommand(a[0], std::stol(Arg(a, 1, "1")), Arg(a, 2, kNone) != "lifo").Execute(s));
        };
        return handlers;
    }

    void PrintHelp(const std::unordered_map<std::string, Handler> &handlers) {
        std::vector<std::string> names;
        for (const auto &entry: handlers) {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());
        fmt::print("commands: {} help quit\n", fmt::join(names, " "));
    }

}// namespace

int main(int argc, char *argv[]) {
    auto &config_manager = apps::ConfigManager::GetInstance();
    if (!config_manager.initialize(argc, argv)) {
        return 1;
    }

    KDC_SET_LEVEL(config_manager.getLogLevel());
    if (config_manager.getEnableLoggingFile()) {
        Logger::GetInstance().AddAppender(std::make_shared<FileAppender>(config_manager.getLogDir()));
    }

    try {
        ClusterConfig config = config_manager.BuildClusterConfig();
        Cluster cluster(config);
        Session session = Session::Open(cluster.GetConfig());
        KDC_LOG_INFO("Connected: {}", session.ToString());

        auto handlers = BuildHandlers();
        std::string line;
        fmt::print("kdc> ");
        std::fflush(stdout);
        while (std::getline(std::cin, line)) {
            std::istringstream iss(line);
            std::string name;
            Args args;
            iss >> name;
            for (std::string token; iss >> token;) {
                args.push_back(token);
            }

            if (name == "quit" || name == "exit") {
                break;
            }
            if (name == "help") {
                PrintHelp(handlers);
            } else if (!name.empty()) {
                auto it = handlers.find(name);
                if (it == handlers.end()) {
                    fmt::print("unknown command: {}\n", name);
                } else {
                    try {
                        it->second(session, args);
                    } catch (const std::invalid_argument &e) {
                        fmt::print("error: {}\n", e.what());
                    } catch (const std::out_of_range &e) {
                        fmt::print("error: number out of range: {}\n", e.what());
                    }
                }
            }
            fmt::print("kdc> ");
            std::fflush(stdout);
        }
        session.Close();
    } catch (const InvalidArgument &e) {
        KDC_LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    } catch (const ConnectionError &e) {
        KDC_LOG_ERROR("Cannot connect: {}", e.what());
        return 3;
    }

    Logger::GetInstance().Flush();
    return 0;
}
