#include "cluster/Cluster.hpp"
#include "codec/value_codec.hpp"
#include "command/commands.hpp"
#include "common/errors.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <cluster-config-file>" << std::endl;
        return 1;
    }

    try {
        auto cluster = Kdc::Cluster::Of(argv[1]);

        // 基础读写
        if (!cluster.Set("name", "Alice")) {
            std::cerr << "set name failed" << std::endl;
        }
        auto name = cluster.Get("name");
        std::cout << "name = " << name.value_or("<not found>") << std::endl;

        // 子键
        if (!cluster.SetSubkeys("name", {"name:first", "name:last"})) {
            std::cerr << "set subkeys failed" << std::endl;
        }
        for (const auto &subkey: cluster.GetSubkeys("name")) {
            std::cout << "- " << subkey << std::endl;
        }
        if (!cluster.ClearSubkeys("name")) {
            std::cerr << "clear subkeys failed" << std::endl;
        }

        // 同一个会话上执行多条命令
        {
            auto session = Kdc::Session::Open(cluster.GetConfig());
            auto init = Kdc::Commands::CasInitCommand("counter", Kdc::i32(5)).Execute(session);
            auto incr = Kdc::Commands::CasIncDecCommand("counter").Execute(session);
            std::cout << init.ToString() << std::endl
                      << incr.ToString() << std::endl;
            auto counter = Kdc::Commands::CasGetCommand("counter", Kdc::Codec::DataType::Int).Execute(session);
            if (counter.IsSuccess()) {
                std::cout << "counter after incr: " << Kdc::Codec::BytesToInt(counter.GetValue()) << std::endl;
            }

            for (const char *job: {"first", "second"}) {
                if (!Kdc::Commands::QueueAddCommand("jobs", job).Execute(session).IsSuccess()) {
                    std::cerr << "push " << job << " failed" << std::endl;
                }
            }
            auto jobs = Kdc::Commands::QueueRemoveCommand("jobs", 2).Execute(session);
            for (const auto &job: jobs.GetValue()) {
                std::cout << "job: " << job << std::endl;
            }
        }

        // 不存在的键
        if (!cluster.Remove("name")) {
            std::cerr << "remove name failed" << std::endl;
        }
        std::cout << "name exists after remove? " << (cluster.Get("name") ? "yes" : "no") << std::endl;

        // 边界测试
        try {
            auto empty = cluster.Get("");
            std::cout << "unexpected: " << empty.value_or("") << std::endl;
        } catch (const Kdc::InvalidArgument &e) {
            std::cerr << "Empty key test: " << e.what() << std::endl;
        }

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
