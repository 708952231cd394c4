#include "backend/Library.hpp"
#include "backend/MemoryBackend.hpp"
#include "codec/value_codec.hpp"
#include "command/commands.hpp"
#include "core/kdc.hpp"
#include <benchmark/benchmark.h>
#include <filesystem>
#include <fstream>
#include <random>

// 测试配置
constexpr int KEY_COUNT = 1000;// 测试键数量
constexpr int VALUE_SIZE = 100;// 测试值大小(字节)

class CommandBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State &state) override {
        KDC_UNUSED(state);
        Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::ERR);

        config_path = (std::filesystem::temp_directory_path() / "kdc_bench_cluster.ini").string();
        std::ofstream(config_path) << "[GLOBAL]\nGROUP = BENCH\nMODE = SLAVE\n";
        Kdc::Library::GetInstance().Install(std::make_shared<Kdc::MemoryBackend>());
        session = Kdc::Session::Open(Kdc::ClusterConfig::Of(config_path));

        // 生成随机测试数据
        std::uniform_int_distribution<int> dist('a', 'z');
        std::mt19937 gen(std::random_device{}());
        keys.resize(KEY_COUNT);
        values.resize(KEY_COUNT);
        for (int i = 0; i < KEY_COUNT; ++i) {
            keys[i] = "key_" + std::to_string(i);
            values[i].resize(VALUE_SIZE);
            for (auto &c: values[i]) {
                c = static_cast<char>(dist(gen));
            }
        }
    }

    void TearDown(const benchmark::State &state) override {
        KDC_UNUSED(state);
        session.Close();
        Kdc::Library::GetInstance().Shutdown();
        std::error_code ec;
        std::filesystem::remove(config_path, ec);
    }

    std::string config_path;
    Kdc::Session session;
    std::vector<std::string> keys;  // 测试键列表
    std::vector<std::string> values;// 测试值列表
};

BENCHMARK_DEFINE_F(CommandBenchmark, SetGet)
(benchmark::State &state) {
    for (auto _: state) {
        for (int i = 0; i < KEY_COUNT; ++i) {
            auto set = Kdc::Commands::SetCommand(keys[i], values[i]).Execute(session);
            if (!set.IsSuccess()) {
                state.SkipWithError("set failed");
                return;
            }
            auto get = Kdc::Commands::GetCommand(keys[i]).Execute(session);
            bool found = get.IsSuccess();
            benchmark::DoNotOptimize(found);
        }
    }
    state.SetItemsProcessed(state.iterations() * KEY_COUNT * 2);
}

BENCHMARK_DEFINE_F(CommandBenchmark, CasIncrement)
(benchmark::State &state) {
    if (!Kdc::Commands::CasInitCommand("counter", Kdc::i64(0)).Execute(session).IsSuccess()) {
        state.SkipWithError("cas init failed");
        return;
    }
    for (auto _: state) {
        bool ok = Kdc::Commands::CasIncDecCommand("counter").Execute(session).IsSuccess();
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_DEFINE_F(CommandBenchmark, QueuePushPop)
(benchmark::State &state) {
    for (auto _: state) {
        for (int i = 0; i < KEY_COUNT; ++i) {
            bool pushed = Kdc::Commands::QueueAddCommand("bench_queue", values[i]).Execute(session).IsSuccess();
            benchmark::DoNotOptimize(pushed);
        }
        size_t popped = Kdc::Commands::QueueRemoveCommand("bench_queue", KEY_COUNT).Execute(session).GetValue().size();
        benchmark::DoNotOptimize(popped);
    }
    state.SetItemsProcessed(state.iterations() * KEY_COUNT * 2);
}

// 每次调用都打开并关闭一个会话
BENCHMARK_DEFINE_F(CommandBenchmark, OneShotSession)
(benchmark::State &state) {
    auto config = Kdc::ClusterConfig::Of(config_path);
    for (auto _: state) {
        auto one_shot = Kdc::Session::Open(config);
        auto status = Kdc::Commands::GetCommand(keys[0]).Execute(one_shot).GetStatus();
        benchmark::DoNotOptimize(status);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_CodecLong(benchmark::State &state) {
    Kdc::i64 value = 0x0102030405060708LL;
    for (auto _: state) {
        auto bytes = Kdc::Codec::LongToBytes(value);
        value = Kdc::Codec::BytesToLong(bytes) + 1;
        benchmark::DoNotOptimize(value);
    }
}

BENCHMARK_REGISTER_F(CommandBenchmark, SetGet)->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(CommandBenchmark, CasIncrement);
BENCHMARK_REGISTER_F(CommandBenchmark, QueuePushPop)->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(CommandBenchmark, OneShotSession);
BENCHMARK(BM_CodecLong);

BENCHMARK_MAIN();
