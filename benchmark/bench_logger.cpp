#include "core/kdc.hpp"
#include "utils/logger.hpp"
#include <benchmark/benchmark.h>
#include <filesystem>

class LoggerBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State &state) override {
        KDC_UNUSED(state);
        logger = &Kdc::Logger::GetInstance();
        logger->ResetAppenders();
        logger->SetLevel(Kdc::LogLevel::INFO);
    }

    void TearDown(const benchmark::State &state) override {
        KDC_UNUSED(state);
        logger->Flush();
        logger->ResetAppenders();
    }

    Kdc::Logger *logger = nullptr;
};

// 控制台输出
BENCHMARK_DEFINE_F(LoggerBenchmark, SyncConsoleLog)
(benchmark::State &state) {
    const std::string message = "Benchmark test message - 0123456789";

    for (auto _: state) {
        logger->Info("{}: {}", state.iterations(), message);
    }

    state.SetItemsProcessed(state.iterations());
}

// 文件输出（含滚动）
BENCHMARK_DEFINE_F(LoggerBenchmark, SyncFileLog)
(benchmark::State &state) {
    const std::string message = "Benchmark test message - 0123456789";
    const auto dir = std::filesystem::temp_directory_path() / "kdc_bench_logs";

    logger->RemoveAllAppenders();
    logger->AddAppender(std::make_shared<Kdc::FileAppender>(dir.string()));

    for (auto _: state) {
        logger->Info("{}: {}", state.iterations(), message);
    }

    state.SetItemsProcessed(state.iterations());
}

// 低于当前级别的日志只做级别判断
BENCHMARK_DEFINE_F(LoggerBenchmark, FilteredLog)
(benchmark::State &state) {
    for (auto _: state) {
        KDC_LOG_DEBUG("filtered {}", state.iterations());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(LoggerBenchmark, SyncConsoleLog)
        ->Threads(1)
        ->Threads(4)
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);

BENCHMARK_REGISTER_F(LoggerBenchmark, SyncFileLog)
        ->Threads(1)
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);

BENCHMARK_REGISTER_F(LoggerBenchmark, FilteredLog)
        ->Threads(1)
        ->Threads(8);

BENCHMARK_MAIN();
