#pragma once
#include "backend/Library.hpp"
#include "backend/MemoryBackend.hpp"
#include "config/ClusterConfig.h"
#include "session/Session.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace KdcTest {
    namespace fs = std::filesystem;

    // 以当前用例名生成唯一的临时文件路径（gtest_discover_tests 会并行跑多个进程）
    inline fs::path UniqueTestPath(const std::string &suffix) {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "kdc";
        fs::path dir = fs::temp_directory_path() / "kdc_tests";
        fs::create_directories(dir);
        return dir / (name + suffix);
    }

    // 写一个最小的成员管理配置文件
    inline std::string WriteClusterConfigFile() {
        fs::path file = UniqueTestPath(".ini");
        std::ofstream out(file);
        out << "[GLOBAL]\n"
            << "FILEVERSION = 1\n"
            << "GROUP = TESTDKC\n"
            << "MODE = SLAVE\n"
            << "CTLPORT = 8031\n";
        return file.string();
    }

    // 每个用例安装一个独立的 MemoryBackend，并注入可手动推进的时钟
    class BackendTest : public ::testing::Test {
    protected:
        using Clock = Kdc::MemoryBackend::Clock;

        void SetUp() override {
            config_path_ = WriteClusterConfigFile();
            now_ = Clock::now();
            backend_ = std::make_shared<Kdc::MemoryBackend>(makeOptions());
            Kdc::Library::GetInstance().Install(backend_);
        }

        void TearDown() override {
            Kdc::Library::GetInstance().Shutdown();
            std::error_code ec;
            fs::remove(config_path_, ec);
        }

        virtual Kdc::MemoryBackendOptions makeOptions() {
            Kdc::MemoryBackendOptions options;
            options.clock = [this]() { return now_; };
            return options;
        }

        void advance(std::chrono::seconds duration) {
            now_ += duration;
        }

        Kdc::ClusterConfig config() const {
            return Kdc::ClusterConfig::Of(config_path_);
        }

        Kdc::Session open() const {
            return Kdc::Session::Open(config());
        }

        std::string config_path_;
        Clock::time_point now_;
        std::shared_ptr<Kdc::MemoryBackend> backend_;
    };

    // 在 BackendTest 基础上预先打开一个会话
    class SessionTest : public BackendTest {
    protected:
        void SetUp() override {
            BackendTest::SetUp();
            session_ = open();
        }

        void TearDown() override {
            session_.Close();
            BackendTest::TearDown();
        }

        Kdc::Session session_;
    };

}// namespace KdcTest
