#pragma once
#include "Backend.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace Kdc {

    struct MemoryBackendOptions {
        using Clock = std::chrono::system_clock;

        bool track_mtime = false;                // GetAttrs 是否返回 mtime
        std::function<Clock::time_point()> clock;// 为空时使用系统时钟（测试可注入）
    };

    /**
     * 进程内的集群替身存储，语义与原生调用面一致，单把互斥锁保护全部状态。
     * 过期的条目按惰性方式淘汰：被访问到时才删除。
     */
    class MemoryBackend : public Backend {
    public:
        using Clock = MemoryBackendOptions::Clock;

        explicit MemoryBackend(MemoryBackendOptions options = MemoryBackendOptions());
        ~MemoryBackend() override = default;

        Handle Open(const ClusterConfig &config) override;
        bool Close(Handle handle, bool cleanup) override;

        std::optional<std::string> GetValue(Handle handle, const std::string &key, const std::string &pass) override;
        bool SetValue(Handle handle, const std::string &key, const std::string &value,
                      bool clear_subkeys, const std::string &pass, std::chrono::seconds ttl) override;
        bool SetAll(Handle handle, const std::string &key, const std::string &value,
                    const StringList &subkeys, const std::string &pass, std::chrono::seconds ttl) override;
        bool Remove(Handle handle, const std::string &key, bool remove_subkeys) override;
        bool Rename(Handle handle, const std::string &key, const std::string &new_key,
                    const std::string &parent_key, bool check_parent_attrs,
                    const std::string &pass, std::chrono::seconds ttl) override;

        std::optional<StringList> GetSubkeys(Handle handle, const std::string &key) override;
        bool SetSubkeys(Handle handle, const std::string &key, const StringList &subkeys) override;
        bool RemoveSubkey(Handle handle, const std::string &key, const std::string &subkey, bool recursive) override;
        bool ClearSubkeys(Handle handle, const std::string &key) override;

        std::optional<StringMap> GetAttrs(Handle handle, const std::string &key) override;

        bool CasInit(Handle handle, const std::string &key, const Bytes &value,
                     const std::string &pass, std::chrono::seconds ttl) override;
        std::optional<Bytes> CasGet(Handle handle, const std::string &key, Codec::DataType type,
                                    const std::string &pass) override;
        bool CasSet(Handle handle, const std::string &key, const Bytes &old_value, const Bytes &new_value,
                    const std::string &pass, std::chrono::seconds ttl) override;
        bool CasIncDec(Handle handle, const std::string &key, bool increment,
                       const std::string &pass, std::chrono::seconds ttl) override;

        bool QueuePush(Handle handle, const std::string &prefix, const std::string &value,
                       const std::string &pass, std::chrono::seconds ttl) override;
        std::optional<std::string> QueuePop(Handle handle, const std::string &prefix, bool fifo,
                                            const std::string &pass) override;
        bool QueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                         const std::string &pass) override;
        bool KeyQueuePush(Handle handle, const std::string &prefix, const std::string &key,
                          const std::string &value, const std::string &pass, std::chrono::seconds ttl) override;
        std::optional<std::pair<std::string, std::string>> KeyQueuePop(Handle handle, const std::string &prefix,
                                                                      bool fifo, const std::string &pass) override;
        bool KeyQueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                            const std::string &pass) override;

        ResponseCode GetResponseCode(Handle handle) override;
        ResponseSubcode GetResponseSubcode(Handle handle) override;

        bool SetDebugFile(NativeLayer layer, const std::string &path) override;
        bool UnsetDebugFile(NativeLayer layer) override;
        void SetDebugLevel(NativeLayer layer, NativeLogLevel level) override;
        void SetComLog(bool enable) override;

        // 原生日志状态查询
        NativeLogLevel GetDebugLevel(NativeLayer layer) const;
        std::optional<std::string> GetDebugFile(NativeLayer layer) const;
        bool IsComLogEnabled() const;

        size_t OpenHandleCount() const;
        // 清空全部数据，已打开的句柄保持有效
        void Clear();

    private:
        struct Entry {
            std::string value;
            StringList subkeys;
            std::string pass;
            std::optional<Clock::time_point> expire;
            size_t cas_width = 0;// 0 表示普通值
            Clock::time_point mtime;
        };

        struct QueueItem {
            std::string key;// 仅键队列使用
            std::string value;
            std::string pass;
            std::optional<Clock::time_point> expire;
        };

        struct Codes {
            ResponseCode code = ResponseCode::NoResponse;
            ResponseSubcode subcode = ResponseSubcode::Nothing;
        };

        using Queue = std::deque<QueueItem>;

        // 以下函数调用方需持有 mutex_
        Clock::time_point now() const;
        std::optional<Clock::time_point> deadlineOf(std::chrono::seconds ttl) const;
        bool isExpired(const std::optional<Clock::time_point> &expire) const;
        bool checkHandle(Handle handle);
        bool succeed(Handle handle);
        bool fail(Handle handle, ResponseSubcode subcode);
        Entry *findLive(const std::string &key);
        void eraseTree(const std::string &key);
        void eraseTree(const std::string &key, std::vector<std::string> &visited);
        void eraseChildren(const std::string &key, const StringList &children);
        void dropQueuedEntry(const QueueItem &item);
        void writeEntry(const std::string &key, const std::string &value, const std::string &pass,
                        std::chrono::seconds ttl, size_t cas_width);
        std::optional<QueueItem> popItem(Handle handle, std::unordered_map<std::string, Queue> &queues,
                                         const std::string &prefix, bool fifo, const std::string &pass);
        bool removeItems(Handle handle, std::unordered_map<std::string, Queue> &queues,
                         const std::string &prefix, size_t count, bool fifo, const std::string &pass, bool drop_entries);

        MemoryBackendOptions options_;
        mutable std::mutex mutex_;
        Handle next_handle_ = 1;
        std::unordered_map<Handle, Codes> handles_;
        std::unordered_map<std::string, Entry> entries_;
        std::unordered_map<std::string, Queue> queues_;
        std::unordered_map<std::string, Queue> key_queues_;
        std::map<NativeLayer, NativeLogLevel> debug_levels_;
        std::map<NativeLayer, std::string> debug_files_;
        bool comlog_enabled_ = false;
    };

}// namespace Kdc
