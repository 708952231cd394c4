#pragma once
#include "codec/value_codec.hpp"
#include "common/native_log.hpp"
#include "common/response_code.hpp"
#include "config/ClusterConfig.h"
#include "core/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Kdc {

    using Handle = i64;
    constexpr Handle kInvalidHandle = 0;

    /**
     * 集群原生调用面的抽象。
     * 所有调用同步阻塞；每次数据调用都会为发起调用的句柄记录一对 (code, subcode)，
     * 之后可以通过 GetResponseCode / GetResponseSubcode 读回。
     * pass 为空表示不使用口令，ttl 为 0 表示不过期。
     */
    class Backend {
    public:
        virtual ~Backend() = default;

        // 连接集群，失败时返回非正数
        virtual Handle Open(const ClusterConfig &config) = 0;
        // 释放句柄，未知句柄返回 false
        virtual bool Close(Handle handle, bool cleanup) = 0;

        // 键值
        virtual std::optional<std::string> GetValue(Handle handle, const std::string &key, const std::string &pass) = 0;
        virtual bool SetValue(Handle handle, const std::string &key, const std::string &value,
                              bool clear_subkeys, const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual bool SetAll(Handle handle, const std::string &key, const std::string &value,
                            const StringList &subkeys, const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual bool Remove(Handle handle, const std::string &key, bool remove_subkeys) = 0;
        virtual bool Rename(Handle handle, const std::string &key, const std::string &new_key,
                            const std::string &parent_key, bool check_parent_attrs,
                            const std::string &pass, std::chrono::seconds ttl) = 0;

        // 子键
        virtual std::optional<StringList> GetSubkeys(Handle handle, const std::string &key) = 0;
        virtual bool SetSubkeys(Handle handle, const std::string &key, const StringList &subkeys) = 0;
        virtual bool RemoveSubkey(Handle handle, const std::string &key, const std::string &subkey, bool recursive) = 0;
        virtual bool ClearSubkeys(Handle handle, const std::string &key) = 0;

        // 属性
        virtual std::optional<StringMap> GetAttrs(Handle handle, const std::string &key) = 0;

        // CAS，单元宽度由 value 的长度决定
        virtual bool CasInit(Handle handle, const std::string &key, const Bytes &value,
                             const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual std::optional<Bytes> CasGet(Handle handle, const std::string &key, Codec::DataType type,
                                            const std::string &pass) = 0;
        virtual bool CasSet(Handle handle, const std::string &key, const Bytes &old_value, const Bytes &new_value,
                            const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual bool CasIncDec(Handle handle, const std::string &key, bool increment,
                               const std::string &pass, std::chrono::seconds ttl) = 0;

        // 队列
        virtual bool QueuePush(Handle handle, const std::string &prefix, const std::string &value,
                               const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual std::optional<std::string> QueuePop(Handle handle, const std::string &prefix, bool fifo,
                                                    const std::string &pass) = 0;
        // 批量丢弃 count 个元素，不返回内容
        virtual bool QueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                                 const std::string &pass) = 0;
        virtual bool KeyQueuePush(Handle handle, const std::string &prefix, const std::string &key,
                                  const std::string &value, const std::string &pass, std::chrono::seconds ttl) = 0;
        virtual std::optional<std::pair<std::string, std::string>> KeyQueuePop(Handle handle, const std::string &prefix,
                                                                              bool fifo, const std::string &pass) = 0;
        virtual bool KeyQueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                                    const std::string &pass) = 0;

        // 最近一次调用的响应码
        virtual ResponseCode GetResponseCode(Handle handle) = 0;
        virtual ResponseSubcode GetResponseSubcode(Handle handle) = 0;

        // 原生日志透传
        virtual bool SetDebugFile(NativeLayer layer, const std::string &path) = 0;
        virtual bool UnsetDebugFile(NativeLayer layer) = 0;
        virtual void SetDebugLevel(NativeLayer layer, NativeLogLevel level) = 0;
        virtual void SetComLog(bool enable) = 0;
    };

}// namespace Kdc
