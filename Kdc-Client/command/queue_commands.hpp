#pragma once
#include "command.hpp"
#include "core/types.hpp"
#include <chrono>
#include <string>

namespace Kdc::Commands {

    // 向 prefix 对应的队列尾部追加一个值
    class QueueAddCommand : public Command<bool> {
    public:
        QueueAddCommand(const std::string &prefix, const std::string &value,
                        const std::string &pass = kDefaultPass,
                        std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "QueueAddCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string prefix_;
        std::string value_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    /**
     * 取出 count 个元素：fifo 从队头取，否则从队尾取。
     * need_return_value 为 true 时逐个弹出并返回内容（全部成功才算成功，失败前弹出的值保留在结果里），
     * 否则发出一次批量删除，结果列表为空。
     */
    class QueueRemoveCommand : public Command<StringList> {
    public:
        explicit QueueRemoveCommand(const std::string &prefix,
                                    long count = kDefaultRemoveElementSize,
                                    bool fifo = kDefaultIsFifo,
                                    const std::string &pass = kDefaultPass,
                                    bool need_return_value = kDefaultNeedReturnValue);

        std::string Name() const override { return "QueueRemoveCommand"; }
        std::string ToString() const override;
        Result<StringList> Execute(Session &session) const override;

    private:
        std::string prefix_;
        size_t count_;
        bool fifo_;
        std::string pass_;
        bool need_return_value_;
    };

    // 键队列：入队的同时把 key/value 写成普通条目
    class KeyQueueAddCommand : public Command<bool> {
    public:
        KeyQueueAddCommand(const std::string &prefix, const std::string &key, const std::string &value,
                           const std::string &pass = kDefaultPass,
                           std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "KeyQueueAddCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string prefix_;
        std::string key_;
        std::string value_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    // 键队列出队，出队的条目同时从存储中删除
    class KeyQueueRemoveCommand : public Command<StringMap> {
    public:
        explicit KeyQueueRemoveCommand(const std::string &prefix,
                                       long count = kDefaultRemoveElementSize,
                                       bool fifo = kDefaultIsFifo,
                                       const std::string &pass = kDefaultPass,
                                       bool need_return_value = kDefaultNeedReturnValue);

        std::string Name() const override { return "KeyQueueRemoveCommand"; }
        std::string ToString() const override;
        Result<StringMap> Execute(Session &session) const override;

    private:
        std::string prefix_;
        size_t count_;
        bool fifo_;
        std::string pass_;
        bool need_return_value_;
    };

}// namespace Kdc::Commands
