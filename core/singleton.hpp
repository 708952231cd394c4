#pragma once

#include <memory>
#include <mutex>

namespace Kdc {

    /**
     * @brief        : 进程级单例的封装类, 采用CRTP模式
     *                 派生类需要把 Singleton<T> 声明为友元并私有化构造函数
    **/
    template<typename T>
    class Singleton {
    protected:
        Singleton() = default;
        ~Singleton() = default;
        Singleton(const Singleton<T> &) = delete;
        Singleton &operator=(const Singleton<T> &st) = delete;

    public:
        /**
         * @brief        : 获取单例对象, 首次调用时构造且只构造一次
         * @return        {T&}
        **/
        static T &GetInstance() {
            static std::once_flag s_flag;
            std::call_once(s_flag, [&]() {
                instance_.reset(new T);
            });
            return *instance_;
        }

    private:
        static std::unique_ptr<T> instance_;
    };

    template<typename T>
    std::unique_ptr<T> Singleton<T>::instance_ = nullptr;

}// namespace Kdc
