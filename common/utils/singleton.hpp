#ifndef CHATLIVE_SINGLETON_HPP
#define CHATLIVE_SINGLETON_HPP

/******************************************************************************
 *
 * @file       singleton.hpp
 * @brief      Lazily constructed, thread-safe singleton base
 *
 *****************************************************************************/

namespace chatlive {
namespace utils {

// Usage: class Foo : public Singleton<Foo> { friend class Singleton<Foo>; ... };
template <typename T>
class Singleton {
public:
    static T& GetInstance() {
        static T instance;
        return instance;
    }

protected:
    Singleton() = default;
    ~Singleton() = default;
    Singleton(const Singleton<T>&) = delete;
    Singleton& operator=(const Singleton<T>&) = delete;
};

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_SINGLETON_HPP
