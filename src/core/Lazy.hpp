#pragma once

#include <functional>
#include <memory>
#include <stdexcept>

namespace sf_boost {

/**
 * @brief Value created by a factory on first access, then reused
 *
 * Not thread-safe; the server is single-threaded. If the factory throws,
 * nothing is cached and the next get() tries again.
 */
template <typename T>
class Lazy {
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    explicit Lazy(Factory factory) : factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument("Lazy factory cannot be null");
        }
    }

    T& get() {
        if (!value_) {
            value_ = factory_();
            if (!value_) {
                throw std::runtime_error("Lazy factory returned null");
            }
        }
        return *value_;
    }

    bool initialized() const { return value_ != nullptr; }

private:
    Factory factory_;
    std::unique_ptr<T> value_;
};

} // namespace sf_boost
