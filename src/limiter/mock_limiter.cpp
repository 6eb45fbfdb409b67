/**
 * @file mock_limiter.cpp
 * @brief MockLimiter implementation — scripted usage for testing.
 */

#include "limiter/limiter.hpp"

namespace runexec {

class MockLimiterContext : public ILimiterContext {
public:
    explicit MockLimiterContext(MockLimiter& owner) : owner_(owner) {}

    Result<void> attach(pid_t pid) override {
        owner_.last_pid_.store(pid);
        return {};
    }

    ResourceUsage read_usage() override {
        std::lock_guard lock(owner_.usage_mutex_);
        return owner_.usage_;
    }

    bool memory_exceeded() override { return owner_.memory_exceeded_.load(); }

    Result<void> destroy() override {
        if (!destroyed_) {
            destroyed_ = true;
            owner_.destroyed_.fetch_add(1);
        }
        return {};
    }

    [[nodiscard]] std::string_view backend() const noexcept override { return "mock"; }

private:
    MockLimiter& owner_;
    bool destroyed_{false};
};

Result<void> MockLimiter::probe() {
    return {};
}

Result<std::unique_ptr<ILimiterContext>> MockLimiter::create(const RunLimits& /*limits*/) {
    if (fail_create_.load()) {
        return Error{"Mock limiter configured to fail", ErrorCode::Limiter};
    }
    created_.fetch_add(1);
    return std::unique_ptr<ILimiterContext>{std::make_unique<MockLimiterContext>(*this)};
}

void MockLimiter::set_usage(ResourceUsage usage) {
    std::lock_guard lock(usage_mutex_);
    usage_ = std::move(usage);
}

}  // namespace runexec
