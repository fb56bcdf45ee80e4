#include <gtest/gtest.h>

#include "adapters/secondary/CachedPaymentMethodRegistry.hpp"
#include "adapters/secondary/persistence/InMemoryPaymentMethodRegistry.hpp"

using namespace payment;
using namespace payment::adapters::secondary;

class CachedPaymentMethodRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        delegate_ = std::make_shared<InMemoryPaymentMethodRegistry>();
        registry_ = std::make_shared<CachedPaymentMethodRegistry>(
            delegate_, std::make_shared<settings::CacheSettings>(16, 300));
    }

    std::shared_ptr<InMemoryPaymentMethodRegistry> delegate_;
    std::shared_ptr<CachedPaymentMethodRegistry> registry_;
};

TEST_F(CachedPaymentMethodRegistryTest, ListActiveMethods_SecondCallFromCache) {
    auto first = registry_->listActiveMethods();
    auto second = registry_->listActiveMethods();

    EXPECT_EQ(first.size(), 3u);
    EXPECT_EQ(second.size(), 3u);
    EXPECT_EQ(delegate_->listCallCount(), 1);
    EXPECT_EQ(registry_->getCacheSize(), 1u);
}

TEST_F(CachedPaymentMethodRegistryTest, IsMethodActive_UsesCachedList) {
    EXPECT_TRUE(registry_->isMethodActive("visa"));
    EXPECT_TRUE(registry_->isMethodActive("IBOX TERMINAL"));
    EXPECT_FALSE(registry_->isMethodActive("PayPal"));

    EXPECT_EQ(delegate_->listCallCount(), 1);
}

TEST_F(CachedPaymentMethodRegistryTest, ClearCache_ReloadsFromDelegate) {
    registry_->listActiveMethods();
    delegate_->setActive("Bank", false);

    EXPECT_TRUE(registry_->isMethodActive("Bank"));

    registry_->clearCache();

    EXPECT_FALSE(registry_->isMethodActive("Bank"));
    EXPECT_EQ(delegate_->listCallCount(), 2);
}
