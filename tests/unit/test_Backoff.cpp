#include <gtest/gtest.h>
#include "coord/Backoff.hpp"

using namespace wtc;
using namespace wtc::coord;
using namespace std::chrono;

TEST(BackoffTest, NominalGrowsAndCaps) {
    config::BackoffConfig cfg;
    cfg.base = milliseconds(100);
    cfg.factor = 2.0;
    cfg.cap = milliseconds(2000);
    const Backoff b(cfg);

    EXPECT_EQ(b.nominal(0), milliseconds(100));
    EXPECT_EQ(b.nominal(1), milliseconds(200));
    EXPECT_EQ(b.nominal(3), milliseconds(800));
    EXPECT_EQ(b.nominal(5), milliseconds(2000));
    EXPECT_EQ(b.nominal(30), milliseconds(2000));
}

TEST(BackoffTest, JitterStaysWithinHalfAndFullDelay) {
    config::BackoffConfig cfg;
    cfg.base = milliseconds(40);
    cfg.factor = 2.0;
    cfg.cap = milliseconds(500);
    Backoff b(cfg);

    for (unsigned int k = 0; k < 10; ++k) {
        const auto nominal = b.nominal(k);
        const auto d = b.next();
        EXPECT_GE(d, nominal / 2) << "attempt " << k;
        EXPECT_LE(d, nominal) << "attempt " << k;
    }
    EXPECT_EQ(b.attempts(), 10u);

    b.reset();
    EXPECT_EQ(b.attempts(), 0u);
}
