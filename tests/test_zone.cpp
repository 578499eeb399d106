#include "test_util.hpp"
#include "zone.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sys/stat.h>

class ZoneTest : public ::testing::Test {
protected:
    void SetUp() override { clock.set(1700000000); }

    std::shared_ptr<SprinklerZone> make(std::shared_ptr<RainSensor> rain = nullptr, bool blocks = true) {
        return std::make_shared<SprinklerZone>(relay, rain, 1.0, blocks, clock);
    }

    std::shared_ptr<FakeRelay> relay = std::make_shared<FakeRelay>();
    TestClock clock;
};

TEST_F(ZoneTest, ConstructorForcesRelayOff) {
    auto z = make();
    EXPECT_EQ(relay->off_calls, 1);
    EXPECT_FALSE(z->is_active());
    EXPECT_EQ(z->last_run(), 0);
}

TEST_F(ZoneTest, OnIsIdempotent) {
    auto z = make();
    z->on();
    std::time_t first = z->last_run();
    EXPECT_EQ(first, clock());

    clock.advance(30);
    z->on();
    EXPECT_TRUE(z->is_active());
    EXPECT_EQ(z->last_run(), first);
    EXPECT_EQ(relay->on_calls, 1);
}

TEST_F(ZoneTest, OffRecordsStopAndIsIdempotent) {
    auto z = make();
    z->off();
    EXPECT_EQ(z->last_stop(), 0);
    EXPECT_EQ(relay->off_calls, 1);

    z->on();
    clock.advance(120);
    z->off();
    EXPECT_FALSE(z->is_active());
    EXPECT_FALSE(relay->state);
    EXPECT_EQ(z->last_stop(), clock());
    EXPECT_EQ(relay->off_calls, 2);
}

TEST_F(ZoneTest, RainBlocksActivation) {
    auto rain = std::make_shared<FakeRain>();
    rain->raining = true;
    auto z = make(rain, true);
    z->on();
    EXPECT_FALSE(z->is_active());
    EXPECT_EQ(relay->on_calls, 0);
    EXPECT_EQ(z->last_run(), 0);

    rain->raining = false;
    z->on();
    EXPECT_TRUE(z->is_active());
    EXPECT_EQ(relay->on_calls, 1);
}

TEST_F(ZoneTest, RainBlocksRelayButNotBookkeeping) {
    auto rain = std::make_shared<FakeRain>();
    rain->raining = true;
    auto z = make(rain, false);
    z->on();
    EXPECT_TRUE(z->is_active());
    EXPECT_EQ(relay->on_calls, 0);
    EXPECT_FALSE(relay->state);
    EXPECT_EQ(z->last_run(), clock());
}

TEST_F(ZoneTest, DurationFromDemand) {
    SprinklerZone z(relay, nullptr, 0.5);
    EXPECT_EQ(z.duration_from_demand(0.5).count(), 3600);
    EXPECT_EQ(z.duration_from_demand(0.25).count(), 1800);
    EXPECT_EQ(z.duration_from_demand(0.0).count(), 0);

    SprinklerZone no_rate(relay, nullptr, 0.0);
    EXPECT_EQ(no_rate.duration_from_demand(0.5).count(), 0);
}

TEST_F(ZoneTest, RestoreOnlyFillsEmptyHistory) {
    auto z = make();
    z->restore(100, 200);
    EXPECT_EQ(z->last_run(), 100);
    EXPECT_EQ(z->last_stop(), 200);
    z->restore(300, 400);
    EXPECT_EQ(z->last_run(), 100);
}

// sysfs эмулируется во временном каталоге
class GpioTest : public ::testing::Test {
protected:
    void SetUp() override {
        char buf[] = "/tmp/irrigo_gpio_XXXXXX";
        ASSERT_NE(mkdtemp(buf), nullptr);
        root = buf;
        ::mkdir((root+"/gpio17").c_str(), 0755);
        std::ofstream(root+"/export");
        std::ofstream(root+"/gpio17/direction");
        std::ofstream(root+"/gpio17/value")<<"0";
    }
    void TearDown() override {
        std::remove((root+"/gpio17/value").c_str());
        std::remove((root+"/gpio17/direction").c_str());
        std::remove((root+"/export").c_str());
        ::rmdir((root+"/gpio17").c_str());
        ::rmdir(root.c_str());
    }
    std::string read(const std::string& f) {
        std::ifstream in(root+"/gpio17/"+f);
        std::string s; in>>s; return s;
    }
    std::string root;
};

TEST_F(GpioTest, RelayWritesValue) {
    GpioRelay r(17, root);
    EXPECT_EQ(read("direction"), "out");
    EXPECT_EQ(read("value"), "0");
    r.on();
    EXPECT_EQ(read("value"), "1");
    r.off();
    EXPECT_EQ(read("value"), "0");
}

TEST_F(GpioTest, RelayWriteFailureIsSwallowed) {
    GpioRelay r(23, root);                    // нет gpio23 -> запись не удаётся
    EXPECT_NO_THROW(r.on());
    EXPECT_NO_THROW(r.off());
}

TEST_F(GpioTest, DisabledPinDoesNoIo) {
    GpioRelay r(-1, root);
    EXPECT_NO_THROW(r.on());
    EXPECT_EQ(read("value"), "0");
}

TEST_F(GpioTest, RainSensorReadsHighAsRain) {
    GpioRainSensor s(17, root);
    EXPECT_EQ(read("direction"), "in");
    EXPECT_FALSE(s.is_active());
    std::ofstream(root+"/gpio17/value")<<"1";
    EXPECT_TRUE(s.is_active());

    GpioRainSensor missing(-1, root);
    EXPECT_EQ(missing.read(), -1);
    EXPECT_FALSE(missing.is_active());
}

TEST(SoftRainSensor, UsesPrecipitationCutoff) {
    auto w = std::make_shared<FakeWeather>();
    SoftRainSensor s(0.1, w, "KTEST1");
    w->precip = 0.05;
    EXPECT_FALSE(s.is_active());
    w->precip = 0.25;
    EXPECT_TRUE(s.is_active());
    w->fail = true;
    EXPECT_FALSE(s.is_active());
}
