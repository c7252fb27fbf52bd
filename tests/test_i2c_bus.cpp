#include "catch2/catch.hpp"
#include "numpad_setup/i2c_bus.hpp"
#include "numpad_setup/i2c_dev_probe.hpp"
#include "numpad_setup/install_error.hpp"
#include "numpad_setup/logging_probe.hpp"
#include "test/fake_probe.hpp"
#include "test/install_error_matcher.hpp"
#include "test/temp_dir.hpp"

using namespace numpad::setup;
using test::HasKind;

namespace {

std::vector<I2cAdapter> adaptersOn(std::initializer_list<unsigned> buses) {
    std::vector<I2cAdapter> adapters;
    for (auto bus : buses) {
        adapters.push_back({bus, "Synopsys DesignWare I2C adapter"});
    }
    return adapters;
}

}  // namespace

TEST_CASE("adapter enumeration keeps DesignWare buses in bus order") {
    test::TempDir sysfs;
    sysfs.write("i2c-10/name", "Synopsys DesignWare I2C adapter\n");
    sysfs.write("i2c-2/name", "i915 gmbus dpc\n");
    sysfs.write("i2c-1/name", "Synopsys DesignWare I2C adapter\n");
    sysfs.write("i2c-0/name", "Synopsys DesignWare I2C adapter\n");
    sysfs.write("i2c-ELAN1200:00/name", "DesignWare\n");
    sysfs.write("0-0015/name", "DesignWare\n");
    sysfs.write("i2c-3/other", "DesignWare\n");

    auto adapters = enumerateAdapters(sysfs.path(), "DesignWare");

    REQUIRE(adapters.size() == 3);
    REQUIRE(adapters[0].bus == 0);
    REQUIRE(adapters[1].bus == 1);
    REQUIRE(adapters[2].bus == 10);
    REQUIRE(adapters[2].deviceName() == "i2c-10");
    REQUIRE(adapters[0].name == "Synopsys DesignWare I2C adapter");
}

TEST_CASE("adapter enumeration of a missing sysfs directory is empty") {
    test::TempDir root;
    REQUIRE(enumerateAdapters(root.path() / "nope", "DesignWare").empty());
}

SCENARIO("touchpad detection over candidate buses") {
    test::FakeProbe probe;

    GIVEN("several candidates where the middle ones respond") {
        probe.responding = {3, 5};
        auto found = detectTouchpad(adaptersOn({1, 3, 5}), probe);
        THEN("the first responding bus is chosen and later ones are never probed") {
            REQUIRE(found.bus == 3);
            REQUIRE(probe.probed == std::vector<unsigned>{1, 3});
        }
        THEN("the backlight command goes to address 0x15") {
            REQUIRE(probe.last_address == 0x15);
            REQUIRE(probe.last_payload.size() == 13);
            REQUIRE(probe.last_payload.front() == 0x05);
            REQUIRE(probe.last_payload.back() == 0xad);
        }
    }
    GIVEN("the first candidate responds") {
        probe.responding = {0, 1, 2};
        auto found = detectTouchpad(adaptersOn({0, 1, 2}), probe);
        THEN("exactly one probe is sent") {
            REQUIRE(found.bus == 0);
            REQUIRE(probe.probed.size() == 1);
        }
    }
    GIVEN("no candidates") {
        THEN("detection fails without probing") {
            REQUIRE_THROWS_MATCHES(detectTouchpad({}, probe), InstallError, HasKind(ErrorKind::NoInterface));
            REQUIRE(probe.probed.empty());
        }
    }
    GIVEN("candidates that all fail") {
        THEN("every candidate is tried and the device is not found") {
            REQUIRE_THROWS_MATCHES(detectTouchpad(adaptersOn({4, 7}), probe), InstallError,
                                   HasKind(ErrorKind::DeviceNotFound));
            REQUIRE(probe.probed == std::vector<unsigned>{4, 7});
        }
    }
}

TEST_CASE("i2c-dev probe reports a missing device node") {
    test::TempDir dev;
    I2cDevProbe probe(dev.path());
    std::string error;

    REQUIRE_FALSE(probe.probe(42, kTouchpadAddress, kBacklightOffCommand, error));
    REQUIRE(error.find("i2c-42") != std::string::npos);
}

TEST_CASE("i2c-dev transfer fails on a node that is not an i2c adapter") {
    test::TempDir dev;
    dev.write("i2c-3", "");
    I2cDevProbe probe(dev.path());
    std::string error;

    REQUIRE_FALSE(probe.probe(3, kTouchpadAddress, kBacklightOffCommand, error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("logging probe acknowledges every bus") {
    LoggingProbe probe;
    std::string error;
    REQUIRE(probe.probe(7, kTouchpadAddress, kBacklightOffCommand, error));
    REQUIRE(error.empty());
}
