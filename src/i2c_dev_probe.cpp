#include "numpad_setup/i2c_dev_probe.hpp"

#include <fcntl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>

#include "numpad_setup/unique_fd.hpp"

namespace numpad::setup {

I2cDevProbe::I2cDevProbe(std::filesystem::path dev_dir) : dev_dir_(std::move(dev_dir)) {}

bool I2cDevProbe::probe(unsigned bus,
                        std::uint8_t address,
                        const std::vector<std::uint8_t>& payload,
                        std::string& error) {
    const auto node = dev_dir_ / ("i2c-" + std::to_string(bus));
    UniqueFd fd(::open(node.c_str(), O_RDWR | O_CLOEXEC));
    if (!fd.valid()) {
        error = node.string() + ": " + std::strerror(errno);
        return false;
    }

    // I2C_RDWR addresses each message itself, so a kernel driver already
    // bound to the address does not block the transfer (i2ctransfer -f).
    std::vector<std::uint8_t> buffer(payload);
    i2c_msg message{};
    message.addr = address;
    message.flags = 0;
    message.len = static_cast<__u16>(buffer.size());
    message.buf = buffer.data();

    i2c_rdwr_ioctl_data transfer{};
    transfer.msgs = &message;
    transfer.nmsgs = 1;

    if (::ioctl(fd.get(), I2C_RDWR, &transfer) < 0) {
        error = std::strerror(errno);
        return false;
    }
    return true;
}

}  // namespace numpad::setup
