#ifndef MOTION_SENSOR_HPP
#define MOTION_SENSOR_HPP

#include <cstdint>
#include <driver/i2c.h>
#include <main/config/config.hpp>

// MPU-6050 accelerometer (gyro unused). Reports the acceleration
// magnitude in g; a failed bus transaction is reported, never masked.
class MotionSensor {
public:
    MotionSensor(i2c_port_t port = static_cast<i2c_port_t>(Config::Hardware::Motion::i2c_port),
                 gpio_num_t sda = Config::Hardware::Motion::sda,
                 gpio_num_t scl = Config::Hardware::Motion::scl,
                 uint8_t address = Config::Hardware::Motion::address);

    bool init();
    bool isReady() const { return ready; }

    // Magnitude of the acceleration vector in g (about 1.0 at rest)
    bool readMagnitude(float& out_total_g);

private:
    bool ensureBus();
    bool writeRegister(uint8_t reg, uint8_t value);
    bool readRegisters(uint8_t reg, uint8_t* out, size_t len);

    i2c_port_t port;
    gpio_num_t sda;
    gpio_num_t scl;
    uint8_t address;
    bool bus_ready;
    bool ready;
};

#endif // MOTION_SENSOR_HPP
