#include <main/hardware/motion_sensor.hpp>
#include <main/utils/logger.hpp>
#include <cmath>

// MPU-6050 registers
static constexpr uint8_t MPU_REG_ACCEL_CONFIG = 0x1C;
static constexpr uint8_t MPU_REG_ACCEL_XOUT_H = 0x3B;
static constexpr uint8_t MPU_REG_PWR_MGMT_1   = 0x6B;
static constexpr uint8_t MPU_REG_WHO_AM_I     = 0x75;

static constexpr uint8_t MPU_WHO_AM_I_VALUE   = 0x68;
static constexpr uint8_t MPU_ACCEL_RANGE_2G   = 0x00;
// LSB per g at +/-2 g full scale
static constexpr float   MPU_ACCEL_SCALE_2G   = 16384.0f;

static const char* TAG = "MotionSensor";

MotionSensor::MotionSensor(i2c_port_t port_in, gpio_num_t sda_in, gpio_num_t scl_in, uint8_t address_in)
    : port(port_in),
      sda(sda_in),
      scl(scl_in),
      address(address_in),
      bus_ready(false),
      ready(false) {}

bool MotionSensor::ensureBus() {
    if (bus_ready) return true;
    i2c_config_t cfg{};
    cfg.mode = I2C_MODE_MASTER;
    cfg.sda_io_num = sda;
    cfg.sda_pullup_en = GPIO_PULLUP_ENABLE;
    cfg.scl_io_num = scl;
    cfg.scl_pullup_en = GPIO_PULLUP_ENABLE;
    cfg.master.clk_speed = Config::Hardware::Motion::clk_hz;
    cfg.clk_flags = 0;
    esp_err_t err = i2c_param_config(port, &cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "i2c_param_config failed: %d", static_cast<int>(err));
        return false;
    }
    err = i2c_driver_install(port, I2C_MODE_MASTER, 0, 0, 0);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "i2c_driver_install failed: %d", static_cast<int>(err));
        return false;
    }
    bus_ready = true;
    return true;
}

bool MotionSensor::writeRegister(uint8_t reg, uint8_t value) {
    const uint8_t data[2] = { reg, value };
    esp_err_t err = i2c_master_write_to_device(port, address, data, sizeof(data),
                                               pdMS_TO_TICKS(Config::Hardware::Motion::io_timeout_ms));
    return err == ESP_OK;
}

bool MotionSensor::readRegisters(uint8_t reg, uint8_t* out, size_t len) {
    esp_err_t err = i2c_master_write_read_device(port, address, &reg, 1, out, len,
                                                 pdMS_TO_TICKS(Config::Hardware::Motion::io_timeout_ms));
    return err == ESP_OK;
}

bool MotionSensor::init() {
    ready = false;
    if (!ensureBus()) {
        return false;
    }
    uint8_t who = 0;
    if (!readRegisters(MPU_REG_WHO_AM_I, &who, 1)) {
        LOG_WARN(TAG, "No response at 0x%02X", address);
        return false;
    }
    if (who != MPU_WHO_AM_I_VALUE) {
        LOG_WARN(TAG, "Unexpected WHO_AM_I 0x%02X", who);
        return false;
    }
    // Leave sleep mode, internal oscillator
    if (!writeRegister(MPU_REG_PWR_MGMT_1, 0x00) ||
        !writeRegister(MPU_REG_ACCEL_CONFIG, MPU_ACCEL_RANGE_2G)) {
        LOG_ERROR(TAG, "%s", "Configuration write failed");
        return false;
    }
    ready = true;
    LOG_INFO(TAG, "MPU-6050 ready on I2C%d (SDA %d, SCL %d)", static_cast<int>(port),
             static_cast<int>(sda), static_cast<int>(scl));
    return true;
}

bool MotionSensor::readMagnitude(float& out_total_g) {
    if (!ready) {
        return false;
    }
    uint8_t raw[6];
    if (!readRegisters(MPU_REG_ACCEL_XOUT_H, raw, sizeof(raw))) {
        ready = false;  // force re-init on the next attempt
        return false;
    }
    int16_t ax = static_cast<int16_t>((raw[0] << 8) | raw[1]);
    int16_t ay = static_cast<int16_t>((raw[2] << 8) | raw[3]);
    int16_t az = static_cast<int16_t>((raw[4] << 8) | raw[5]);
    // An all-zero frame means the device lost power or reset
    if (ax == 0 && ay == 0 && az == 0) {
        return false;
    }
    float x = static_cast<float>(ax) / MPU_ACCEL_SCALE_2G;
    float y = static_cast<float>(ay) / MPU_ACCEL_SCALE_2G;
    float z = static_cast<float>(az) / MPU_ACCEL_SCALE_2G;
    out_total_g = std::sqrt(x * x + y * y + z * z);
    return true;
}
