#ifndef MODBUS_TRANSPORT_H
#define MODBUS_TRANSPORT_H

#include "charge_controller.hpp"
#include "register_transport.hpp"
#include <modbus/modbus.h>

/**
 * @class ModbusRtuTransport
 * @brief Reads controller registers over a Modbus RTU serial link.
 *
 * This class uses libmodbus to open the serial port and issue FC01-FC04
 * requests. It is the exclusive owner of the serial handle.
 */
class ModbusRtuTransport : public RegisterTransport {
public:
    /**
     * @brief Constructor for the ModbusRtuTransport.
     * @param params Serial port, framing, slave id and response timeout.
     */
    explicit ModbusRtuTransport(const SerialParams& params);

    /**
     * @brief Destructor, ensures the port is closed.
     */
    ~ModbusRtuTransport() override;

    ModbusRtuTransport(const ModbusRtuTransport&) = delete;
    ModbusRtuTransport& operator=(const ModbusRtuTransport&) = delete;

    /**
     * @brief Creates the RTU context and connects to the serial port.
     * @return True on success, false on failure.
     */
    bool open();

    /**
     * @brief Closes the serial port and frees the context.
     */
    void close();

    std::vector<uint16_t> read(RegisterClass register_class, uint16_t start, uint16_t count) override;

private:
    SerialParams params;
    modbus_t *ctx;
};

#endif // MODBUS_TRANSPORT_H
