#ifndef REGISTER_TRANSPORT_H
#define REGISTER_TRANSPORT_H

#include "charge_controller.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class TransportError
 * @brief Raised when a register range cannot be read from the controller.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& reason) : std::runtime_error(reason) {}
};

/**
 * @class RegisterTransport
 * @brief Capability to read a range of registers from the charge controller.
 *
 * Implementations own the link to the device. Bits (coils, discrete inputs)
 * are returned one per word, 0 or 1.
 */
class RegisterTransport {
public:
    virtual ~RegisterTransport() = default;

    /**
     * @brief Reads a contiguous range of registers.
     * @param register_class Modbus object class to read from.
     * @param start First address of the range.
     * @param count Number of registers.
     * @return Exactly count words, in address order.
     * @throw TransportError if the link fails or the device rejects the request.
     */
    virtual std::vector<uint16_t> read(RegisterClass register_class, uint16_t start, uint16_t count) = 0;
};

#endif // REGISTER_TRANSPORT_H
