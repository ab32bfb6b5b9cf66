#include "modbus_transport.hpp"
#include <cerrno>
#include <iostream>
#include <sstream>

ModbusRtuTransport::ModbusRtuTransport(const SerialParams& p)
    : params(p), ctx(nullptr) {}

ModbusRtuTransport::~ModbusRtuTransport() {
    close();
}

bool ModbusRtuTransport::open() {
    if (ctx) return true;

    ctx = modbus_new_rtu(params.port.c_str(), params.baud_rate, params.parity, params.data_bits, params.stop_bits);
    if (ctx == nullptr) {
        std::cerr << "[transport] Failed to create modbus context for " << params.port << ": "
                  << modbus_strerror(errno) << std::endl;
        return false;
    }

    if (modbus_set_slave(ctx, params.slave_id) == -1) {
        std::cerr << "[transport] Invalid slave id " << params.slave_id << ": " << modbus_strerror(errno) << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    uint32_t timeout_sec = static_cast<uint32_t>(params.response_timeout_ms / 1000);
    uint32_t timeout_usec = static_cast<uint32_t>((params.response_timeout_ms % 1000) * 1000);
    modbus_set_response_timeout(ctx, timeout_sec, timeout_usec);

    if (modbus_connect(ctx) == -1) {
        std::cerr << "[transport] Unable to open serial port " << params.port << ": " << modbus_strerror(errno)
                  << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    std::cout << "[transport] Connected to " << params.port << " at " << params.baud_rate << " baud, slave "
              << params.slave_id << std::endl;
    return true;
}

void ModbusRtuTransport::close() {
    if (ctx) {
        modbus_close(ctx);
        modbus_free(ctx);
        ctx = nullptr;
    }
}

std::vector<uint16_t> ModbusRtuTransport::read(RegisterClass register_class, uint16_t start, uint16_t count) {
    if (!ctx) {
        throw TransportError("serial port " + params.port + " is not open");
    }

    // Drop stale bytes left by a previous timed out transaction
    if (modbus_flush(ctx) == -1) {
        std::cerr << "[transport] Flush failed: " << modbus_strerror(errno) << std::endl;
    }

    std::vector<uint16_t> words(count, 0);
    int rc = -1;
    switch (register_class) {
        case RegisterClass::INPUT:
            rc = modbus_read_input_registers(ctx, start, count, words.data());
            break;
        case RegisterClass::HOLDING:
            rc = modbus_read_registers(ctx, start, count, words.data());
            break;
        case RegisterClass::COIL:
        case RegisterClass::DISCRETE: {
            std::vector<uint8_t> bits(count, 0);
            rc = register_class == RegisterClass::COIL ? modbus_read_bits(ctx, start, count, bits.data())
                                                       : modbus_read_input_bits(ctx, start, count, bits.data());
            for (size_t i = 0; i < bits.size(); ++i) {
                words[i] = bits[i] ? 1 : 0;
            }
            break;
        }
    }

    if (rc == -1) {
        std::ostringstream reason;
        reason << "read of " << count << " registers at 0x" << std::hex << start << " failed: " << modbus_strerror(errno);
        throw TransportError(reason.str());
    }
    if (rc != count) {
        std::ostringstream reason;
        reason << "short read at 0x" << std::hex << start << std::dec << ": expected " << count << ", got " << rc;
        throw TransportError(reason.str());
    }
    return words;
}
