#ifndef REGISTER_CODEC_H
#define REGISTER_CODEC_H

#include "charge_controller.hpp"
#include <cstdint>

/**
 * @brief Scales a single unsigned register word.
 * @param raw The register word.
 * @param scale Integer divisor, 0 is treated as 1.
 * @return raw / scale.
 */
double decodeScalar(uint16_t raw, uint32_t scale = 1);

/**
 * @brief Scales a single register word read as a two's complement int16.
 */
double decodeSignedScalar(uint16_t raw, uint32_t scale = 1);

/**
 * @brief Combines a low/high word pair into an unsigned 32-bit value and scales it.
 * @param low Word at the lower address.
 * @param high Word at the higher address.
 * @param scale Integer divisor, 0 is treated as 1.
 * @return ((high << 16) | low) / scale.
 */
double decodeWide(uint16_t low, uint16_t high, uint32_t scale = 1);

/**
 * @brief Same as decodeWide() but reads the 32-bit pattern as int32.
 *
 * Used for the net battery current, which is negative while discharging.
 */
double decodeSignedWide(uint16_t low, uint16_t high, uint32_t scale = 1);

/**
 * @brief Reconstructs the raw bit pattern of a register from its sample.
 * @return The word for single-width registers, (high << 16) | low otherwise.
 */
uint32_t combineWords(const RegisterSpec& spec, const RawSample& sample);

/**
 * @brief Decodes a sample according to its register description.
 *
 * Applies width, signedness and scale. A sample with fewer words than the
 * register needs yields a DecodedValue without a value.
 */
DecodedValue decodeSample(const RegisterSpec& spec, const RawSample& sample);

#endif // REGISTER_CODEC_H
