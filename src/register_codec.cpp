#include "register_codec.hpp"

namespace {

double divisor(uint32_t scale) {
    return scale == 0 ? 1.0 : static_cast<double>(scale);
}

size_t wordsFor(RegisterWidth width) {
    return width == RegisterWidth::DOUBLE ? 2 : 1;
}

} // namespace

double decodeScalar(uint16_t raw, uint32_t scale) {
    return static_cast<double>(raw) / divisor(scale);
}

double decodeSignedScalar(uint16_t raw, uint32_t scale) {
    return static_cast<double>(static_cast<int16_t>(raw)) / divisor(scale);
}

double decodeWide(uint16_t low, uint16_t high, uint32_t scale) {
    uint32_t combined = (static_cast<uint32_t>(high) << 16) | low;
    return static_cast<double>(combined) / divisor(scale);
}

double decodeSignedWide(uint16_t low, uint16_t high, uint32_t scale) {
    uint32_t combined = (static_cast<uint32_t>(high) << 16) | low;
    return static_cast<double>(static_cast<int32_t>(combined)) / divisor(scale);
}

uint32_t combineWords(const RegisterSpec& spec, const RawSample& sample) {
    if (sample.words.empty()) return 0;
    if (spec.width == RegisterWidth::SINGLE || sample.words.size() < 2) {
        return sample.words[0];
    }
    return (static_cast<uint32_t>(sample.words[1]) << 16) | sample.words[0];
}

DecodedValue decodeSample(const RegisterSpec& spec, const RawSample& sample) {
    DecodedValue decoded{spec.name, std::nullopt, 0, spec.unit, spec.path};
    if (sample.words.size() < wordsFor(spec.width)) {
        return decoded;
    }

    decoded.raw = combineWords(spec, sample);
    if (spec.width == RegisterWidth::DOUBLE) {
        uint16_t low = sample.words[0];
        uint16_t high = sample.words[1];
        decoded.value = spec.is_signed ? decodeSignedWide(low, high, spec.scale)
                                       : decodeWide(low, high, spec.scale);
    } else {
        decoded.value = spec.is_signed ? decodeSignedScalar(sample.words[0], spec.scale)
                                       : decodeScalar(sample.words[0], spec.scale);
    }
    return decoded;
}
