#ifndef SLICER_BYTE_ORDER_HPP
#define SLICER_BYTE_ORDER_HPP

#include <cstdint>
#include <array>
#include <algorithm>
#include <cstring>

namespace slicer::crypto {
class ByteOrder {
public:
    // Detects if system is little endian
    static bool isLittleEndian() {
        static const uint16_t value = 0x0001;
        return *reinterpret_cast<const uint8_t*>(&value) == 0x01;
    }

    // Converts host byte order to big endian, the order used inside slice archives
    template<typename T>
    static T toBigEndian(T value) {
        if (isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    // Converts big endian back to host byte order
    template<typename T>
    static T fromBigEndian(T value) {
        if (isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    // Writes value to buf in big endian order, returns the number of bytes written
    template<typename T>
    static std::size_t putBigEndian(uint8_t* buf, T value) {
        T converted = toBigEndian(value);
        std::memcpy(buf, &converted, sizeof(T));
        return sizeof(T);
    }

private:
    // Generic byte swap implementation that works for any size T
    template<typename T>
    static T byteSwap(T value) {
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &value, sizeof(T));
        std::reverse(bytes.begin(), bytes.end());
        T result;
        std::memcpy(&result, bytes.data(), sizeof(T));
        return result;
    }
};

} // namespace slicer::crypto

#endif // SLICER_BYTE_ORDER_HPP
