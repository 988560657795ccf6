/**
 * Cloak - Obfuscating C Compiler
 *
 * data_base.hpp - Base definitions for data obfuscation passes
 *
 * Data obfuscation hides string literals: each literal is stored as a
 * byte array XORed with a key stream and decrypted at run time.
 */

#ifndef CLOAK_DATA_BASE_HPP
#define CLOAK_DATA_BASE_HPP

#include "../../core/transformation_base.hpp"
#include "../../common/random.hpp"
#include "../../common/logging.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cloak {
namespace data {

/**
 * Configuration for string encryption
 */
struct StringEncryptionConfig {
    bool enabled = true;
    std::string decrypt_function = "__cloak_decrypt";
    std::string init_function = "__cloak_init_strings";

    // a literal passed straight to a call decrypts into a stack buffer of
    // the caller, unless the callee returns a pointer that might alias it
    bool stack_buffers_for_arguments = true;
};

/**
 * Encrypted string result
 */
struct EncryptedString {
    std::string original;               // literal bytes, without the terminator
    std::vector<uint8_t> bytes;         // encrypted literal plus terminator
    uint8_t key = 0;
    uint8_t step = 0;

    size_t length() const { return bytes.size(); }

    /**
     * Generate C array initializer
     */
    std::string toCArrayInit() const {
        std::string result = "{";
        for (size_t i = 0; i < bytes.size(); i++) {
            if (i > 0) result += ", ";
            result += std::to_string(bytes[i]);
        }
        result += "}";
        return result;
    }
};

/**
 * Byte i of the key stream
 */
inline uint8_t keyStreamByte(uint8_t key, uint8_t step, size_t i) {
    return static_cast<uint8_t>((key + i * step) & 0xFF);
}

} // namespace data
} // namespace cloak

#endif // CLOAK_DATA_BASE_HPP
