/*
 * string_encoding.hpp
 *
 * encrypt string literals so they don't appear in plaintext in the binary.
 * each literal (plus its terminator) is XORed with its own key stream
 * (key + i * step) & 0xff and stored as a byte array; at run time the
 * synthesized helper
 *
 *   char *__cloak_decrypt(char *dst, const unsigned char *src, int len,
 *                         int key, int step)
 *
 * decrypts it into a buffer and returns the buffer. where the buffer lives:
 *   - literal passed straight to a call whose callee keeps no copy of the
 *     pointer: stack array of the caller
 *   - any other literal in a function body: static array
 *   - char a[N] = "...": a is zero-filled and decrypted in place
 *   - literal in a global or static initializer: static array decrypted by
 *     the startup constructor __cloak_init_strings
 * sizeof operands keep their literal.
 */

#ifndef CLOAK_STRING_ENCODING_HPP
#define CLOAK_STRING_ENCODING_HPP

#include "data_base.hpp"
#include "../../core/transformation_base.hpp"

#include <string>
#include <vector>

namespace cloak {
namespace data {

class StringCipher {
public:
    /**
     * Encrypts the bytes of plain followed by a NUL terminator
     */
    static EncryptedString encrypt(const std::string& plain, uint8_t key, uint8_t step);

    /**
     * Draws key and step from the compilation's RNG
     */
    static EncryptedString encrypt(const std::string& plain, Random& rng);

    /**
     * Inverse of encrypt; the result keeps the terminator
     */
    static std::string decrypt(const std::vector<uint8_t>& bytes, uint8_t key, uint8_t step);
};

class StringEncryptionPass : public TransformationPass {
public:
    explicit StringEncryptionPass(StringEncryptionConfig config = {});

    std::string getName() const override { return "string_encryption"; }
    std::string getDescription() const override {
        return "Stores string literals encrypted and decrypts them at run time";
    }
    PassPriority getPriority() const override { return PassPriority::StringEncryption; }

    ast::Program run(const ast::Program& program, CompileContext& ctx) override;

    /**
     * The decrypt helper as a function definition
     */
    ast::Function makeDecryptHelper() const;

private:
    struct Unit;

    StringEncryptionConfig enc_config_;
    Logger logger_;

    std::string emitData(const std::string& text, Unit& unit, EncryptedString& out);
    std::string emitBuffer(const char* prefix, size_t len, Unit& unit);
    ast::Expr decryptCall(ast::Expr dst, const std::string& data, const EncryptedString& enc,
                          size_t len) const;

    bool borrowsArgument(const ast::Expr& call, size_t index, Unit& unit) const;

    void rewriteBlock(ast::Block& block, Unit& unit);
    void rewriteExpr(ast::Expr& e, bool call_argument, Unit& unit);
    void rewriteConstant(ast::Expr& e, Unit& unit);
    void rewriteGlobal(ast::VarDecl& v, Unit& unit);
    bool rewriteCharArray(ast::VarDecl& v, Unit& unit, ast::Block& after);
};

} // namespace data
} // namespace cloak

#endif // CLOAK_STRING_ENCODING_HPP
