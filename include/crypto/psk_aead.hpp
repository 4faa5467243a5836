#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aead
{

constexpr std::size_t KEY_SIZE   = 32;  // crypto_aead_xchacha20poly1305_ietf_KEYBYTES
constexpr std::size_t NONCE_SIZE = 24;  // crypto_aead_xchacha20poly1305_ietf_NPUBBYTES
constexpr std::size_t TAG_SIZE   = 16;  // crypto_aead_xchacha20poly1305_ietf_ABYTES

using Key = std::array<std::uint8_t, KEY_SIZE>;

// Envelope for one whole frame. Output format is [NONCE][CIPHERTEXT][TAG].
class PskAead
{
  public:
    virtual ~PskAead() = default;

    virtual bool seal(const std::vector<std::uint8_t> &plaintext,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) = 0;

    // Fails on any tampering; `out` is only meaningful when true is returned
    virtual bool open(const std::vector<std::uint8_t> &in,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) = 0;
};

// libsodium-based implementation
class SodiumPskAead : public PskAead
{
  public:
    explicit SodiumPskAead(const Key &key);
    SodiumPskAead(const SodiumPskAead &other);
    SodiumPskAead &operator=(const SodiumPskAead &other);
    ~SodiumPskAead() override;

    bool seal(const std::vector<std::uint8_t> &plaintext,
              const std::uint8_t              *aad,
              std::size_t                      aad_len,
              std::vector<std::uint8_t>       &out) override;

    bool open(const std::vector<std::uint8_t> &in,
              const std::uint8_t              *aad,
              std::size_t                      aad_len,
              std::vector<std::uint8_t>       &out) override;

  private:
    Key key_{};
};

// libsodium must be initialised before any other call; safe to call repeatedly
bool ensure_sodium_init();

// Key text is 64 hex chars or base64 (standard or URL-safe) of 32 bytes.
std::optional<Key> parse_key(std::string_view text);
std::optional<Key> load_key_file(const std::string &path);

Key         generate_key();
std::string key_to_hex(const Key &key);
// Written with mode 0600; refuses to overwrite an existing file
bool        save_key_file(const std::string &path, const Key &key);

}  // namespace aead
