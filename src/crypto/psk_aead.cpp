#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sodium.h>
#include <sstream>
#include <unistd.h>

#include "crypto/psk_aead.hpp"
#include "util/log.hpp"

namespace aead
{

static_assert(aead::KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES, "key size mismatch");
static_assert(aead::NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES,
              "nonce size mismatch");
static_assert(aead::TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size mismatch");

bool ensure_sodium_init()
{
    static bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

SodiumPskAead::SodiumPskAead(const Key &key) : key_(key)
{
    ensure_sodium_init();
}

SodiumPskAead::SodiumPskAead(const SodiumPskAead &other) : key_(other.key_) {}

SodiumPskAead &SodiumPskAead::operator=(const SodiumPskAead &other)
{
    key_ = other.key_;
    return *this;
}

SodiumPskAead::~SodiumPskAead()
{
    sodium_memzero(key_.data(), key_.size());
}

bool SodiumPskAead::seal(const std::vector<std::uint8_t> &msg,
                         const std::uint8_t              *ad,
                         std::size_t                      adlen,
                         std::vector<std::uint8_t>       &out)
{
    if (!ensure_sodium_init())
        return false;

    // output format = [NONCE | c] (c = mlen + TAG_SIZE)
    const std::size_t mlen = msg.size();
    out.resize(NONCE_SIZE + mlen + TAG_SIZE);

    unsigned char     *npub = out.data();               // [0...NONCE_SIZE)
    unsigned char     *c    = out.data() + NONCE_SIZE;  // [NONCE_SIZE...)
    unsigned long long clen = 0;

    randombytes_buf(npub, NONCE_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        c, &clen, msg.data(), mlen, ad, adlen, /*nsec=*/nullptr, npub, key_.data());
    if (rc != 0)
    {
        out.clear();
        return false;
    }
    out.resize(NONCE_SIZE + static_cast<std::size_t>(clen));
    return true;
}

bool SodiumPskAead::open(const std::vector<std::uint8_t> &in,
                         const std::uint8_t              *ad,
                         std::size_t                      adlen,
                         std::vector<std::uint8_t>       &out)
{
    if (!ensure_sodium_init())
        return false;
    // [npub (NONCE_SIZE)] [c (ciphertext || tag)]
    if (in.size() < NONCE_SIZE + TAG_SIZE)
        return false;

    const unsigned char     *npub = in.data();
    const unsigned char     *c    = in.data() + NONCE_SIZE;
    const unsigned long long clen = in.size() - NONCE_SIZE;
    unsigned long long       mlen = 0;

    std::vector<std::uint8_t> plain(clen - TAG_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(), &mlen, /*nsec=*/nullptr, c, clen, ad, adlen, npub, key_.data());
    if (rc != 0)
    {
        sodium_memzero(plain.data(), plain.size());
        return false;
    }
    plain.resize(static_cast<std::size_t>(mlen));
    out = std::move(plain);
    return true;
}

static std::string_view trim(std::string_view s)
{
    const auto whitespace = " \t\r\n";
    const auto start      = s.find_first_not_of(whitespace);
    if (start == std::string_view::npos)
        return {};
    const auto end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

std::optional<Key> parse_key(std::string_view text)
{
    if (!ensure_sodium_init())
        return std::nullopt;

    const std::string s(trim(text));
    if (s.empty())
        return std::nullopt;

    Key         key{};
    std::size_t out_len = 0;
    if (s.size() == KEY_SIZE * 2 &&
        sodium_hex2bin(key.data(), key.size(), s.c_str(), s.size(), nullptr, &out_len,
                       nullptr) == 0 &&
        out_len == key.size())
    {
        return key;
    }

    // base64: try both alphabets, with and without padding
    const int variants[] = {sodium_base64_VARIANT_ORIGINAL, sodium_base64_VARIANT_URLSAFE,
                            sodium_base64_VARIANT_ORIGINAL_NO_PADDING,
                            sodium_base64_VARIANT_URLSAFE_NO_PADDING};
    for (int v : variants)
    {
        out_len = 0;
        if (sodium_base642bin(key.data(), key.size(), s.c_str(), s.size(), nullptr, &out_len,
                              nullptr, v) == 0 &&
            out_len == key.size())
        {
            return key;
        }
    }
    sodium_memzero(key.data(), key.size());
    return std::nullopt;
}

std::optional<Key> load_key_file(const std::string &path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        LOG_ERROR("key file not found or unreadable: %s", path.c_str());
        LOG_ERROR("generate one with: framecast-keygen %s", path.c_str());
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    std::string text = ss.str();

    auto key = parse_key(text);
    sodium_memzero(text.data(), text.size());
    if (!key)
    {
        LOG_ERROR("key file %s does not hold a %zu-byte key (hex or base64)", path.c_str(),
                  KEY_SIZE);
        return std::nullopt;
    }
    return key;
}

Key generate_key()
{
    ensure_sodium_init();
    Key key{};
    crypto_aead_xchacha20poly1305_ietf_keygen(key.data());
    return key;
}

std::string key_to_hex(const Key &key)
{
    char hex[KEY_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), key.data(), key.size());
    std::string out(hex);
    sodium_memzero(hex, sizeof(hex));
    return out;
}

bool save_key_file(const std::string &path, const Key &key)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd == -1)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    std::string text = key_to_hex(key);
    text.push_back('\n');

    const char *buf     = text.data();
    std::size_t len     = text.size();
    std::size_t written = 0;
    bool        ok      = true;
    while (written < len)
    {
        ssize_t n = ::write(fd, buf + written, len - written);
        if (n > 0)
        {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("write(%s) failed: %s", path.c_str(), std::strerror(errno));
        ok = false;
        break;
    }
    sodium_memzero(text.data(), text.size());
    if (::close(fd) == -1 && ok)
    {
        LOG_ERROR("close(%s) failed: %s", path.c_str(), std::strerror(errno));
        ok = false;
    }
    if (!ok)
        ::unlink(path.c_str());
    return ok;
}

}  // namespace aead
