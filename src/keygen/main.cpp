#include <cstdio>
#include <string>

#include "crypto/psk_aead.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

int main(int argc, char **argv)
{
    framecast::init_log_level_from_env();

    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" ||
                                   std::string(argv[1]) == "--help")))
    {
        std::fprintf(stderr, "Usage:\n  framecast-keygen [path]   (default %s)\n",
                     std::string(constants::DEFAULT_KEY_PATH).c_str());
        return argc > 2 ? exitc::bad_args : exitc::ok;
    }
    const std::string path = argc == 2 ? argv[1] : std::string(constants::DEFAULT_KEY_PATH);

    if (!aead::ensure_sodium_init())
    {
        LOG_ERROR("libsodium init failed");
        return exitc::key_error;
    }
    const aead::Key key = aead::generate_key();
    if (!aead::save_key_file(path, key))
        return exitc::key_error;

    std::printf("Key saved to %s. Share this file securely with the receiver.\n", path.c_str());
    return exitc::ok;
}
