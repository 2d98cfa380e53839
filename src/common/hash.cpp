#include "common/hash.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

string sha256_hex(const string &input) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), hash, &length, EVP_sha256(), nullptr) != 1)
        throw internal_error("EVP_Digest(sha256) failed");
    ostringstream oss;
    oss << hex << setfill('0');
    for (unsigned int i = 0; i < length; ++i)
        oss << setw(2) << static_cast<int>(hash[i]);
    return oss.str();
}

}  // namespace sandbox
