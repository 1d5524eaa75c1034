#include "../include/tw_ssh_framing.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace tw {
namespace ssh {

namespace {

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Only ciphers that differ from the 16-byte default are listed.
const std::unordered_map<std::string, size_t>& cipher_table() {
    static const std::unordered_map<std::string, size_t> table = {
        {"chacha20-poly1305@openssh.com", 8},
    };
    return table;
}

const std::unordered_map<std::string, size_t>& mac_table() {
    static const std::unordered_map<std::string, size_t> table = {
        {"hmac-md5", 16},
        {"hmac-md5-96", 12},
        {"hmac-ripemd160", 20},
        {"hmac-ripemd160@openssh.com", 20},
        {"hmac-sha1", 20},
        {"hmac-sha1-96", 12},
        {"hmac-sha2-256", 32},
        {"hmac-sha2-512", 64},
        {"umac-64@openssh.com", 8},
        {"umac-128@openssh.com", 16},
        {"hmac-md5-etm@openssh.com", 16},
        {"hmac-md5-96-etm@openssh.com", 12},
        {"hmac-ripemd160-etm@openssh.com", 20},
        {"hmac-sha1-etm@openssh.com", 20},
        {"hmac-sha1-96-etm@openssh.com", 12},
        {"hmac-sha2-256-etm@openssh.com", 32},
        {"hmac-sha2-512-etm@openssh.com", 64},
        {"umac-64-etm@openssh.com", 8},
        {"umac-128-etm@openssh.com", 16},
    };
    return table;
}

} // namespace

size_t cipher_block_size(const std::string& cipher) {
    const auto& table = cipher_table();
    auto it = table.find(to_lower_copy(cipher));
    return it != table.end() ? it->second : kDefaultBlockSize;
}

size_t mac_output_size(const std::string& mac) {
    const auto& table = mac_table();
    auto it = table.find(to_lower_copy(mac));
    return it != table.end() ? it->second : kDefaultMacSize;
}

bool is_aead_cipher(const std::string& cipher) {
    std::string name = to_lower_copy(cipher);
    return name.find("poly1305") != std::string::npos ||
           name.find("gcm") != std::string::npos;
}

bool is_etm_mac(const std::string& mac) {
    return to_lower_copy(mac).find("etm") != std::string::npos;
}

AlgorithmProfile resolve_profile(const std::string& cipher, const std::string& mac) {
    return resolve_profile(cipher, mac, is_etm_mac(mac));
}

AlgorithmProfile resolve_profile(const std::string& cipher, const std::string& mac, bool etm) {
    AlgorithmProfile profile;
    std::string cipher_name = to_lower_copy(cipher);
    std::string mac_name = to_lower_copy(mac);

    auto cit = cipher_table().find(cipher_name);
    if (cit != cipher_table().end()) {
        profile.block_size = cit->second;
        profile.known_cipher = true;
    }

    auto mit = mac_table().find(mac_name);
    if (mit != mac_table().end()) {
        profile.mac_size = mit->second;
        profile.known_mac = true;
    }

    // AEAD ciphers carry their own tag; the negotiated MAC is not used.
    profile.aead = is_aead_cipher(cipher_name);
    if (profile.aead) {
        profile.mac_size = kDefaultMacSize;
    }

    profile.etm = etm;
    return profile;
}

size_t frame_length(size_t payload_size, const AlgorithmProfile& profile) {
    size_t block = profile.block_size > 0 ? profile.block_size : kDefaultBlockSize;

    size_t p = payload_size + kChannelDataOverhead;
    if (!profile.etm) {
        // packet_length is encrypted along with the payload
        p += kPacketLengthField;
    }

    size_t num_blocks = std::max<size_t>(1, (p + block - 1) / block);
    if (num_blocks * block - p < kMinPadding) {
        ++num_blocks;
    }

    size_t padded = num_blocks * block;
    if (profile.etm) {
        padded += kPacketLengthField;
    }
    return padded + profile.mac_size;
}

size_t frame_length(size_t payload_size, const std::string& cipher,
                    const std::string& mac, bool etm) {
    return frame_length(payload_size, resolve_profile(cipher, mac, etm));
}

size_t tunneled_keystroke_length(const AlgorithmProfile& profile) {
    size_t inner = frame_length(kKeystrokePayload, profile);
    return frame_length(inner, profile);
}

} // namespace ssh
} // namespace tw
