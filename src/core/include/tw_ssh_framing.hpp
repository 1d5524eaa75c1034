#ifndef TW_SSH_FRAMING_HPP
#define TW_SSH_FRAMING_HPP

/**
 * @file tw_ssh_framing.hpp
 * @brief SSH binary packet length arithmetic (RFC 4253 section 6)
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace tw {
namespace ssh {

/// Cipher block size used when the cipher name is not in the table.
constexpr size_t kDefaultBlockSize = 16;
/// MAC size used when the MAC name is not in the table, and for AEAD ciphers.
constexpr size_t kDefaultMacSize = 16;
/// msg type + recipient channel + data length + one byte of framing slack.
constexpr size_t kChannelDataOverhead = 10;
/// uint32 packet_length field.
constexpr size_t kPacketLengthField = 4;
/// RFC 4253 minimum random padding.
constexpr size_t kMinPadding = 4;
/// A single typed character.
constexpr size_t kKeystrokePayload = 1;

/**
 * @brief Negotiated algorithms reduced to the numbers the framing needs
 *
 * Built once per connection, so no name matching happens per packet.
 */
struct AlgorithmProfile {
    size_t block_size = kDefaultBlockSize;
    size_t mac_size = kDefaultMacSize;
    bool aead = false;           // poly1305 or GCM cipher, MAC size forced
    bool etm = false;            // packet length outside the encrypted region
    bool known_cipher = false;   // false when block_size is the fallback
    bool known_mac = false;      // false when mac_size is the fallback
};

/**
 * @brief Block size for a cipher name, kDefaultBlockSize when unknown
 */
size_t cipher_block_size(const std::string& cipher);

/**
 * @brief Output size for a MAC name, kDefaultMacSize when unknown
 */
size_t mac_output_size(const std::string& mac);

bool is_aead_cipher(const std::string& cipher);
bool is_etm_mac(const std::string& mac);

/**
 * @brief Resolve cipher and MAC names into a profile
 *
 * ETM is derived from the MAC name. Unknown names fall back to the
 * defaults; the known_* flags record whether that happened.
 */
AlgorithmProfile resolve_profile(const std::string& cipher, const std::string& mac);

/**
 * @brief Same as above with an explicit ETM flag
 */
AlgorithmProfile resolve_profile(const std::string& cipher, const std::string& mac, bool etm);

/**
 * @brief On-wire length of a channel-data packet carrying payload_size bytes
 */
size_t frame_length(size_t payload_size, const AlgorithmProfile& profile);

size_t frame_length(size_t payload_size, const std::string& cipher,
                    const std::string& mac, bool etm);

/**
 * @brief Outer packet length of one keystroke echoed through a nested session
 *
 * The inner session frames a one-byte payload; that whole inner packet is
 * then the payload of a packet on the outer connection. Both framings use
 * the outer connection's algorithms.
 */
size_t tunneled_keystroke_length(const AlgorithmProfile& profile);

} // namespace ssh
} // namespace tw

#endif // TW_SSH_FRAMING_HPP
