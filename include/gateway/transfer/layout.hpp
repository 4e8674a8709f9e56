#pragma once

#include <cstddef>
#include <cstdint>

// Byte layouts of the wire payloads. All integers are big-endian, all
// addresses are 32-byte left-padded words.
namespace gateway::transfer::layout {

inline constexpr uint32_t kTransferSpecMagic = 0xca85def7;
inline constexpr uint32_t kBurnIntentMagic = 0x070afbc2;
inline constexpr uint32_t kAttestationMagic = 0xff6fb334;
inline constexpr uint32_t kBurnIntentSetMagic = 0x1e8c6e48;
inline constexpr uint32_t kAttestationSetMagic = 0x1e12db71;

inline constexpr uint32_t kTransferSpecVersion = 1;
inline constexpr uint32_t kBurnIntentVersion = 1;
inline constexpr uint32_t kAttestationVersion = 1;
inline constexpr uint32_t kBurnIntentSetVersion = 1;
inline constexpr uint32_t kAttestationSetVersion = 1;

inline constexpr std::size_t kMagicSize = 4;
inline constexpr std::size_t kWordSize = 32;

namespace transfer_spec {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kVersion = 4;
inline constexpr std::size_t kSourceDomain = 8;
inline constexpr std::size_t kDestinationDomain = 12;
inline constexpr std::size_t kSourceContract = 16;
inline constexpr std::size_t kDestinationContract = 48;
inline constexpr std::size_t kSourceToken = 80;
inline constexpr std::size_t kDestinationToken = 112;
inline constexpr std::size_t kSourceDepositor = 144;
inline constexpr std::size_t kDestinationRecipient = 176;
inline constexpr std::size_t kSourceSigner = 208;
inline constexpr std::size_t kDestinationCaller = 240;
inline constexpr std::size_t kValue = 272;
inline constexpr std::size_t kSalt = 304;
inline constexpr std::size_t kHookDataLength = 336;
inline constexpr std::size_t kHookData = 340;
inline constexpr std::size_t kHeaderLength = kHookData;
}  // namespace transfer_spec

namespace burn_intent {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kVersion = 4;
inline constexpr std::size_t kMaxBlockHeight = 8;
inline constexpr std::size_t kMaxFee = 40;
inline constexpr std::size_t kTransferSpecLength = 72;
inline constexpr std::size_t kTransferSpec = 76;
inline constexpr std::size_t kHeaderLength = kTransferSpec;
}  // namespace burn_intent

namespace attestation {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kVersion = 4;
inline constexpr std::size_t kTransferSpecLength = 8;
inline constexpr std::size_t kTransferSpec = 12;
inline constexpr std::size_t kHeaderLength = kTransferSpec;
}  // namespace attestation

namespace payload_set {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kVersion = 4;
inline constexpr std::size_t kNumElements = 8;
inline constexpr std::size_t kElements = 12;
inline constexpr std::size_t kHeaderLength = kElements;
}  // namespace payload_set

inline constexpr uint64_t kMaxLength32 = 0xffffffffULL;

}  // namespace gateway::transfer::layout
