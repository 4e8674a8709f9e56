#pragma once

#include <gateway/schema/error.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/detail/bytes.hpp>
#include <gateway/transfer/transfer_spec.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace gateway::transfer::detail {

inline void check_magic(const gateway::schema::bytes_view_t& data,
                        const uint32_t expected) {
  auto magic = peek_magic(data);
  if (magic != expected) {
    throw gateway::schema::error{
        gateway::schema::error_code::invalid_magic,
        {gateway::schema::make_detail("expected",
                                      fmt::format("0x{:08x}", expected)),
         gateway::schema::make_detail("actual",
                                      fmt::format("0x{:08x}", magic))}};
  }
}

inline void check_header(const gateway::schema::bytes_view_t& data,
                         const std::size_t header_length,
                         const uint32_t supported_version) {
  if (data.size() < header_length) {
    throw gateway::schema::error{
        gateway::schema::error_code::header_too_short,
        {gateway::schema::make_detail("length", std::to_string(data.size())),
         gateway::schema::make_detail("required",
                                      std::to_string(header_length))}};
  }
  auto version = read_u32(data, 4);
  if (version != supported_version) {
    throw gateway::schema::error{
        gateway::schema::error_code::invalid_version,
        {gateway::schema::make_detail("version", std::to_string(version))}};
  }
}

/// Shared wrapper validation once the header is known good: cast the
/// embedded spec over the rest of the buffer, validate it, then tie both the
/// declared and the overall length to the embedded TransferSpec length.
inline void check_embedded_spec(const gateway::schema::bytes_view_t& data,
                                const std::size_t header_length,
                                const std::size_t spec_length_offset) {
  auto spec = transfer_spec_view::cast(data.subspan(header_length));
  auto spec_length = spec.validate_prefix();
  auto declared = read_u32(data, spec_length_offset);
  if (declared != spec_length || data.size() != header_length + spec_length) {
    throw gateway::schema::error{
        gateway::schema::error_code::transfer_payload_overall_length_mismatch,
        {gateway::schema::make_detail("declared", std::to_string(declared)),
         gateway::schema::make_detail("spec_length",
                                      std::to_string(spec_length)),
         gateway::schema::make_detail("length", std::to_string(data.size()))}};
  }
}

}  // namespace gateway::transfer::detail
