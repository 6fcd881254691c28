#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace multitest::contracts::constants {

// Defaults used by the mock environment
const std::string mock_contract_addr   = "cosmos2contract";
const std::string mock_chain_id        = "cosmos-testnet-14002";
const std::string mock_sender          = "sender";
const std::string bonded_denom         = "ustake";

constexpr uint64_t mock_block_height   = 12345;
constexpr uint64_t mock_block_time     = 1571797419879305533;   // nanoseconds since epoch
constexpr uint32_t mock_tx_index       = 3;

constexpr std::size_t min_address_length = 3;
constexpr std::size_t max_address_length = 64;

} // multitest::contracts::constants
