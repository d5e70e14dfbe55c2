#pragma once
#include <cstdint>
#include <string>

using Address   = std::string;
using Amount    = std::uint64_t;
using AssetId   = std::uint64_t;
using OrderId   = std::uint64_t;
using LobbyId   = std::uint64_t;
using Timestamp = std::int64_t; // seconds since epoch

// Fee rates are integer basis points: 10000 == 100%.
constexpr Amount kBasisPointsDenominator = 10000;
