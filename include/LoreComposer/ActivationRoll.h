#pragma once

#include "LoreComposer/LoreBook.h"

#include <cstdint>

namespace LoreComposer
{
	// Seeding contract for probability draws:
	// each entry gets exactly one draw per call, derived only from (caller seed, entry id).
	// The draw does not depend on scan order, pass number or which other entries exist, so
	// identical seeded calls reproduce exactly and an entry that fails its draw stays
	// inactive for the remaining recursive passes of that call.

	[[nodiscard]] constexpr std::uint64_t MixActivationHash64(std::uint64_t a_value) noexcept
	{
		a_value ^= a_value >> 30;
		a_value *= 0xBF58476D1CE4E5B9ull;
		a_value ^= a_value >> 27;
		a_value *= 0x94D049BB133111EBull;
		a_value ^= a_value >> 31;
		return a_value;
	}

	[[nodiscard]] constexpr std::uint64_t HashActivationDrawKey(std::uint64_t a_seed, std::int64_t a_entryId) noexcept
	{
		const std::uint64_t left = MixActivationHash64(a_seed);
		const std::uint64_t right = MixActivationHash64(static_cast<std::uint64_t>(a_entryId));
		return MixActivationHash64(left ^ (right + 0x9E3779B97F4A7C15ull + (left << 6) + (left >> 2)));
	}

	// Uniform draw in [0, 100).
	[[nodiscard]] constexpr std::uint32_t ResolveActivationDraw(std::uint64_t a_seed, std::int64_t a_entryId) noexcept
	{
		return static_cast<std::uint32_t>(HashActivationDrawKey(a_seed, a_entryId) % 100u);
	}

	[[nodiscard]] constexpr bool RollActivationChance(
		std::uint64_t a_seed,
		std::int64_t a_entryId,
		std::int32_t a_probability) noexcept
	{
		if (a_probability >= kMaxProbability) {
			return true;
		}
		if (a_probability <= 0) {
			return false;
		}
		return ResolveActivationDraw(a_seed, a_entryId) < static_cast<std::uint32_t>(a_probability);
	}
}
